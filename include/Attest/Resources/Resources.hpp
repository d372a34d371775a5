// Resources.hpp
// Built-in resource providers
#pragma once

#include <Attest/Export.hpp>
#include <Attest/Resources/File.hpp>
#include <Attest/Resources/Package.hpp>
#include <Attest/Resources/PipPackage.hpp>
#include <Attest/Resources/Service.hpp>
#include <Attest/Resources/Socket.hpp>
#include <Attest/Resources/SystemInfo.hpp>
#include <Attest/Resources/User.hpp>

namespace Attest
{

  inline constexpr std::string_view kBuiltinModuleName = "Attest.Builtin";

  // Registers package, pip_package, service, file, socket, user, group and
  // system_info, in that order. Safe to call more than once.
  ATTEST_API bool RegisterBuiltinResources();

} // namespace Attest

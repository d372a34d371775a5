// Attest.hpp
// Umbrella header for the Attest library
#pragma once

#include <string_view>

#include <Attest/Export.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>
#include <Attest/Log.hpp>
#include <Attest/Backend.hpp>
#include <Attest/Registry.hpp>
#include <Attest/ResourceBuilder.hpp>
#include <Attest/ModuleInit.hpp>
#include <Attest/Comparators.hpp>
#include <Attest/Expectation.hpp>
#include <Attest/Members.hpp>
#include <Attest/Binding.hpp>
#include <Attest/Resolver.hpp>
#include <Attest/Dispatcher.hpp>
#include <Attest/EntryPoints.hpp>
#include <Attest/Config.hpp>
#include <Attest/Resources/Resources.hpp>

namespace Attest
{

  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Attest"; }

} // namespace Attest

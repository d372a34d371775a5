// Resolver.hpp
// Maps an entry-point name and a backend onto a registered resource type
#pragma once

#include <string_view>

#include <Attest/Backend.hpp>
#include <Attest/Export.hpp>
#include <Attest/Registry.hpp>
#include <Attest/Types.hpp>

namespace Attest
{

  /**
   * "pip_package" resolves to the provider registered as "PipPackage".
   * UnsupportedResource when no provider has that name or the provider
   * declares itself unavailable on `backend`.
   */
  [[nodiscard]] ATTEST_API ExpectedResourceType ResolveResource(std::string_view typeName, const Backend &backend);

} // namespace Attest

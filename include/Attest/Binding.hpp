// Binding.hpp
// Declared checks and their split into constructor arguments and assertions
#pragma once

#include <string_view>
#include <vector>

#include <Attest/Export.hpp>
#include <Attest/Value.hpp>

namespace Attest
{

  // (member name, expectation) pairs in declaration order.
  using CheckList = ValueMap;

  // Names with a leading underscore belong to the calling layer, not to the user.
  [[nodiscard]] constexpr bool IsReservedCheckName(std::string_view name) noexcept
  {
    return !name.empty() && name.front() == '_';
  }

  [[nodiscard]] ATTEST_API CheckList FilterReservedChecks(const CheckList &checks);

  struct BoundArguments
  {
    ValueMap constructorArgs;
    CheckList checks;
  };

  /**
   * Move every check whose name matches a constructor parameter into
   * `constructorArgs`. The subject name is never part of `parameters`.
   * Relative order is kept on both sides.
   */
  [[nodiscard]] ATTEST_API BoundArguments BindArguments(const std::vector<std::string_view> &parameters,
                                                        CheckList checks);

} // namespace Attest

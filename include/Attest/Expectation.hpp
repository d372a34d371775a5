// Expectation.hpp
// Assertion evaluation: boolean identity or a {comparison, expected} pair
#pragma once

#include <expected>

#include <Attest/Comparators.hpp>
#include <Attest/Export.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

namespace Attest
{

  /**
   * Evaluate one expectation against the actual result of a member.
   *
   * - bool: passes only when `actual` is a bool of the same value; 1, "true"
   *   and null never match.
   * - map: `comparison` is resolved in `registry` and applied as
   *   comparator(expected, actual).
   * - anything else: InvalidExpectationType.
   */
  [[nodiscard]] ATTEST_API std::expected<bool, Error> EvaluateExpectation(
      const Value &expectation, const Value &actual,
      const ComparatorRegistry &registry = ComparatorRegistry::Default());

} // namespace Attest

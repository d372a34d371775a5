#include <Attest/Expectation.hpp>
#include <Attest/Log.hpp>

#include <fmt/format.h>

namespace Attest
{

  namespace
  {
    constexpr std::string_view kMissingKeys =
        "The comparison dictionary provided is missing expected keys. "
        "Either \"expected\" or \"comparison\" are not present.";
  }

  std::expected<bool, Error> EvaluateExpectation(const Value &expectation, const Value &actual,
                                                 const ComparatorRegistry &registry)
  {
    ATTEST_LOG(Debug, "Expected result: {}. Actual result: {}", ToString(expectation), ToString(actual));
    if (const auto *flag = expectation.AsBool())
    {
      const auto *result = actual.AsBool();
      return result != nullptr && *result == *flag;
    }
    if (expectation.IsMap())
    {
      const Value *comparison = expectation.Find("comparison");
      if (!comparison)
        return std::unexpected(Error{ErrorCode::MissingArgument, std::string{kMissingKeys}});
      const auto *comparisonName = comparison->AsString();
      if (!comparisonName)
        return std::unexpected(Error{ErrorCode::InvalidComparator,
                                     fmt::format("Comparison {} is not a valid selection.", ToString(*comparison))});
      auto comparator = registry.Resolve(*comparisonName);
      if (!comparator)
        return std::unexpected(comparator.error());
      const Value *expected = expectation.Find("expected");
      if (!expected)
        return std::unexpected(Error{ErrorCode::MissingArgument, std::string{kMissingKeys}});
      return comparator->Apply(*expected, actual);
    }
    return std::unexpected(Error{ErrorCode::InvalidExpectationType,
                                 fmt::format("Expected bool or dict but received {}", KindName(expectation.Kind()))});
  }

} // namespace Attest

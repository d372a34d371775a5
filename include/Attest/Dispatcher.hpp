// Dispatcher.hpp
// One verification run: resolve, bind, construct, evaluate every declared check
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Attest/Backend.hpp>
#include <Attest/Binding.hpp>
#include <Attest/Comparators.hpp>
#include <Attest/Export.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

namespace Attest
{

  struct AssertionResult
  {
    std::string member;
    Value expectation;
    // Empty when the check failed before a result was produced.
    std::optional<Value> actual;
    std::optional<Error> error;
    bool passed{false};
  };

  struct VerificationReport
  {
    bool success{true};
    std::vector<std::string> passed;
    std::vector<std::string> failed;
    std::vector<AssertionResult> results;
  };

  using ExpectedReport = std::expected<VerificationReport, Error>;

  /**
   * Verify one declared resource.
   *
   * An unresolvable resource or backend yields a report with success=false
   * and no messages. A construction failure is returned as the error. Every
   * other failure is recorded against its own check and the remaining
   * checks still run.
   */
  [[nodiscard]] ATTEST_API ExpectedReport VerifyResource(std::string_view resourceType, std::string_view subject,
                                                         const CheckList &checks,
                                                         std::string_view backend = kDefaultBackend);

  [[nodiscard]] ATTEST_API ExpectedReport VerifyResource(std::string_view resourceType, std::string_view subject,
                                                         const CheckList &checks, const BackendPtr &backend,
                                                         const ComparatorRegistry &comparators = ComparatorRegistry::Default());

} // namespace Attest

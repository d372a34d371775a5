#include <Attest/Dispatcher.hpp>
#include <Attest/Expectation.hpp>
#include <Attest/Log.hpp>
#include <Attest/Members.hpp>
#include <Attest/Registry.hpp>
#include <Attest/Resolver.hpp>

#include <fmt/format.h>

#include <utility>

namespace Attest
{

  namespace
  {
    std::string JoinNames(const std::vector<std::string_view> &names)
    {
      std::string out;
      for (const auto name : names)
      {
        if (!out.empty())
          out += ", ";
        out += name;
      }
      return out;
    }

    std::string JoinKeys(const CheckList &checks)
    {
      std::string out;
      for (const auto &check : checks)
      {
        if (!out.empty())
          out += ", ";
        out += check.first;
      }
      return out;
    }

    AssertionResult RunCheck(const ResourceType &type, const Instance &instance, const std::string &member,
                             const Value &expectation, const ComparatorRegistry &comparators)
    {
      AssertionResult result{member, expectation, std::nullopt, std::nullopt, false};
      auto actual = GetMemberResult(type, instance, member, expectation);
      if (!actual)
      {
        result.error = std::move(actual.error());
        return result;
      }
      result.actual = std::move(*actual);
      auto verdict = EvaluateExpectation(expectation, *result.actual, comparators);
      if (!verdict)
      {
        result.error = std::move(verdict.error());
        return result;
      }
      result.passed = *verdict;
      return result;
    }

    std::string FormatResult(std::string_view resourceType, std::string_view subject, const AssertionResult &r)
    {
      const auto head = fmt::format("Assertion {}: {} {} {} {}.", r.passed ? "passed" : "failed", resourceType,
                                    subject, r.member, ToString(r.expectation));
      if (r.error)
      {
        if (r.actual)
          return fmt::format("{} Actual result: {}. Error: {}", head, ToString(*r.actual), r.error->message);
        return fmt::format("{} Error: {}", head, r.error->message);
      }
      return fmt::format("{} Actual result: {}", head, ToString(r.actual ? *r.actual : Value{}));
    }

    VerificationReport Unsupported()
    {
      VerificationReport report;
      report.success = false;
      return report;
    }
  } // namespace

  ExpectedReport VerifyResource(std::string_view resourceType, std::string_view subject, const CheckList &checks,
                                std::string_view backend)
  {
    auto resolvedBackend = MakeBackend(backend);
    if (!resolvedBackend)
    {
      ATTEST_LOG(Error, "The {} resource cannot run on backend {}: {}", resourceType, backend,
                 resolvedBackend.error().message);
      return Unsupported();
    }
    return VerifyResource(resourceType, subject, checks, *resolvedBackend);
  }

  ExpectedReport VerifyResource(std::string_view resourceType, std::string_view subject, const CheckList &checks,
                                const BackendPtr &backend, const ComparatorRegistry &comparators)
  {
    if (!backend)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "no backend supplied"});

    ATTEST_LOG(Debug, "Retrieving {} resource.", resourceType);
    auto type = ResolveResource(resourceType, *backend);
    if (!type)
    {
      ATTEST_LOG(Error, "The {} resource is not supported for this backend and/or platform: {}", resourceType,
                 type.error().message);
      return Unsupported();
    }

    const auto parameters = type->TakesSubject() ? type->ConstructorParameters() : std::vector<std::string_view>{};
    ATTEST_LOG(Debug, "Parameters accepted by resource {}: {}", resourceType, JoinNames(parameters));

    auto bound = BindArguments(parameters, FilterReservedChecks(checks));
    ATTEST_LOG(Debug, "Called checks are: {}", JoinKeys(bound.checks));

    auto instance = type->Construct(backend, subject, bound.constructorArgs);
    if (!instance)
    {
      ATTEST_LOG(Error, "Resource {} failed to instantiate: {}", resourceType, instance.error().message);
      return std::unexpected(instance.error());
    }

    VerificationReport report;
    report.results.reserve(bound.checks.size());
    for (const auto &[member, expectation] : bound.checks)
    {
      auto result = RunCheck(*type, *instance, member, expectation, comparators);
      auto message = FormatResult(resourceType, subject, result);
      if (result.passed)
      {
        report.passed.push_back(std::move(message));
      }
      else
      {
        report.success = false;
        report.failed.push_back(std::move(message));
      }
      report.results.push_back(std::move(result));
    }
    return report;
  }

} // namespace Attest

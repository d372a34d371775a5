// Dispatcher.cpp - end-to-end verification runs against demo resources

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace Attest;
using AttestTests::Compare;

namespace
{
  ExpectedReport Verify(std::string_view type, std::string_view subject, const CheckList &checks)
  {
    AttestTests::RegisterDemoResources();
    return VerifyResource(type, subject, checks, AttestTests::MakeFake());
  }

  bool Mentions(const std::vector<std::string> &messages, std::string_view needle)
  {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string &m) { return m.find(needle) != std::string::npos; });
  }
} // namespace

TEST_CASE("BooleanChecksNeedAnIdenticalBool", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "salt-minion", CheckList{{"is_installed", true}, {"count", true}});
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  REQUIRE(report->passed.size() == 1);
  REQUIRE(report->failed.size() == 1);
  CHECK(report->failed[0] == "Assertion failed: demo_package salt-minion count true. Actual result: 1");
}

TEST_CASE("NoChecksIsAnEmptySuccess", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "salt-minion", CheckList{});
  REQUIRE(report.has_value());
  CHECK(report->success);
  CHECK(report->passed.empty());
  CHECK(report->failed.empty());
  CHECK(report->results.empty());
}

TEST_CASE("UnavailableResourcesFailWithoutMessages", "[attest][Dispatcher]")
{
  for (auto type : {"no_such_thing", "demo_unavailable"})
  {
    auto report = Verify(type, "x", CheckList{{"exists", true}});
    REQUIRE(report.has_value());
    CHECK_FALSE(report->success);
    CHECK(report->passed.empty());
    CHECK(report->failed.empty());
  }
}

TEST_CASE("UnknownBackendSelectorFailsTheReport", "[attest][Dispatcher]")
{
  AttestTests::RegisterDemoResources();
  auto report = VerifyResource("demo_package", "python", CheckList{{"is_installed", true}}, "telnet://box");
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  CHECK(report->passed.empty());
  CHECK(report->failed.empty());

  auto nullBackend = VerifyResource("demo_package", "python", CheckList{}, BackendPtr{});
  REQUIRE_FALSE(nullBackend.has_value());
  CHECK(nullBackend.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("UnknownMemberFailsOnlyItsOwnCheck", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "salt-minion", CheckList{{"is_installed", true}, {"bogus_attr", true}});
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  REQUIRE(report->passed.size() == 1);
  REQUIRE(report->failed.size() == 1);
  CHECK(report->failed[0] ==
        "Assertion failed: demo_package salt-minion bogus_attr true. Error: The demo_package resource does not "
        "have any property or method named bogus_attr");
  REQUIRE(report->results.size() == 2);
  REQUIRE(report->results[1].error.has_value());
  CHECK(report->results[1].error->code == ErrorCode::UnknownMember);
  CHECK_FALSE(report->results[1].actual.has_value());
}

TEST_CASE("MethodChecksNeedTheirParameter", "[attest][Dispatcher]")
{
  SECTION("missing parameter")
  {
    auto report = Verify("demo_package", "salt-minion", CheckList{{"contains", Compare("is_", true)}});
    REQUIRE(report.has_value());
    CHECK_FALSE(report->success);
    REQUIRE(report->results.size() == 1);
    REQUIRE(report->results[0].error.has_value());
    CHECK(report->results[0].error->code == ErrorCode::MissingArgument);
  }
  SECTION("parameter supplied")
  {
    ValueMap arg{{"parameter", "master"}, {"expected", true}, {"comparison", "is_"}};
    auto report = Verify("demo_package", "salt-minion", CheckList{{"contains", arg}});
    REQUIRE(report.has_value());
    CHECK(report->success);
    REQUIRE(report->passed.size() == 1);
    CHECK(report->passed[0] ==
          "Assertion passed: demo_package salt-minion contains {parameter: master, expected: true, comparison: is_}. "
          "Actual result: true");
  }
}

TEST_CASE("InvalidComparatorDoesNotStopOtherChecks", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "python",
                       CheckList{{"version", Compare("frobnicate", "1")}, {"is_installed", true}, {"count", Compare("ge", 1)}});
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  CHECK(report->passed.size() == 2);
  REQUIRE(report->failed.size() == 1);
  CHECK(Mentions(report->failed, "Comparison frobnicate is not a valid selection."));
  REQUIRE(report->results[0].error.has_value());
  CHECK(report->results[0].error->Is(ErrorCode::InvalidComparator));
  // The member was read before the comparison was rejected.
  REQUIRE(report->results[0].actual.has_value());
  CHECK(*report->results[0].actual == Value{"2.7.9-1"});
}

TEST_CASE("VersionEqualityOnPython", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "python", CheckList{{"version", Compare("eq", "2.7.9-1")}});
  REQUIRE(report.has_value());
  CHECK(report->success);
  REQUIRE(report->passed.size() == 1);
  CHECK(report->passed[0] ==
        "Assertion passed: demo_package python version {expected: 2.7.9-1, comparison: eq}. Actual result: 2.7.9-1");
}

TEST_CASE("ReservedNamesNeverReachTheResource", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "python",
                       CheckList{{"__pub_fun", "state.apply"}, {"_internal", true}, {"is_installed", true}});
  REQUIRE(report.has_value());
  CHECK(report->success);
  REQUIRE(report->results.size() == 1);
  CHECK(report->results[0].member == "is_installed");
  CHECK_FALSE(Mentions(report->passed, "__pub_fun"));
  CHECK_FALSE(Mentions(report->failed, "_internal"));
}

TEST_CASE("ConstructorParametersAreNotChecks", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "python", CheckList{{"channel", "edge"}, {"is_installed", true}});
  REQUIRE(report.has_value());
  REQUIRE(report->results.size() == 1);
  CHECK(report->results[0].member == "is_installed");
}

TEST_CASE("ConstructionErrorsAreReturned", "[attest][Dispatcher]")
{
  SECTION("required parameter missing")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"is_listening", true}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ResourceConstruction);
  }
  SECTION("parameter of the wrong kind")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"port", "x"}, {"is_listening", true}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ResourceConstruction);
  }
  SECTION("parameter outside the integer range")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"port", 1e30}, {"is_listening", true}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ResourceConstruction);
  }
  SECTION("integral float parameter")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"port", 22.0}, {"is_listening", true}});
    REQUIRE(r.has_value());
    CHECK(r->success);
  }
  SECTION("validation rejects the instance")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"port", 0}, {"is_listening", true}});
    REQUIRE_FALSE(r.has_value());
  }
  SECTION("no constructor")
  {
    auto r = Verify("demo_abstract", "x", CheckList{{"kind", Compare("eq", "abstract")}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::ResourceConstruction);
  }
  SECTION("valid parameter")
  {
    auto r = Verify("demo_listener", "sshd", CheckList{{"port", 22}, {"is_listening", true}});
    REQUIRE(r.has_value());
    CHECK(r->success);
  }
}

TEST_CASE("ParameterlessResourcesIgnoreTheSubject", "[attest][Dispatcher]")
{
  auto report = Verify("demo_host", "anything", CheckList{{"selector", Compare("eq", "fake://")}});
  REQUIRE(report.has_value());
  CHECK(report->success);
}

TEST_CASE("ChecksRunInDeclarationOrder", "[attest][Dispatcher]")
{
  auto report = Verify("demo_package", "python",
                       CheckList{{"version", Compare("search", "^2")}, {"kind", Compare("eq", "package")},
                                 {"revision", Compare("eq", 7)}, {"is_installed", true}});
  REQUIRE(report.has_value());
  CHECK(report->success);
  REQUIRE(report->results.size() == 4);
  CHECK(report->results[0].member == "version");
  CHECK(report->results[1].member == "kind");
  CHECK(report->results[2].member == "revision");
  CHECK(report->results[3].member == "is_installed");
}

TEST_CASE("ConcurrentVerificationsMatchASequentialRun", "[attest][Dispatcher]")
{
  AttestTests::RegisterDemoResources();
  const auto backend = AttestTests::MakeFake();
  const CheckList checks{{"version", Compare("search", "^2")},
                         {"is_installed", true},
                         {"count", Compare("gt", 0)},
                         {"bogus_attr", true},
                         {"contains", ValueMap{{"parameter", "master"}, {"expected", true}, {"comparison", "is_"}}},
                         {"revision", Compare("eq", 7)}};

  const auto baseline = VerifyResource("demo_package", "python", checks, backend);
  REQUIRE(baseline.has_value());
  REQUIRE(baseline->passed.size() == 4);
  REQUIRE(baseline->failed.size() == 2);
  REQUIRE(baseline->results.size() == 6);

  constexpr int kThreads = 8;
  constexpr int kRunsPerThread = 25;
  struct Outcome
  {
    int mismatches{0};
    int errors{0};
  };
  std::vector<Outcome> outcomes(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t)
  {
    workers.emplace_back(
        [&, t]
        {
          for (int run = 0; run < kRunsPerThread; ++run)
          {
            auto report = VerifyResource("demo_package", "python", checks, backend);
            if (!report)
            {
              ++outcomes[t].errors;
              continue;
            }
            bool same = report->success == baseline->success && report->passed == baseline->passed &&
                        report->failed == baseline->failed && report->results.size() == baseline->results.size();
            for (std::size_t i = 0; same && i < report->results.size(); ++i)
              same = report->results[i].member == baseline->results[i].member;
            if (!same)
              ++outcomes[t].mismatches;
          }
        });
  }
  for (auto &worker : workers)
    worker.join();

  for (const auto &outcome : outcomes)
  {
    CHECK(outcome.errors == 0);
    CHECK(outcome.mismatches == 0);
  }
  // Declaration order survives: passed and failed interleave as declared.
  CHECK(baseline->results[0].member == "version");
  CHECK(baseline->results[3].member == "bogus_attr");
  CHECK(baseline->results[5].member == "revision");
  CHECK(baseline->failed[0].starts_with("Assertion failed: demo_package python count "));
  CHECK(baseline->failed[1].starts_with("Assertion failed: demo_package python bogus_attr "));
}

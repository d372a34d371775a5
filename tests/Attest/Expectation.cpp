// Expectation.cpp - boolean identity and structured comparison expectations

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace Attest;
using AttestTests::Compare;

TEST_CASE("BooleanExpectationRequiresIdenticalBool", "[attest][Expectation]")
{
  CHECK(EvaluateExpectation(true, true).value());
  CHECK(EvaluateExpectation(false, false).value());
  CHECK_FALSE(EvaluateExpectation(true, false).value());
  // Value-equal but not identical results fail.
  CHECK_FALSE(EvaluateExpectation(true, 1).value());
  CHECK_FALSE(EvaluateExpectation(false, 0).value());
  CHECK_FALSE(EvaluateExpectation(false, Value{}).value());
  CHECK_FALSE(EvaluateExpectation(true, "true").value());
}

TEST_CASE("StructuredExpectationUsesComparator", "[attest][Expectation]")
{
  CHECK(EvaluateExpectation(Compare("eq", "2.7.9-1"), "2.7.9-1").value());
  CHECK_FALSE(EvaluateExpectation(Compare("eq", "2.7.9-1"), "3.0.0").value());
  CHECK(EvaluateExpectation(Compare("lt", 1), 5).value());
  CHECK(EvaluateExpectation(Compare("is_", true), true).value());
}

TEST_CASE("UnknownComparatorIsInvalidComparator", "[attest][Expectation]")
{
  auto r = EvaluateExpectation(Compare("frobnicate", 1), 1);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().Is(ErrorCode::InvalidComparator));

  auto notAName = EvaluateExpectation(ValueMap{{"expected", 1}, {"comparison", 3}}, 1);
  REQUIRE_FALSE(notAName.has_value());
  CHECK(notAName.error().code == ErrorCode::InvalidComparator);
}

TEST_CASE("IncompleteComparisonDictIsMissingArgument", "[attest][Expectation]")
{
  auto noComparison = EvaluateExpectation(ValueMap{{"expected", 1}}, 1);
  REQUIRE_FALSE(noComparison.has_value());
  CHECK(noComparison.error().code == ErrorCode::MissingArgument);

  auto noExpected = EvaluateExpectation(ValueMap{{"comparison", "eq"}}, 1);
  REQUIRE_FALSE(noExpected.has_value());
  CHECK(noExpected.error().code == ErrorCode::MissingArgument);
}

TEST_CASE("OtherExpectationShapesAreRejected", "[attest][Expectation]")
{
  auto r = EvaluateExpectation("yes", "yes");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidExpectationType);
  CHECK(r.error().message == "Expected bool or dict but received string");

  CHECK_FALSE(EvaluateExpectation(1, 1).has_value());
  CHECK_FALSE(EvaluateExpectation(ValueList{true}, true).has_value());
}

TEST_CASE("ComparatorErrorsPropagate", "[attest][Expectation]")
{
  auto r = EvaluateExpectation(Compare("lt", "a"), 1);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
}

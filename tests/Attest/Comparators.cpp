// Comparators.cpp - built-in comparator vocabulary and argument order

#include <catch2/catch_test_macros.hpp>

#include <Attest/Comparators.hpp>

#include <string>

using namespace Attest;

namespace
{
  bool Apply(std::string_view name, const Value &expected, const Value &actual)
  {
    auto c = ComparatorRegistry::Default().Resolve(name);
    REQUIRE(c.has_value());
    auto r = c->Apply(expected, actual);
    REQUIRE(r.has_value());
    return *r;
  }

  std::expected<bool, Error> TryApply(std::string_view name, const Value &expected, const Value &actual)
  {
    auto c = ComparatorRegistry::Default().Resolve(name);
    REQUIRE(c.has_value());
    return c->Apply(expected, actual);
  }
} // namespace

TEST_CASE("Vocabulary is fixed and enumerable", "[attest][Comparators]")
{
  const auto &reg = ComparatorRegistry::Default();
  CHECK(reg.Size() == 10);
  for (auto name : {"eq", "ne", "lt", "le", "gt", "ge", "is_", "is_not", "contains", "search"})
    CHECK(reg.Contains(name));
  CHECK(reg.NameAt(0) == "eq");
  CHECK(reg.NameAt(99).empty());
  CHECK(&reg == &ComparatorRegistry::Default());
}

TEST_CASE("Unknown comparator is reported, not treated as failure", "[attest][Comparators]")
{
  auto c = ComparatorRegistry::Default().Resolve("frobnicate");
  REQUIRE_FALSE(c.has_value());
  CHECK(c.error().code == ErrorCode::ComparatorNotFound);
  CHECK(c.error().Is(ErrorCode::InvalidComparator));
  CHECK(c.error().message == "Comparison frobnicate is not a valid selection.");
}

TEST_CASE("EqualityComparesVersionsAsStrings", "[attest][Comparators]")
{
  CHECK(Apply("eq", "2.7.9-1", "2.7.9-1"));
  CHECK_FALSE(Apply("eq", "2.7.9-1", "3.0.0"));
  CHECK(Apply("ne", "2.7.9-1", "3.0.0"));
}

TEST_CASE("EqualityIsNumericAcrossKinds", "[attest][Comparators]")
{
  CHECK(Apply("eq", 1, 1.0));
  CHECK(Apply("eq", true, 1));
  CHECK_FALSE(Apply("eq", 1, "1"));
  CHECK(Apply("eq", ValueList{1, 2}, ValueList{1.0, 2}));
  CHECK(Apply("eq", ValueMap{{"a", 1}, {"b", 2}}, ValueMap{{"b", 2}, {"a", 1}}));
  CHECK_FALSE(Apply("eq", Value{}, false));
}

TEST_CASE("OrderingAppliesExpectedFirst", "[attest][Comparators]")
{
  // lt(expected, actual) is expected < actual
  CHECK(Apply("lt", 1, 2));
  CHECK_FALSE(Apply("lt", 2, 1));
  CHECK(Apply("le", 2, 2));
  CHECK(Apply("gt", 3, 2.5));
  CHECK(Apply("ge", 3, 3.0));
  CHECK(Apply("lt", "abc", "abd"));
  CHECK(Apply("lt", ValueList{1, 2}, ValueList{1, 3}));
  CHECK(Apply("lt", ValueList{1}, ValueList{1, 0}));
}

TEST_CASE("OrderingRejectsMixedKinds", "[attest][Comparators]")
{
  auto r = TryApply("lt", 1, "2");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(TryApply("ge", Value{}, 1).has_value());
}

TEST_CASE("IdentityIsStrict", "[attest][Comparators]")
{
  CHECK(Apply("is_", true, true));
  CHECK_FALSE(Apply("is_", true, 1));
  CHECK_FALSE(Apply("is_", 1, 1.0));
  CHECK(Apply("is_not", false, Value{}));
  CHECK_FALSE(Apply("is_not", "x", "x"));
}

TEST_CASE("ContainsTestsActualInExpected", "[attest][Comparators]")
{
  CHECK(Apply("contains", ValueList{"wheel", "sudo"}, "sudo"));
  CHECK_FALSE(Apply("contains", ValueList{"wheel"}, "adm"));
  CHECK(Apply("contains", "listen 0.0.0.0:22", "0.0.0.0"));
  CHECK(Apply("contains", ValueMap{{"master", "salt"}}, "master"));
  CHECK_FALSE(TryApply("contains", "text", 3).has_value());
  CHECK_FALSE(TryApply("contains", 3, 3).has_value());
}

TEST_CASE("SearchTreatsExpectedAsPattern", "[attest][Comparators]")
{
  CHECK(Apply("search", "^2\\.7", "2.7.9-1"));
  CHECK_FALSE(Apply("search", "^3", "2.7.9-1"));
  CHECK(Apply("search", "master", "# master: salt\nmaster: salt"));

  auto bad = TryApply("search", "([", "x");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::InvalidArgument);
  CHECK_FALSE(TryApply("search", "x", 1).has_value());
}

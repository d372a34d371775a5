// NameUtils.cpp - resource name case conversion

#include <catch2/catch_test_macros.hpp>

#include <Attest/NameUtils.hpp>

using namespace Attest;

namespace
{
  struct Sample
  {
    int revision;
  };
} // namespace

TEST_CASE("CamelToSnake", "[attest][NameUtils]")
{
  CHECK(CamelToSnake("Package") == "package");
  CHECK(CamelToSnake("PipPackage") == "pip_package");
  CHECK(CamelToSnake("SystemInfo") == "system_info");
  CHECK(CamelToSnake("MountPoint") == "mount_point");
  CHECK(CamelToSnake("HTTPServer") == "http_server");
  CHECK(CamelToSnake("IPAddress") == "ip_address");
}

TEST_CASE("MemberNameFromPointer", "[attest][NameUtils]")
{
  STATIC_REQUIRE(detail::MemberNameFromPretty<&Sample::revision>() == "revision");
}

// Resources.cpp - built-in providers against a scripted backend

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <algorithm>
#include <memory>
#include <string>

using namespace Attest;
using AttestTests::Compare;
using AttestTests::FakeBackend;

namespace
{
  ExpectedReport Verify(std::string_view type, std::string_view subject, const CheckList &checks,
                        const std::shared_ptr<FakeBackend> &backend)
  {
    RegisterBuiltinResources();
    return VerifyResource(type, subject, checks, backend);
  }

  bool Ran(const FakeBackend &backend, std::string_view command)
  {
    const auto commands = backend.Commands();
    return std::find(commands.begin(), commands.end(), command) != commands.end();
  }
} // namespace

TEST_CASE("ShellQuoting", "[attest][Backend]")
{
  CHECK(ShellQuote("python") == "'python'");
  CHECK(ShellQuote("") == "''");
  CHECK(ShellQuote("it's") == "'it'\\''s'");
}

TEST_CASE("BackendSelectors", "[attest][Backend]")
{
  auto local = MakeBackend("local://");
  REQUIRE(local.has_value());
  CHECK((*local)->Selector() == "local://");

  auto docker = MakeBackend("docker://web");
  REQUIRE(docker.has_value());
  CHECK((*docker)->Selector() == "docker://web");

  auto ssh = MakeBackend("ssh://admin@web01");
  REQUIRE(ssh.has_value());
  CHECK((*ssh)->Selector() == "ssh://admin@web01");

  for (auto bad : {"ssh://", "docker://", "telnet://box"})
  {
    auto r = MakeBackend(bad);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::UnsupportedResource);
  }

  for (auto optionLike : {"ssh://-oProxyCommand=touch /tmp/x", "docker://--privileged"})
  {
    auto r = MakeBackend(optionLike);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("HasCommandSearchesThePath", "[attest][Backend]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("ss");
  CHECK(fake->HasCommand("ss"));
  CHECK_FALSE(fake->HasCommand("netstat"));
  CHECK(Ran(*fake, "command -v 'netstat' >/dev/null 2>&1"));
}

TEST_CASE("OutputSplitting", "[attest][Resources]")
{
  const auto fields = Resources::SplitFields("  install ok\tinstalled\n");
  REQUIRE(fields.size() == 3);
  CHECK(fields[2] == "installed");

  const auto lines = Resources::SplitLines("a\r\n\nb\n");
  REQUIRE(lines.size() == 2);
  CHECK(lines[0] == "a");
  CHECK(lines[1] == "b");

  const auto entry = Resources::SplitEntry("salt:x:999:999::/opt/salt:/bin/sh");
  REQUIRE(entry.size() == 7);
  CHECK(entry[4].empty());
  CHECK(entry[6] == "/bin/sh");
}

TEST_CASE("PackageThroughDpkg", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("dpkg-query")
      .On("dpkg-query -f '${Status}' -W 'python'", 0, "install ok installed")
      .On("dpkg-query -f '${Version}' -W 'python'", 0, "2.7.9-1\n")
      .On("dpkg-query -f '${Status}' -W 'salt-master'", 0, "deinstall ok config-files")
      .On("dpkg-query -f '${Status}' -W 'nope'", 1);

  auto report = Verify("package", "python", CheckList{{"is_installed", true}, {"version", Compare("eq", "2.7.9-1")}}, fake);
  REQUIRE(report.has_value());
  CHECK(report->success);
  CHECK(report->passed.size() == 2);
  CHECK(report->passed[1] ==
        "Assertion passed: package python version {expected: 2.7.9-1, comparison: eq}. Actual result: 2.7.9-1");

  auto removed = Verify("package", "salt-master", CheckList{{"is_installed", false}}, fake);
  REQUIRE(removed.has_value());
  CHECK(removed->success);

  auto missing = Verify("package", "nope", CheckList{{"is_installed", false}}, fake);
  REQUIRE(missing.has_value());
  CHECK(missing->success);
}

TEST_CASE("PackageThroughRpm", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("rpm")
      .On("rpm -q --quiet 'bash'", 0)
      .On("rpm -q --queryformat '%{VERSION}' 'bash'", 0, "5.1.8");

  auto report = Verify("package", "bash", CheckList{{"is_installed", true}, {"version", Compare("search", "^5\\.")}}, fake);
  REQUIRE(report.has_value());
  CHECK(report->success);
  CHECK_FALSE(Ran(*fake, "dpkg-query -f '${Status}' -W 'bash'"));
}

TEST_CASE("PackageNeedsAPackageManager", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  auto report = Verify("package", "bash", CheckList{{"is_installed", true}}, fake);
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  CHECK(report->passed.empty());
  CHECK(report->failed.empty());
}

TEST_CASE("PipPackageWithDefaultAndCustomPip", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->On("'pip' show 'requests'", 0, "Name: requests\nVersion: 2.31.0\nSummary: HTTP\n")
      .On("'/opt/venv/bin/pip' show 'requests'", 1);

  auto report = Verify("pip_package", "requests",
                       CheckList{{"is_installed", true}, {"version", Compare("eq", "2.31.0")}}, fake);
  REQUIRE(report.has_value());
  CHECK(report->success);

  auto venv = Verify("pip_package", "requests",
                     CheckList{{"pip_path", "/opt/venv/bin/pip"}, {"is_installed", false}}, fake);
  REQUIRE(venv.has_value());
  CHECK(venv->success);
  REQUIRE(venv->results.size() == 1);
}

TEST_CASE("ServiceState", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("systemctl")
      .On("systemctl is-active 'sshd'", 0, "active\n")
      .On("systemctl is-enabled 'sshd'", 1, "disabled\n");

  auto report = Verify("service", "sshd", CheckList{{"is_running", true}, {"is_enabled", false}}, fake);
  REQUIRE(report.has_value());
  CHECK(report->success);

  // Unscripted commands exit 127, which is neither true nor false.
  auto broken = Verify("service", "cron", CheckList{{"is_running", true}}, fake);
  REQUIRE(broken.has_value());
  CHECK_FALSE(broken->success);
  REQUIRE(broken->results.size() == 1);
  REQUIRE(broken->results[0].error.has_value());
  CHECK(broken->results[0].error->code == ErrorCode::ProviderFailure);
}

TEST_CASE("FileProperties", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->On("test -e '/etc/hosts'", 0)
      .On("test -d '/etc/hosts'", 1)
      .On("stat -c %a '/etc/hosts'", 0, "644\n")
      .On("stat -c %U '/etc/hosts'", 0, "root\n")
      .On("stat -c %u '/etc/hosts'", 0, "0\n")
      .On("stat -c %s '/etc/hosts'", 0, "not-a-number\n")
      .On("cat -- '/etc/hosts'", 0, "127.0.0.1 localhost\n")
      .On("grep -qs -- 'localhost' '/etc/hosts'", 0)
      .On("grep -qs -- 'salt' '/etc/hosts'", 1);

  auto report = Verify("file", "/etc/hosts",
                       CheckList{{"exists", true},
                                 {"is_directory", false},
                                 {"mode", Compare("eq", 420)},
                                 {"user", Compare("eq", "root")},
                                 {"uid", Compare("eq", 0)},
                                 {"content_string", Compare("search", "localhost")},
                                 {"contains", ValueMap{{"parameter", "localhost"}, {"expected", true}, {"comparison", "is_"}}},
                                 {"contains", ValueMap{{"parameter", "salt"}, {"expected", false}, {"comparison", "is_"}}},
                                 {"size", Compare("gt", 0)}},
                       fake);
  REQUIRE(report.has_value());
  CHECK_FALSE(report->success);
  CHECK(report->passed.size() == 8);
  REQUIRE(report->failed.size() == 1);
  REQUIRE(report->results[8].error.has_value());
  CHECK(report->results[8].error->code == ErrorCode::ProviderFailure);
}

TEST_CASE("SocketSpecs", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("ss");

  SECTION("tcp with host")
  {
    auto r = Verify("socket", "tcp://[::1]:8080",
                    CheckList{{"protocol", Compare("eq", "tcp")}, {"host", Compare("eq", "::1")}, {"port", Compare("eq", 8080)}},
                    fake);
    REQUIRE(r.has_value());
    CHECK(r->success);
  }
  SECTION("port only")
  {
    auto r = Verify("socket", "udp://53", CheckList{{"port", Compare("eq", 53)}, {"host", Compare("is_", Value{})}}, fake);
    REQUIRE(r.has_value());
    CHECK(r->success);
  }
  SECTION("unix path")
  {
    auto r = Verify("socket", "unix:///run/docker.sock", CheckList{{"path", Compare("eq", "/run/docker.sock")}}, fake);
    REQUIRE(r.has_value());
    CHECK(r->success);
  }
  SECTION("malformed specs fail construction")
  {
    for (auto spec : {"tcp://99999", "tcp://0", "tcp://host:", "http://80", "22", "unix://"})
    {
      auto r = Verify("socket", spec, CheckList{{"is_listening", true}}, fake);
      REQUIRE_FALSE(r.has_value());
      CHECK(r.error().code == ErrorCode::ResourceConstruction);
    }
  }
}

TEST_CASE("SocketListening", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->Provide("ss")
      .On("ss -H -l -n -t", 0,
          "LISTEN 0 128 0.0.0.0:22 0.0.0.0:*\n"
          "LISTEN 0 511 127.0.0.1:8080 0.0.0.0:*\n"
          "LISTEN 0 128 [::]:443 [::]:*\n")
      .On("ss -H -l -n -u", 0, "UNCONN 0 0 127.0.0.53%lo:53 0.0.0.0:*\n")
      .On("ss -H -l -n -x", 0, "u_str LISTEN 0 4096 /run/docker.sock 21377 * 0\n");

  auto listening = [&](std::string_view spec)
  {
    auto r = Verify("socket", spec, CheckList{{"is_listening", true}}, fake);
    REQUIRE(r.has_value());
    return r->success;
  };

  CHECK(listening("tcp://22"));
  CHECK(listening("tcp://10.0.0.5:22"));
  CHECK(listening("tcp://127.0.0.1:8080"));
  CHECK_FALSE(listening("tcp://10.0.0.5:8080"));
  CHECK(listening("tcp://443"));
  CHECK_FALSE(listening("tcp://25"));
  CHECK(listening("udp://127.0.0.53:53"));
  CHECK_FALSE(listening("udp://22"));
  CHECK(listening("unix:///run/docker.sock"));
  CHECK_FALSE(listening("unix:///run/missing.sock"));
}

TEST_CASE("ListenerLineMatching", "[attest][Resources]")
{
  using Resources::MatchesListener;
  CHECK(MatchesListener("LISTEN 0 128 *:80 *:*", std::string{"192.168.1.4"}, 80));
  CHECK(MatchesListener("LISTEN 0 128 [fe80::1%eth0]:80 [::]:*", std::string{"fe80::1"}, 80));
  CHECK_FALSE(MatchesListener("LISTEN 0 128 *:8080 *:*", std::nullopt, 80));
  CHECK_FALSE(MatchesListener("garbage", std::nullopt, 80));
}

TEST_CASE("UserAccount", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->On("id 'salt'", 0, "uid=999(salt) gid=999(salt) groups=999(salt),4(adm)\n")
      .On("id -u 'salt'", 0, "999\n")
      .On("id -gn 'salt'", 0, "salt\n")
      .On("id -Gn 'salt'", 0, "salt adm\n")
      .On("getent passwd 'salt'", 0, "salt:x:999:999::/opt/salt:/bin/sh\n")
      .On("id 'ghost'", 1);

  auto report = Verify("user", "salt",
                       CheckList{{"exists", true},
                                 {"uid", Compare("eq", 999)},
                                 {"group", Compare("eq", "salt")},
                                 {"groups", Compare("eq", ValueList{"salt", "adm"})},
                                 {"home", Compare("eq", "/opt/salt")},
                                 {"shell", Compare("eq", "/bin/sh")}},
                       fake);
  REQUIRE(report.has_value());
  CHECK(report->success);
  CHECK(report->passed.size() == 6);

  auto ghost = Verify("user", "ghost", CheckList{{"exists", false}}, fake);
  REQUIRE(ghost.has_value());
  CHECK(ghost->success);
}

TEST_CASE("GroupEntry", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->On("getent group 'wheel'", 0, "wheel:x:10:alice,bob\n").On("getent group 'nogroup'", 2);

  auto wheel = Verify("group", "wheel", CheckList{{"exists", true}, {"gid", Compare("eq", 10)}}, fake);
  REQUIRE(wheel.has_value());
  CHECK(wheel->success);

  auto none = Verify("group", "nogroup", CheckList{{"exists", false}}, fake);
  REQUIRE(none.has_value());
  CHECK(none->success);
}

TEST_CASE("SystemInfoFacts", "[attest][Resources]")
{
  auto fake = AttestTests::MakeFake();
  fake->On("uname -s", 0, "Linux\n")
      .On("uname -m", 0, "x86_64\n")
      .On("cat /etc/os-release", 0, "PRETTY_NAME=\"Debian GNU/Linux 12 (bookworm)\"\nID=debian\nVERSION_ID=\"12\"\n");

  auto report = Verify("system_info", "ignored",
                       CheckList{{"type", Compare("eq", "linux")},
                                 {"arch", Compare("eq", "x86_64")},
                                 {"distribution", Compare("eq", "debian")},
                                 {"release", Compare("eq", "12")},
                                 {"codename", Compare("is_", Value{})}},
                       fake);
  REQUIRE(report.has_value());
  CHECK(report->success);
  CHECK(report->passed.size() == 5);
}

TEST_CASE("OsReleaseParsing", "[attest][Resources]")
{
  constexpr std::string_view text = "NAME='Fedora Linux'\nID=fedora\nVERSION_ID=40\nEMPTY=\n";
  CHECK(Resources::FindOsReleaseValue(text, "NAME") == std::optional<std::string>{"Fedora Linux"});
  CHECK(Resources::FindOsReleaseValue(text, "ID") == std::optional<std::string>{"fedora"});
  CHECK(Resources::FindOsReleaseValue(text, "EMPTY") == std::optional<std::string>{""});
  CHECK_FALSE(Resources::FindOsReleaseValue(text, "VERSION").has_value());
}

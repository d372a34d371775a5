#include <Attest/Resources/SystemInfo.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <algorithm>
#include <cctype>

namespace Attest::Resources
{

  std::optional<std::string> FindOsReleaseValue(std::string_view text, std::string_view key)
  {
    for (const auto &line : SplitLines(text))
    {
      const std::string_view entry{line};
      const auto eq = entry.find('=');
      if (eq == std::string_view::npos || entry.substr(0, eq) != key)
        continue;
      auto value = entry.substr(eq + 1);
      if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
        value = value.substr(1, value.size() - 2);
      return std::string{value};
    }
    return std::nullopt;
  }

  SystemInfo::SystemInfo(BackendPtr backend) : Resource(std::move(backend), std::string{}) {}

  std::expected<std::string, Error> SystemInfo::Type() const
  {
    auto out = CheckOutput("uname -s");
    if (!out)
      return std::unexpected(out.error());
    std::transform(out->begin(), out->end(), out->begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

  std::expected<std::string, Error> SystemInfo::Arch() const { return CheckOutput("uname -m"); }

  std::expected<std::string, Error> SystemInfo::Hostname() const { return CheckOutput("uname -n"); }

  std::expected<std::optional<std::string>, Error> SystemInfo::OsRelease(std::string_view key) const
  {
    auto result = Run("cat /etc/os-release");
    if (!result)
      return std::unexpected(result.error());
    if (!result->Succeeded())
      return std::optional<std::string>{};
    return FindOsReleaseValue(result->stdoutText, key);
  }

  std::expected<std::optional<std::string>, Error> SystemInfo::Distribution() const { return OsRelease("ID"); }

  std::expected<std::optional<std::string>, Error> SystemInfo::Release() const { return OsRelease("VERSION_ID"); }

  std::expected<std::optional<std::string>, Error> SystemInfo::Codename() const { return OsRelease("VERSION_CODENAME"); }

  void AttestDescribe(Tag<SystemInfo>, ResourceBuilder<SystemInfo> &b)
  {
    b.SetName("SystemInfo");
    b.Description("Kernel, architecture, hostname and distribution of the host");
    b.ParameterlessConstructor();
    b.Property<&SystemInfo::Type>("type");
    b.Property<&SystemInfo::Arch>("arch");
    b.Property<&SystemInfo::Hostname>("hostname");
    b.Property<&SystemInfo::Distribution>("distribution");
    b.Property<&SystemInfo::Release>("release");
    b.Property<&SystemInfo::Codename>("codename");
  }

} // namespace Attest::Resources

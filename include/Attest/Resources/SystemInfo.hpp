// SystemInfo.hpp
// Host-wide facts; constructed without a subject
#pragma once

#include <optional>

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API SystemInfo : public Resource
  {
  public:
    explicit SystemInfo(BackendPtr backend);

    // Kernel name in lower case, e.g. "linux".
    [[nodiscard]] std::expected<std::string, Error> Type() const;
    [[nodiscard]] std::expected<std::string, Error> Arch() const;
    [[nodiscard]] std::expected<std::string, Error> Hostname() const;
    // ID, VERSION_ID and VERSION_CODENAME of /etc/os-release; none when the key is absent.
    [[nodiscard]] std::expected<std::optional<std::string>, Error> Distribution() const;
    [[nodiscard]] std::expected<std::optional<std::string>, Error> Release() const;
    [[nodiscard]] std::expected<std::optional<std::string>, Error> Codename() const;

    friend void AttestDescribe(Tag<SystemInfo>, ResourceBuilder<SystemInfo> &);

  private:
    [[nodiscard]] std::expected<std::optional<std::string>, Error> OsRelease(std::string_view key) const;
  };

  // Value of `key` in os-release formatted `text`, with surrounding quotes removed.
  [[nodiscard]] ATTEST_API std::optional<std::string> FindOsReleaseValue(std::string_view text, std::string_view key);

} // namespace Attest::Resources

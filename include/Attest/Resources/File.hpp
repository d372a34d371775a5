// File.hpp
// Filesystem entry: type, ownership, permissions and content
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API File : public Resource
  {
  public:
    File(BackendPtr backend, std::string name);

    [[nodiscard]] std::expected<bool, Error> Exists() const;
    [[nodiscard]] std::expected<bool, Error> IsFile() const;
    [[nodiscard]] std::expected<bool, Error> IsDirectory() const;
    [[nodiscard]] std::expected<bool, Error> IsSymlink() const;

    [[nodiscard]] std::expected<std::string, Error> UserName() const;
    [[nodiscard]] std::expected<std::string, Error> GroupName() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Uid() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Gid() const;
    // Permission bits as a number, e.g. 0644 -> 420.
    [[nodiscard]] std::expected<std::int64_t, Error> Mode() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Size() const;
    [[nodiscard]] std::expected<std::string, Error> ContentString() const;
    [[nodiscard]] std::expected<std::string, Error> LinkedTo() const;

    // True when a line of the file matches the basic regular expression `pattern`.
    [[nodiscard]] std::expected<bool, Error> Contains(std::string pattern) const;

    friend void AttestDescribe(Tag<File>, ResourceBuilder<File> &);

  private:
    [[nodiscard]] std::expected<bool, Error> Test(char flag) const;
    [[nodiscard]] std::string Stat(std::string_view format) const;
  };

} // namespace Attest::Resources

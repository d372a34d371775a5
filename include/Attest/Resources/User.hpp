// User.hpp
// Local account database entries
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API User : public Resource
  {
  public:
    User(BackendPtr backend, std::string name);

    [[nodiscard]] std::expected<bool, Error> Exists() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Uid() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Gid() const;
    [[nodiscard]] std::expected<std::string, Error> PrimaryGroup() const;
    [[nodiscard]] std::expected<std::vector<std::string>, Error> Groups() const;
    [[nodiscard]] std::expected<std::string, Error> Home() const;
    [[nodiscard]] std::expected<std::string, Error> Shell() const;

    friend void AttestDescribe(Tag<User>, ResourceBuilder<User> &);

  private:
    // Field `index` (0-based) of the passwd entry.
    [[nodiscard]] std::expected<std::string, Error> PasswdField(std::size_t index) const;
  };

  class ATTEST_API Group : public Resource
  {
  public:
    Group(BackendPtr backend, std::string name);

    [[nodiscard]] std::expected<bool, Error> Exists() const;
    [[nodiscard]] std::expected<std::int64_t, Error> Gid() const;

    friend void AttestDescribe(Tag<Group>, ResourceBuilder<Group> &);
  };

  // ':'-separated fields of a getent line.
  [[nodiscard]] ATTEST_API std::vector<std::string> SplitEntry(std::string_view line);

} // namespace Attest::Resources

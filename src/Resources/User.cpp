#include <Attest/Resources/User.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

#include <charconv>

namespace Attest::Resources
{

  std::vector<std::string> SplitEntry(std::string_view line)
  {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true)
    {
      const auto end = line.find(':', start);
      fields.emplace_back(line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
      if (end == std::string_view::npos)
        break;
      start = end + 1;
    }
    return fields;
  }

  // User

  User::User(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name)) {}

  std::expected<bool, Error> User::Exists() const
  {
    return RunTest(fmt::format("id {}", ShellQuote(m_name)));
  }

  std::expected<std::int64_t, Error> User::Uid() const { return CheckInteger(fmt::format("id -u {}", ShellQuote(m_name))); }

  std::expected<std::int64_t, Error> User::Gid() const { return CheckInteger(fmt::format("id -g {}", ShellQuote(m_name))); }

  std::expected<std::string, Error> User::PrimaryGroup() const
  {
    return CheckOutput(fmt::format("id -gn {}", ShellQuote(m_name)));
  }

  std::expected<std::vector<std::string>, Error> User::Groups() const
  {
    auto out = CheckOutput(fmt::format("id -Gn {}", ShellQuote(m_name)));
    if (!out)
      return std::unexpected(out.error());
    return SplitFields(*out);
  }

  std::expected<std::string, Error> User::PasswdField(std::size_t index) const
  {
    auto out = CheckOutput(fmt::format("getent passwd {}", ShellQuote(m_name)));
    if (!out)
      return std::unexpected(out.error());
    const auto fields = SplitEntry(*out);
    if (fields.size() <= index)
      return std::unexpected(Error{ErrorCode::ProviderFailure,
                                   fmt::format("malformed passwd entry for {}", m_name)});
    return fields[index];
  }

  std::expected<std::string, Error> User::Home() const { return PasswdField(5); }

  std::expected<std::string, Error> User::Shell() const { return PasswdField(6); }

  void AttestDescribe(Tag<User>, ResourceBuilder<User> &b)
  {
    b.SetName("User");
    b.Description("Identity, groups, home and shell of a local account");
    b.Constructor();
    b.Property<&User::Exists>("exists");
    b.Property<&User::Uid>("uid");
    b.Property<&User::Gid>("gid");
    b.Property<&User::PrimaryGroup>("group");
    b.Property<&User::Groups>("groups");
    b.Property<&User::Home>("home");
    b.Property<&User::Shell>("shell");
  }

  // Group

  Group::Group(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name)) {}

  std::expected<bool, Error> Group::Exists() const
  {
    // getent exits 2 for an unknown key
    return RunTest(fmt::format("getent group {}", ShellQuote(m_name)), {2});
  }

  std::expected<std::int64_t, Error> Group::Gid() const
  {
    auto out = CheckOutput(fmt::format("getent group {}", ShellQuote(m_name)));
    if (!out)
      return std::unexpected(out.error());
    const auto fields = SplitEntry(*out);
    std::int64_t gid = 0;
    if (fields.size() >= 3)
    {
      const auto &text = fields[2];
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), gid);
      if (!text.empty() && ec == std::errc{} && ptr == text.data() + text.size())
        return gid;
    }
    return std::unexpected(Error{ErrorCode::ProviderFailure, fmt::format("malformed group entry for {}", m_name)});
  }

  void AttestDescribe(Tag<Group>, ResourceBuilder<Group> &b)
  {
    b.SetName("Group");
    b.Description("Existence and id of a local group");
    b.Constructor();
    b.Property<&Group::Exists>("exists");
    b.Property<&Group::Gid>("gid");
  }

} // namespace Attest::Resources

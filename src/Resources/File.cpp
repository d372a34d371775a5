#include <Attest/Resources/File.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

namespace Attest::Resources
{

  File::File(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name)) {}

  std::expected<bool, Error> File::Test(char flag) const
  {
    return RunTest(fmt::format("test -{} {}", flag, ShellQuote(m_name)));
  }

  std::string File::Stat(std::string_view format) const
  {
    return fmt::format("stat -c {} {}", format, ShellQuote(m_name));
  }

  std::expected<bool, Error> File::Exists() const { return Test('e'); }
  std::expected<bool, Error> File::IsFile() const { return Test('f'); }
  std::expected<bool, Error> File::IsDirectory() const { return Test('d'); }
  std::expected<bool, Error> File::IsSymlink() const { return Test('L'); }

  std::expected<std::string, Error> File::UserName() const { return CheckOutput(Stat("%U")); }
  std::expected<std::string, Error> File::GroupName() const { return CheckOutput(Stat("%G")); }
  std::expected<std::int64_t, Error> File::Uid() const { return CheckInteger(Stat("%u")); }
  std::expected<std::int64_t, Error> File::Gid() const { return CheckInteger(Stat("%g")); }
  std::expected<std::int64_t, Error> File::Mode() const { return CheckInteger(Stat("%a"), 8); }
  std::expected<std::int64_t, Error> File::Size() const { return CheckInteger(Stat("%s")); }

  std::expected<std::string, Error> File::ContentString() const
  {
    auto result = Run(fmt::format("cat -- {}", ShellQuote(m_name)));
    if (!result)
      return std::unexpected(result.error());
    if (!result->Succeeded())
      return std::unexpected(Error{ErrorCode::ProviderFailure, fmt::format("unable to read {}", m_name)});
    return std::move(result->stdoutText);
  }

  std::expected<std::string, Error> File::LinkedTo() const
  {
    return CheckOutput(fmt::format("readlink -f {}", ShellQuote(m_name)));
  }

  std::expected<bool, Error> File::Contains(std::string pattern) const
  {
    return RunTest(fmt::format("grep -qs -- {} {}", ShellQuote(pattern), ShellQuote(m_name)));
  }

  void AttestDescribe(Tag<File>, ResourceBuilder<File> &b)
  {
    b.SetName("File");
    b.Description("Type, ownership, permissions and content of a filesystem entry");
    b.Constructor();
    b.Property<&File::Exists>("exists");
    b.Property<&File::IsFile>("is_file");
    b.Property<&File::IsDirectory>("is_directory");
    b.Property<&File::IsSymlink>("is_symlink");
    b.Property<&File::UserName>("user");
    b.Property<&File::GroupName>("group");
    b.Property<&File::Uid>("uid");
    b.Property<&File::Gid>("gid");
    b.Property<&File::Mode>("mode");
    b.Property<&File::Size>("size");
    b.Property<&File::ContentString>("content_string");
    b.Property<&File::LinkedTo>("linked_to");
    b.Method<&File::Contains>("contains");
  }

} // namespace Attest::Resources

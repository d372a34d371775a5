#include <Attest/Resources/Package.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

namespace Attest::Resources
{

  Package::Package(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name)) {}

  bool Package::IsSupported(const Backend &backend)
  {
    return backend.HasCommand("dpkg-query") || backend.HasCommand("rpm");
  }

  bool Package::UsesDpkg() const { return GetBackend().HasCommand("dpkg-query"); }

  std::expected<bool, Error> Package::IsInstalled() const
  {
    if (!UsesDpkg())
      return RunTest(fmt::format("rpm -q --quiet {}", ShellQuote(m_name)));

    auto result = Run(fmt::format("dpkg-query -f '${{Status}}' -W {}", ShellQuote(m_name)));
    if (!result)
      return std::unexpected(result.error());
    if (result->exitStatus == 1)
      return false;
    if (!result->Succeeded())
      return std::unexpected(Error{ErrorCode::ProviderFailure,
                                   fmt::format("dpkg-query exited with status {}", result->exitStatus)});
    // "install ok installed", "hold ok installed"
    const auto status = SplitFields(result->stdoutText);
    return status.size() >= 3 && status[1] == "ok" && status[2] == "installed";
  }

  std::expected<std::string, Error> Package::Version() const
  {
    if (UsesDpkg())
      return CheckOutput(fmt::format("dpkg-query -f '${{Version}}' -W {}", ShellQuote(m_name)));
    return CheckOutput(fmt::format("rpm -q --queryformat '%{{VERSION}}' {}", ShellQuote(m_name)));
  }

  void AttestDescribe(Tag<Package>, ResourceBuilder<Package> &b)
  {
    b.SetName("Package");
    b.Description("Installed state and version of a system package");
    b.Constructor();
    b.Property<&Package::IsInstalled>("is_installed");
    b.Property<&Package::Version>("version");
    b.SupportedWhen<&Package::IsSupported>();
  }

} // namespace Attest::Resources

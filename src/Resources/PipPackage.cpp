#include <Attest/Resources/PipPackage.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

namespace Attest::Resources
{

  PipPackage::PipPackage(BackendPtr backend, std::string name, std::string pipPath)
      : Resource(std::move(backend), std::move(name)), m_pipPath(std::move(pipPath))
  {
  }

  std::expected<bool, Error> PipPackage::IsInstalled() const
  {
    return RunTest(fmt::format("{} show {}", ShellQuote(m_pipPath), ShellQuote(m_name)));
  }

  std::expected<std::string, Error> PipPackage::Version() const
  {
    auto out = CheckOutput(fmt::format("{} show {}", ShellQuote(m_pipPath), ShellQuote(m_name)));
    if (!out)
      return std::unexpected(out.error());
    constexpr std::string_view key = "Version:";
    for (const auto &line : SplitLines(*out))
    {
      if (line.starts_with(key))
      {
        const auto fields = SplitFields(std::string_view{line}.substr(key.size()));
        if (!fields.empty())
          return fields.front();
      }
    }
    return std::unexpected(Error{ErrorCode::ProviderFailure,
                                 fmt::format("pip did not report a version for {}", m_name)});
  }

  void AttestDescribe(Tag<PipPackage>, ResourceBuilder<PipPackage> &b)
  {
    b.SetName("PipPackage");
    b.Description("Installed state and version of a Python package");
    b.Constructor<std::string>(Parameter("pip_path", "pip"));
    b.Property<&PipPackage::IsInstalled>("is_installed");
    b.Property<&PipPackage::Version>("version");
  }

} // namespace Attest::Resources

#include <Attest/Backend.hpp>
#include <Attest/Log.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace Attest
{

  namespace
  {
    constexpr std::size_t kMaxOutputSize = 16 * 1024 * 1024;

    bool StartsWith(std::string_view s, std::string_view prefix)
    {
      return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    // The target reaches the launcher as an argument; a leading '-' would be read as an option.
    std::expected<void, Error> RejectOptionLikeTarget(std::string_view target)
    {
      if (StartsWith(target, "-"))
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "backend target " + std::string{target} + " must not start with '-'"});
      return {};
    }
  } // namespace

  std::string ShellQuote(std::string_view text)
  {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (const char c : text)
    {
      if (c == '\'')
        out += "'\\''";
      else
        out += c;
    }
    out += '\'';
    return out;
  }

  bool Backend::HasCommand(std::string_view program) const
  {
    auto r = Run("command -v " + ShellQuote(program) + " >/dev/null 2>&1");
    return r.has_value() && r->Succeeded();
  }

  std::expected<CommandResult, Error> LocalBackend::Run(std::string_view command) const
  {
    const std::string line = std::string{command} + " 2>/dev/null";
    ATTEST_LOG(Trace, "local: {}", line);
    FILE *pipe = popen(line.c_str(), "r");
    if (!pipe)
      return std::unexpected(Error{ErrorCode::ProviderFailure,
                                   "unable to spawn shell: " + std::string{std::strerror(errno)}});
    CommandResult result;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
    {
      if (result.stdoutText.size() < kMaxOutputSize)
        result.stdoutText.append(buffer, n);
    }
    const int status = pclose(pipe);
    if (status == -1)
      return std::unexpected(Error{ErrorCode::ProviderFailure,
                                   "unable to reap shell: " + std::string{std::strerror(errno)}});
    if (WIFEXITED(status))
      result.exitStatus = WEXITSTATUS(status);
    else
      result.exitStatus = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    return result;
  }

  WrappedBackend::WrappedBackend(std::string selector, std::vector<std::string> launcher, bool remoteShell)
      : m_selector(std::move(selector)), m_launcher(std::move(launcher)), m_remoteShell(remoteShell)
  {
  }

  std::expected<CommandResult, Error> WrappedBackend::Run(std::string_view command) const
  {
    std::string line;
    for (const auto &arg : m_launcher)
    {
      line += ShellQuote(arg);
      line += ' ';
    }
    const std::string wrapped = "/bin/sh -c " + ShellQuote(command);
    line += m_remoteShell ? ShellQuote(wrapped) : wrapped;
    return m_local.Run(line);
  }

  std::expected<BackendPtr, Error> MakeBackend(std::string_view selector)
  {
    if (selector.empty() || selector == kDefaultBackend)
      return std::make_shared<LocalBackend>();
    if (StartsWith(selector, "ssh://"))
    {
      auto target = selector.substr(6);
      if (target.empty())
        return std::unexpected(Error{ErrorCode::UnsupportedResource, "ssh backend requires a host"});
      if (auto bad = RejectOptionLikeTarget(target); !bad)
        return std::unexpected(bad.error());
      return std::make_shared<WrappedBackend>(std::string{selector},
                                              std::vector<std::string>{"ssh", "-o", "BatchMode=yes", "--", std::string{target}},
                                              true);
    }
    if (StartsWith(selector, "docker://"))
    {
      auto target = selector.substr(9);
      if (target.empty())
        return std::unexpected(Error{ErrorCode::UnsupportedResource, "docker backend requires a container"});
      if (auto bad = RejectOptionLikeTarget(target); !bad)
        return std::unexpected(bad.error());
      return std::make_shared<WrappedBackend>(std::string{selector},
                                              std::vector<std::string>{"docker", "exec", std::string{target}},
                                              false);
    }
    return std::unexpected(Error{ErrorCode::UnsupportedResource,
                                 "backend " + std::string{selector} + " is not supported"});
  }

} // namespace Attest

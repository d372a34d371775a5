// Backend.hpp
// Execution contexts that resource providers run their commands against
#pragma once

#include <Attest/Export.hpp>
#include <Attest/Types.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Attest
{

  inline constexpr std::string_view kDefaultBackend = "local://";

  struct CommandResult
  {
    int exitStatus{0};
    std::string stdoutText{};

    [[nodiscard]] bool Succeeded() const noexcept { return exitStatus == 0; }
  };

  /**
   * Backend
   *
   * Runs shell commands in one execution context (local host, remote host,
   * container). Implementations must be safe to call from several
   * verifications at once.
   */
  class ATTEST_API Backend
  {
  public:
    virtual ~Backend() = default;

    /** Selector this backend was created from, e.g. "local://" or "ssh://web01". */
    [[nodiscard]] virtual std::string_view Selector() const noexcept = 0;

    /** Run `command` through a POSIX shell and capture its standard output. */
    [[nodiscard]] virtual std::expected<CommandResult, Error> Run(std::string_view command) const = 0;

    /** True when `program` resolves on the backend's PATH. */
    [[nodiscard]] bool HasCommand(std::string_view program) const;
  };

  using BackendPtr = std::shared_ptr<const Backend>;

  class ATTEST_API LocalBackend final : public Backend
  {
  public:
    [[nodiscard]] std::string_view Selector() const noexcept override { return kDefaultBackend; }
    [[nodiscard]] std::expected<CommandResult, Error> Run(std::string_view command) const override;
  };

  // Wraps every command into a launcher invocation (ssh, docker exec) run locally.
  // A launcher that hands its arguments to a remote shell as one string (ssh)
  // needs the wrapped command quoted a second time.
  class ATTEST_API WrappedBackend final : public Backend
  {
  public:
    WrappedBackend(std::string selector, std::vector<std::string> launcher, bool remoteShell);

    [[nodiscard]] std::string_view Selector() const noexcept override { return m_selector; }
    [[nodiscard]] std::expected<CommandResult, Error> Run(std::string_view command) const override;

  private:
    std::string m_selector;
    std::vector<std::string> m_launcher;
    bool m_remoteShell{false};
    LocalBackend m_local;
  };

  // "local://", "ssh://[user@]host", "docker://container".
  [[nodiscard]] ATTEST_API std::expected<BackendPtr, Error> MakeBackend(std::string_view selector);

  // Single-quote `text` for /bin/sh.
  [[nodiscard]] ATTEST_API std::string ShellQuote(std::string_view text);

} // namespace Attest

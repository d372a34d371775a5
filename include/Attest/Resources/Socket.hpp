// Socket.hpp
// Listening sockets: "tcp://[host:]port", "udp://[host:]port", "unix:///path"
#pragma once

#include <optional>

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API Socket : public Resource
  {
  public:
    Socket(BackendPtr backend, std::string name);

    // Construction fails with the parse error of a malformed socket spec.
    [[nodiscard]] std::expected<void, Error> Validate() const;

    [[nodiscard]] std::expected<bool, Error> IsListening() const;

    [[nodiscard]] const std::string &Protocol() const noexcept { return m_protocol; }
    [[nodiscard]] const std::optional<std::string> &Host() const noexcept { return m_host; }
    [[nodiscard]] std::optional<std::int64_t> Port() const noexcept { return m_port; }
    [[nodiscard]] const std::optional<std::string> &Path() const noexcept { return m_path; }

    [[nodiscard]] static bool IsSupported(const Backend &backend);

    friend void AttestDescribe(Tag<Socket>, ResourceBuilder<Socket> &);

  private:
    void Parse();

    std::string m_protocol;
    std::optional<std::string> m_host;
    std::optional<std::int64_t> m_port;
    std::optional<std::string> m_path;
    std::optional<std::string> m_parseError;
  };

  // True when the local address column of `ss` output `line` matches the socket.
  [[nodiscard]] ATTEST_API bool MatchesListener(std::string_view line, const std::optional<std::string> &host,
                                                std::int64_t port);

} // namespace Attest::Resources

#include <Attest/Resources/Socket.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

#include <charconv>

namespace Attest::Resources
{

  namespace
  {
    bool IsWildcard(std::string_view host)
    {
      return host.empty() || host == "*" || host == "0.0.0.0" || host == "::";
    }

    std::string_view StripHost(std::string_view host)
    {
      if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
      if (const auto pct = host.find('%'); pct != std::string_view::npos)
        host = host.substr(0, pct);
      return host;
    }
  } // namespace

  Socket::Socket(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name))
  {
    Parse();
  }

  void Socket::Parse()
  {
    const std::string_view spec{m_name};
    const auto sep = spec.find("://");
    if (sep == std::string_view::npos)
    {
      m_parseError = fmt::format("Cannot validate protocol '{}'. Should be tcp, udp or unix", spec);
      return;
    }
    m_protocol = std::string{spec.substr(0, sep)};
    const auto rest = spec.substr(sep + 3);

    if (m_protocol == "unix")
    {
      if (rest.empty())
        m_parseError = fmt::format("Missing socket path in '{}'", spec);
      else
        m_path = std::string{rest};
      return;
    }
    if (m_protocol != "tcp" && m_protocol != "udp")
    {
      m_parseError = fmt::format("Cannot validate protocol '{}'. Should be tcp, udp or unix", m_protocol);
      return;
    }

    std::string_view portText = rest;
    if (const auto colon = rest.rfind(':'); colon != std::string_view::npos)
    {
      const auto host = StripHost(rest.substr(0, colon));
      if (!host.empty())
        m_host = std::string{host};
      portText = rest.substr(colon + 1);
    }
    std::int64_t port = 0;
    const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (portText.empty() || ec != std::errc{} || ptr != portText.data() + portText.size() || port <= 0 || port > 65535)
    {
      m_parseError = fmt::format("Cannot validate port '{}' in '{}'", portText, spec);
      return;
    }
    m_port = port;
  }

  std::expected<void, Error> Socket::Validate() const
  {
    if (m_parseError)
      return std::unexpected(Error{ErrorCode::ResourceConstruction, *m_parseError});
    return {};
  }

  bool Socket::IsSupported(const Backend &backend) { return backend.HasCommand("ss"); }

  bool MatchesListener(std::string_view line, const std::optional<std::string> &host, std::int64_t port)
  {
    for (const auto &field : SplitFields(line))
    {
      const auto colon = field.rfind(':');
      if (colon == std::string::npos)
        continue;
      // First address-like column is the local address.
      const std::string_view local{field};
      if (local.substr(colon + 1) != std::to_string(port))
        return false;
      const auto localHost = StripHost(local.substr(0, colon));
      return !host || IsWildcard(localHost) || localHost == *host;
    }
    return false;
  }

  std::expected<bool, Error> Socket::IsListening() const
  {
    if (m_protocol == "unix")
    {
      auto out = CheckOutput("ss -H -l -n -x");
      if (!out)
        return std::unexpected(out.error());
      for (const auto &line : SplitLines(*out))
      {
        for (const auto &field : SplitFields(line))
        {
          if (field == *m_path)
            return true;
        }
      }
      return false;
    }

    auto out = CheckOutput(m_protocol == "tcp" ? "ss -H -l -n -t" : "ss -H -l -n -u");
    if (!out)
      return std::unexpected(out.error());
    for (const auto &line : SplitLines(*out))
    {
      if (MatchesListener(line, m_host, *m_port))
        return true;
    }
    return false;
  }

  void AttestDescribe(Tag<Socket>, ResourceBuilder<Socket> &b)
  {
    b.SetName("Socket");
    b.Description("Listening state of a TCP, UDP or UNIX socket");
    b.Constructor();
    b.Property<&Socket::IsListening>("is_listening");
    b.Field<&Socket::m_protocol>("protocol");
    b.Field<&Socket::m_host>("host");
    b.Field<&Socket::m_port>("port");
    b.Field<&Socket::m_path>("path");
    b.SupportedWhen<&Socket::IsSupported>();
  }

} // namespace Attest::Resources

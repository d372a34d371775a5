#include <Attest/Resources/Service.hpp>
#include <Attest/ResourceBuilder.hpp>

#include <fmt/format.h>

namespace Attest::Resources
{

  Service::Service(BackendPtr backend, std::string name) : Resource(std::move(backend), std::move(name)) {}

  bool Service::IsSupported(const Backend &backend) { return backend.HasCommand("systemctl"); }

  std::expected<bool, Error> Service::IsRunning() const
  {
    // 3: inactive, 4: no such unit
    return RunTest(fmt::format("systemctl is-active {}", ShellQuote(m_name)), {1, 3, 4});
  }

  std::expected<bool, Error> Service::IsEnabled() const
  {
    return RunTest(fmt::format("systemctl is-enabled {}", ShellQuote(m_name)), {1, 4});
  }

  void AttestDescribe(Tag<Service>, ResourceBuilder<Service> &b)
  {
    b.SetName("Service");
    b.Description("Running and enabled state of a systemd service");
    b.Constructor();
    b.Property<&Service::IsRunning>("is_running");
    b.Property<&Service::IsEnabled>("is_enabled");
    b.SupportedWhen<&Service::IsSupported>();
  }

} // namespace Attest::Resources

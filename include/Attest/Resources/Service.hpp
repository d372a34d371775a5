// Service.hpp
// systemd unit state
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API Service : public Resource
  {
  public:
    Service(BackendPtr backend, std::string name);

    [[nodiscard]] std::expected<bool, Error> IsRunning() const;
    [[nodiscard]] std::expected<bool, Error> IsEnabled() const;

    [[nodiscard]] static bool IsSupported(const Backend &backend);

    friend void AttestDescribe(Tag<Service>, ResourceBuilder<Service> &);
  };

} // namespace Attest::Resources

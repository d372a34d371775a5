// Package.hpp
// System package state through dpkg or rpm
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API Package : public Resource
  {
  public:
    Package(BackendPtr backend, std::string name);

    [[nodiscard]] std::expected<bool, Error> IsInstalled() const;
    [[nodiscard]] std::expected<std::string, Error> Version() const;

    [[nodiscard]] static bool IsSupported(const Backend &backend);

    friend void AttestDescribe(Tag<Package>, ResourceBuilder<Package> &);

  private:
    [[nodiscard]] bool UsesDpkg() const;
  };

} // namespace Attest::Resources

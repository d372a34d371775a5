// PipPackage.hpp
// Python package state through a pip executable
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Resources/Resource.hpp>

namespace Attest::Resources
{

  class ATTEST_API PipPackage : public Resource
  {
  public:
    PipPackage(BackendPtr backend, std::string name, std::string pipPath);

    [[nodiscard]] std::expected<bool, Error> IsInstalled() const;
    [[nodiscard]] std::expected<std::string, Error> Version() const;

    [[nodiscard]] const std::string &PipPath() const noexcept { return m_pipPath; }

    friend void AttestDescribe(Tag<PipPackage>, ResourceBuilder<PipPackage> &);

  private:
    std::string m_pipPath;
  };

} // namespace Attest::Resources

// EntryPoints.hpp
// One verification entry point per registered resource type, named after it
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <Attest/Backend.hpp>
#include <Attest/Binding.hpp>
#include <Attest/Dispatcher.hpp>
#include <Attest/Export.hpp>

namespace Attest
{

  using EntryPointFn = std::function<ExpectedReport(std::string_view subject, const CheckList &checks)>;

  struct EntryPoint
  {
    std::string name;
    std::string_view description;
    EntryPointFn run;
  };

  /**
   * EntryPointTable
   *
   * Snapshot of the provider directory taken at build time. Each entry runs
   * VerifyResource with its resource name and the table's backend bound in.
   * Read-only once built.
   */
  class ATTEST_API EntryPointTable
  {
  public:
    [[nodiscard]] static EntryPointTable Build(std::string backend = std::string{kDefaultBackend});

    [[nodiscard]] const EntryPoint *Find(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string_view> Names() const;
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }
    [[nodiscard]] std::string_view BackendSelector() const noexcept { return m_backend; }

  private:
    explicit EntryPointTable(std::string backend);

    std::string m_backend;
    NGIN::Containers::Vector<EntryPoint> m_entries;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_index;
  };

  // Registers the built-in providers, then builds the process-wide table once.
  [[nodiscard]] ATTEST_API const EntryPointTable &EntryPoints();

} // namespace Attest

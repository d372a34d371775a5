// Resource.hpp
// Shared base for the built-in providers: a backend plus the subject name
#pragma once

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <Attest/Backend.hpp>
#include <Attest/Export.hpp>
#include <Attest/Types.hpp>

namespace Attest::Resources
{

  class ATTEST_API Resource
  {
  public:
    Resource(BackendPtr backend, std::string name);

    [[nodiscard]] const std::string &Name() const noexcept { return m_name; }
    [[nodiscard]] const Backend &GetBackend() const noexcept { return *m_backend; }

  protected:
    [[nodiscard]] std::expected<CommandResult, Error> Run(std::string_view command) const;

    // Exit 0 is true, an exit status listed in `falseStatuses` is false, anything else is a ProviderFailure.
    [[nodiscard]] std::expected<bool, Error> RunTest(std::string_view command,
                                                     std::initializer_list<int> falseStatuses = {1}) const;

    // Standard output of a command that must succeed, trailing newlines removed.
    [[nodiscard]] std::expected<std::string, Error> CheckOutput(std::string_view command) const;

    [[nodiscard]] std::expected<std::int64_t, Error> CheckInteger(std::string_view command, int base = 10) const;

    BackendPtr m_backend;
    std::string m_name;
  };

  // Whitespace-separated fields.
  [[nodiscard]] ATTEST_API std::vector<std::string> SplitFields(std::string_view text);

  // Non-empty lines.
  [[nodiscard]] ATTEST_API std::vector<std::string> SplitLines(std::string_view text);

} // namespace Attest::Resources

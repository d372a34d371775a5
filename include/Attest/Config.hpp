// Config.hpp
// Declaration documents (YAML), run settings and YAML report output
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Attest/Backend.hpp>
#include <Attest/Binding.hpp>
#include <Attest/Dispatcher.hpp>
#include <Attest/Export.hpp>
#include <Attest/Log.hpp>
#include <Attest/Types.hpp>

namespace Attest
{

  struct Settings
  {
    std::string backend{kDefaultBackend};
    std::optional<LogLevel> logLevel{};
  };

  // One declared resource: `id` is the document key, `subject` its `name` entry (or the id).
  struct Declaration
  {
    std::string id;
    std::string resourceType;
    std::string subject;
    CheckList checks;
  };

  struct CheckDocument
  {
    Settings settings;
    std::vector<Declaration> declarations;
  };

  /**
   * Parse a declaration document.
   *
   *   settings:              # optional
   *     backend: ssh://web01
   *     log_level: debug
   *   checks:                # optional; without it every other top-level key is a declaration
   *     minion_is_installed:
   *       package:           # "attest.package" is accepted as well
   *         name: salt-minion
   *         is_installed: true
   *
   * A declaration body may also be a list of single-key maps. Malformed YAML
   * or an unexpected shape is an InvalidDocument error.
   */
  [[nodiscard]] ATTEST_API std::expected<CheckDocument, Error> ParseCheckDocument(std::string_view text);
  [[nodiscard]] ATTEST_API std::expected<CheckDocument, Error> LoadCheckDocument(const std::string &path);

  // Installs the document's log level, if any.
  ATTEST_API void ApplySettings(const Settings &settings);

  struct RunRecord
  {
    std::string id;
    std::string resourceType;
    std::string subject;
    VerificationReport report;
    // Set when the declaration could not be verified at all (construction failure).
    std::optional<Error> error;
  };

  [[nodiscard]] ATTEST_API std::string EmitReportYaml(const std::vector<RunRecord> &records);

} // namespace Attest

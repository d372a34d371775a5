#include <Attest/Attest.hpp>

#include <fmt/format.h>

#include <expected>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
  constexpr int kExitSuccess = 0;
  constexpr int kExitFailed = 1;
  constexpr int kExitError = 2;

  struct Options
  {
    std::string document;
    std::optional<std::string> backend;
    std::optional<Attest::LogLevel> logLevel;
    bool list{false};
  };

  void PrintUsage(std::ostream &os)
  {
    os << "usage: attest-check <document> [--backend SELECTOR] [--log-level LEVEL]\n"
          "       attest-check --list\n";
  }

  std::expected<Options, std::string> ParseArguments(int argc, char **argv)
  {
    Options opts;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg{argv[i]};
      if (arg == "--list")
      {
        opts.list = true;
      }
      else if (arg == "--backend" || arg == "--log-level")
      {
        if (i + 1 >= argc)
          return std::unexpected(fmt::format("{} requires a value", arg));
        const std::string_view value{argv[++i]};
        if (arg == "--backend")
        {
          opts.backend = std::string{value};
        }
        else
        {
          opts.logLevel = Attest::ParseLogLevel(value);
          if (!opts.logLevel)
            return std::unexpected(fmt::format("unknown log level '{}'", value));
        }
      }
      else if (arg.starts_with("--"))
      {
        return std::unexpected(fmt::format("unknown option {}", arg));
      }
      else if (opts.document.empty())
      {
        opts.document = std::string{arg};
      }
      else
      {
        return std::unexpected(fmt::format("unexpected argument {}", arg));
      }
    }
    if (!opts.list && opts.document.empty())
      return std::unexpected(std::string{"no document given"});
    return opts;
  }
} // namespace

int main(int argc, char **argv)
{
  auto opts = ParseArguments(argc, argv);
  if (!opts)
  {
    std::cerr << "attest-check: " << opts.error() << "\n";
    PrintUsage(std::cerr);
    return kExitError;
  }

  if (opts->list)
  {
    const auto &table = Attest::EntryPoints();
    for (const auto name : table.Names())
      std::cout << fmt::format("{:<14}{}\n", name, table.Find(name)->description);
    return kExitSuccess;
  }

  auto doc = Attest::LoadCheckDocument(opts->document);
  if (!doc)
  {
    std::cerr << "attest-check: " << doc.error().message << "\n";
    return kExitError;
  }
  Attest::ApplySettings(doc->settings);
  if (opts->logLevel)
    Attest::SetLogLevel(*opts->logLevel);
  const auto backend = opts->backend.value_or(doc->settings.backend);

  Attest::RegisterBuiltinResources();
  const auto table = Attest::EntryPointTable::Build(backend);

  std::vector<Attest::RunRecord> records;
  int status = kExitSuccess;
  for (const auto &decl : doc->declarations)
  {
    Attest::RunRecord record{decl.id, decl.resourceType, decl.subject, {}, std::nullopt};
    const auto *entry = table.Find(decl.resourceType);
    if (!entry)
    {
      // Unknown resource types are reported like unsupported ones.
      record.report.success = false;
      ATTEST_LOG(Error, "{}: no resource type named {}", decl.id, decl.resourceType);
    }
    else if (auto report = entry->run(decl.subject, decl.checks))
    {
      record.report = std::move(*report);
    }
    else
    {
      record.error = report.error();
      status = kExitError;
    }
    if (!record.report.success && status == kExitSuccess)
      status = kExitFailed;
    records.push_back(std::move(record));
  }

  std::cout << Attest::EmitReportYaml(records) << "\n";
  return status;
}

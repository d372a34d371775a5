#include <Attest/Config.hpp>

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <utility>

namespace Attest
{

  namespace
  {
    constexpr std::string_view kResourcePrefix = "attest.";

    std::unexpected<Error> Invalid(std::string message)
    {
      return std::unexpected(Error{ErrorCode::InvalidDocument, std::move(message)});
    }

    bool IsNullScalar(const std::string &s)
    {
      return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
    }

    // Plain scalars are typed; quoted scalars (tag "!") stay strings.
    Value ScalarToValue(const YAML::Node &node)
    {
      const auto &text = node.Scalar();
      if (node.Tag() == "!")
        return Value{text};
      if (IsNullScalar(text))
        return Value{};
      bool flag = false;
      if (YAML::convert<bool>::decode(node, flag))
        return Value{flag};
      long long integer = 0;
      if (YAML::convert<long long>::decode(node, integer))
        return Value{integer};
      double number = 0.0;
      if (YAML::convert<double>::decode(node, number))
        return Value{number};
      return Value{text};
    }

    Value NodeToValue(const YAML::Node &node)
    {
      switch (node.Type())
      {
        case YAML::NodeType::Scalar: return ScalarToValue(node);
        case YAML::NodeType::Sequence:
        {
          ValueList list;
          list.reserve(node.size());
          for (const auto &item : node)
            list.push_back(NodeToValue(item));
          return Value{std::move(list)};
        }
        case YAML::NodeType::Map:
        {
          ValueMap map;
          for (const auto &entry : node)
            map.emplace_back(entry.first.as<std::string>(), NodeToValue(entry.second));
          return Value{std::move(map)};
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default: break;
      }
      return Value{};
    }

    std::expected<Settings, Error> ParseSettings(const YAML::Node &node)
    {
      Settings settings;
      if (!node || node.IsNull())
        return settings;
      if (!node.IsMap())
        return Invalid("settings must be a mapping");
      if (const auto backend = node["backend"])
      {
        if (!backend.IsScalar())
          return Invalid("settings.backend must be a string");
        settings.backend = backend.Scalar();
      }
      if (const auto level = node["log_level"])
      {
        const auto parsed = level.IsScalar() ? ParseLogLevel(level.Scalar()) : std::nullopt;
        if (!parsed)
          return Invalid(fmt::format("settings.log_level: unknown level '{}'", level.IsScalar() ? level.Scalar() : ""));
        settings.logLevel = parsed;
      }
      return settings;
    }

    // Adds one (name, expectation) entry; the `name` entry becomes the subject.
    std::expected<void, Error> AddEntry(Declaration &decl, const YAML::Node &key, const YAML::Node &value)
    {
      if (!key.IsScalar())
        return Invalid(fmt::format("{}: check names must be strings", decl.id));
      const auto &name = key.Scalar();
      if (name == "name")
      {
        if (!value.IsScalar())
          return Invalid(fmt::format("{}: name must be a scalar", decl.id));
        decl.subject = value.Scalar();
        return {};
      }
      decl.checks.emplace_back(name, NodeToValue(value));
      return {};
    }

    std::expected<Declaration, Error> ParseDeclaration(const std::string &id, const YAML::Node &node)
    {
      if (!node.IsMap() || node.size() != 1)
        return Invalid(fmt::format("{}: a declaration maps exactly one resource type to its checks", id));
      const auto entry = *node.begin();
      if (!entry.first.IsScalar())
        return Invalid(fmt::format("{}: the resource type must be a string", id));

      Declaration decl;
      decl.id = id;
      std::string_view type = entry.first.Scalar();
      if (type.starts_with(kResourcePrefix))
        type.remove_prefix(kResourcePrefix.size());
      if (type.empty())
        return Invalid(fmt::format("{}: empty resource type", id));
      decl.resourceType = std::string{type};
      decl.subject = id;

      const auto &body = entry.second;
      if (body.IsMap())
      {
        for (const auto &check : body)
        {
          if (auto added = AddEntry(decl, check.first, check.second); !added)
            return std::unexpected(added.error());
        }
      }
      else if (body.IsSequence())
      {
        for (const auto &item : body)
        {
          if (!item.IsMap() || item.size() != 1)
            return Invalid(fmt::format("{}: list entries must be single-key mappings", id));
          const auto check = *item.begin();
          if (auto added = AddEntry(decl, check.first, check.second); !added)
            return std::unexpected(added.error());
        }
      }
      else if (!body.IsNull())
      {
        return Invalid(fmt::format("{}: checks must be a mapping or a list", id));
      }
      return decl;
    }

    std::expected<CheckDocument, Error> ParseRoot(const YAML::Node &root)
    {
      CheckDocument doc;
      if (!root || root.IsNull())
        return doc;
      if (!root.IsMap())
        return Invalid("the document root must be a mapping");

      auto settings = ParseSettings(root["settings"]);
      if (!settings)
        return std::unexpected(settings.error());
      doc.settings = std::move(*settings);

      const auto checks = root["checks"];
      const auto &declarations = checks ? checks : root;
      if (!declarations.IsNull() && !declarations.IsMap())
        return Invalid("checks must be a mapping of declaration ids");
      for (const auto &entry : declarations)
      {
        if (!entry.first.IsScalar())
          return Invalid("declaration ids must be strings");
        const auto &id = entry.first.Scalar();
        if (!checks && (id == "settings"))
          continue;
        auto decl = ParseDeclaration(id, entry.second);
        if (!decl)
          return std::unexpected(decl.error());
        doc.declarations.push_back(std::move(*decl));
      }
      return doc;
    }

    void EmitValue(YAML::Emitter &out, const Value &value)
    {
      switch (value.Kind())
      {
        case ValueKind::None: out << YAML::Null; break;
        case ValueKind::Bool: out << *value.AsBool(); break;
        case ValueKind::Int: out << *value.AsInt(); break;
        case ValueKind::Float: out << *value.AsFloat(); break;
        case ValueKind::String: out << *value.AsString(); break;
        case ValueKind::List:
          out << YAML::Flow << YAML::BeginSeq;
          for (const auto &item : *value.AsList())
            EmitValue(out, item);
          out << YAML::EndSeq;
          break;
        case ValueKind::Map:
          out << YAML::Flow << YAML::BeginMap;
          for (const auto &[key, item] : *value.AsMap())
          {
            out << YAML::Key << key << YAML::Value;
            EmitValue(out, item);
          }
          out << YAML::EndMap;
          break;
        default: break;
      }
    }

    void EmitMessages(YAML::Emitter &out, std::string_view key, const std::vector<std::string> &messages)
    {
      out << YAML::Key << std::string{key} << YAML::Value << YAML::BeginSeq;
      for (const auto &m : messages)
        out << m;
      out << YAML::EndSeq;
    }
  } // namespace

  std::expected<CheckDocument, Error> ParseCheckDocument(std::string_view text)
  {
    try
    {
      return ParseRoot(YAML::Load(std::string{text}));
    }
    catch (const YAML::Exception &e)
    {
      return Invalid(fmt::format("malformed document: {}", e.what()));
    }
  }

  std::expected<CheckDocument, Error> LoadCheckDocument(const std::string &path)
  {
    try
    {
      return ParseRoot(YAML::LoadFile(path));
    }
    catch (const YAML::BadFile &)
    {
      return Invalid(fmt::format("unable to read {}", path));
    }
    catch (const YAML::Exception &e)
    {
      return Invalid(fmt::format("{}: {}", path, e.what()));
    }
  }

  void ApplySettings(const Settings &settings)
  {
    if (settings.logLevel)
      SetLogLevel(*settings.logLevel);
  }

  std::string EmitReportYaml(const std::vector<RunRecord> &records)
  {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto &record : records)
    {
      out << YAML::BeginMap;
      out << YAML::Key << "id" << YAML::Value << record.id;
      out << YAML::Key << "resource" << YAML::Value << record.resourceType;
      out << YAML::Key << "subject" << YAML::Value << record.subject;
      if (record.error)
      {
        out << YAML::Key << "success" << YAML::Value << false;
        out << YAML::Key << "error" << YAML::Value << record.error->message;
      }
      else
      {
        out << YAML::Key << "success" << YAML::Value << record.report.success;
        EmitMessages(out, "passed", record.report.passed);
        EmitMessages(out, "failed", record.report.failed);
        out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;
        for (const auto &r : record.report.results)
        {
          out << YAML::BeginMap;
          out << YAML::Key << "member" << YAML::Value << r.member;
          out << YAML::Key << "expectation" << YAML::Value;
          EmitValue(out, r.expectation);
          if (r.actual)
          {
            out << YAML::Key << "actual" << YAML::Value;
            EmitValue(out, *r.actual);
          }
          if (r.error)
            out << YAML::Key << "error" << YAML::Value << r.error->message;
          out << YAML::Key << "passed" << YAML::Value << r.passed;
          out << YAML::EndMap;
        }
        out << YAML::EndSeq;
      }
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    return std::string{out.c_str()};
  }

} // namespace Attest

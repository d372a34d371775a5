#include <Attest/Value.hpp>

#include <fmt/format.h>

#include <iterator>

namespace Attest
{

  std::string_view KindName(ValueKind kind) noexcept
  {
    switch (kind)
    {
      case ValueKind::None: return "none";
      case ValueKind::Bool: return "bool";
      case ValueKind::Int: return "int";
      case ValueKind::Float: return "float";
      case ValueKind::String: return "string";
      case ValueKind::List: return "list";
      case ValueKind::Map: return "map";
      default: break;
    }
    return "unknown";
  }

  double Value::ToNumber() const noexcept
  {
    if (const auto *b = AsBool())
      return *b ? 1.0 : 0.0;
    if (const auto *i = AsInt())
      return static_cast<double>(*i);
    if (const auto *f = AsFloat())
      return *f;
    return 0.0;
  }

  const Value *Value::Find(std::string_view key) const noexcept
  {
    const auto *map = AsMap();
    if (!map)
      return nullptr;
    return FindEntry(*map, key);
  }

  const Value *FindEntry(const ValueMap &map, std::string_view key) noexcept
  {
    for (const auto &entry : map)
    {
      if (entry.first == key)
        return &entry.second;
    }
    return nullptr;
  }

  namespace
  {
    void AppendTo(std::string &out, const Value &value)
    {
      switch (value.Kind())
      {
        case ValueKind::None:
          out += "null";
          break;
        case ValueKind::Bool:
          out += *value.AsBool() ? "true" : "false";
          break;
        case ValueKind::Int:
          fmt::format_to(std::back_inserter(out), "{}", *value.AsInt());
          break;
        case ValueKind::Float:
          fmt::format_to(std::back_inserter(out), "{}", *value.AsFloat());
          break;
        case ValueKind::String:
        {
          const auto &s = *value.AsString();
          if (s.empty())
            out += "''";
          else
            out += s;
          break;
        }
        case ValueKind::List:
        {
          const auto &list = *value.AsList();
          out += '[';
          for (std::size_t i = 0; i < list.size(); ++i)
          {
            if (i > 0)
              out += ", ";
            AppendTo(out, list[i]);
          }
          out += ']';
          break;
        }
        case ValueKind::Map:
        {
          const auto &map = *value.AsMap();
          out += '{';
          for (std::size_t i = 0; i < map.size(); ++i)
          {
            if (i > 0)
              out += ", ";
            out += map[i].first;
            out += ": ";
            AppendTo(out, map[i].second);
          }
          out += '}';
          break;
        }
      }
    }
  } // namespace

  std::string ToString(const Value &value)
  {
    std::string out;
    AppendTo(out, value);
    return out;
  }

} // namespace Attest

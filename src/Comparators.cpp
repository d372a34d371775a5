#include <Attest/Comparators.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <regex>
#include <string>

namespace Attest
{

  namespace
  {
    NGIN::UInt64 HashName(std::string_view name)
    {
      return NGIN::Hashing::FNV1a64(name.data(), name.size());
    }

    bool IsIntegral(const Value &v) noexcept { return v.IsBool() || v.IsInt(); }

    std::int64_t IntegralOf(const Value &v) noexcept
    {
      if (const auto *b = v.AsBool())
        return *b ? 1 : 0;
      return *v.AsInt();
    }

    Error Unorderable(std::string_view op, const Value &a, const Value &b)
    {
      return Error{ErrorCode::InvalidArgument,
                   fmt::format("'{}' not supported between {} and {}", op, KindName(a.Kind()), KindName(b.Kind()))};
    }

    std::expected<std::partial_ordering, Error> Order(std::string_view op, const Value &a, const Value &b)
    {
      if (a.IsNumeric() && b.IsNumeric())
      {
        if (IsIntegral(a) && IsIntegral(b))
          return IntegralOf(a) <=> IntegralOf(b);
        return a.ToNumber() <=> b.ToNumber();
      }
      if (a.IsString() && b.IsString())
        return *a.AsString() <=> *b.AsString();
      if (a.IsList() && b.IsList())
      {
        const auto &la = *a.AsList();
        const auto &lb = *b.AsList();
        for (std::size_t i = 0; i < la.size() && i < lb.size(); ++i)
        {
          if (LooseEquals(la[i], lb[i]))
            continue;
          return Order(op, la[i], lb[i]);
        }
        return la.size() <=> lb.size();
      }
      return std::unexpected(Unorderable(op, a, b));
    }

    std::expected<bool, Error> CmpEq(const Value &expected, const Value &actual)
    {
      return LooseEquals(expected, actual);
    }

    std::expected<bool, Error> CmpNe(const Value &expected, const Value &actual)
    {
      return !LooseEquals(expected, actual);
    }

    std::expected<bool, Error> CmpLt(const Value &expected, const Value &actual)
    {
      auto o = Order("<", expected, actual);
      if (!o)
        return std::unexpected(o.error());
      return *o == std::partial_ordering::less;
    }

    std::expected<bool, Error> CmpLe(const Value &expected, const Value &actual)
    {
      auto o = Order("<=", expected, actual);
      if (!o)
        return std::unexpected(o.error());
      return *o == std::partial_ordering::less || *o == std::partial_ordering::equivalent;
    }

    std::expected<bool, Error> CmpGt(const Value &expected, const Value &actual)
    {
      auto o = Order(">", expected, actual);
      if (!o)
        return std::unexpected(o.error());
      return *o == std::partial_ordering::greater;
    }

    std::expected<bool, Error> CmpGe(const Value &expected, const Value &actual)
    {
      auto o = Order(">=", expected, actual);
      if (!o)
        return std::unexpected(o.error());
      return *o == std::partial_ordering::greater || *o == std::partial_ordering::equivalent;
    }

    std::expected<bool, Error> CmpIs(const Value &expected, const Value &actual)
    {
      return expected == actual;
    }

    std::expected<bool, Error> CmpIsNot(const Value &expected, const Value &actual)
    {
      return !(expected == actual);
    }

    // `actual in expected`
    std::expected<bool, Error> CmpContains(const Value &expected, const Value &actual)
    {
      if (const auto *list = expected.AsList())
      {
        for (const auto &item : *list)
        {
          if (LooseEquals(item, actual))
            return true;
        }
        return false;
      }
      if (const auto *text = expected.AsString())
      {
        const auto *needle = actual.AsString();
        if (!needle)
          return std::unexpected(Error{ErrorCode::InvalidArgument,
                                       fmt::format("'in <string>' requires a string operand, not {}", KindName(actual.Kind()))});
        return text->find(*needle) != std::string::npos;
      }
      if (const auto *map = expected.AsMap())
      {
        const auto *key = actual.AsString();
        return key != nullptr && FindEntry(*map, *key) != nullptr;
      }
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   fmt::format("argument of kind {} is not a container", KindName(expected.Kind()))});
    }

    // Pattern `expected` searched anywhere in `actual`.
    std::expected<bool, Error> CmpSearch(const Value &expected, const Value &actual)
    {
      const auto *pattern = expected.AsString();
      const auto *subject = actual.AsString();
      if (!pattern || !subject)
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     fmt::format("search expects a string pattern and a string subject, got {} and {}",
                                                 KindName(expected.Kind()), KindName(actual.Kind()))});
      try
      {
        const std::regex re{*pattern, std::regex::ECMAScript};
        return std::regex_search(*subject, re);
      }
      catch (const std::regex_error &e)
      {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     fmt::format("invalid search pattern '{}': {}", *pattern, e.what())});
      }
    }
  } // namespace

  bool LooseEquals(const Value &a, const Value &b)
  {
    if (a.IsNumeric() && b.IsNumeric())
    {
      if (IsIntegral(a) && IsIntegral(b))
        return IntegralOf(a) == IntegralOf(b);
      return a.ToNumber() == b.ToNumber();
    }
    if (a.Kind() != b.Kind())
      return false;
    if (const auto *la = a.AsList())
    {
      const auto &lb = *b.AsList();
      if (la->size() != lb.size())
        return false;
      for (std::size_t i = 0; i < la->size(); ++i)
      {
        if (!LooseEquals((*la)[i], lb[i]))
          return false;
      }
      return true;
    }
    if (const auto *ma = a.AsMap())
    {
      const auto &mb = *b.AsMap();
      if (ma->size() != mb.size())
        return false;
      for (const auto &[key, value] : *ma)
      {
        const Value *other = FindEntry(mb, key);
        if (!other || !LooseEquals(value, *other))
          return false;
      }
      return true;
    }
    return a == b;
  }

  const ComparatorRegistry &ComparatorRegistry::Default()
  {
    static const ComparatorRegistry registry{};
    return registry;
  }

  ComparatorRegistry::ComparatorRegistry()
  {
    m_entries.Reserve(10);
    Add("eq", &CmpEq);
    Add("ne", &CmpNe);
    Add("lt", &CmpLt);
    Add("le", &CmpLe);
    Add("gt", &CmpGt);
    Add("ge", &CmpGe);
    Add("is_", &CmpIs);
    Add("is_not", &CmpIsNot);
    Add("contains", &CmpContains);
    Add("search", &CmpSearch);
  }

  void ComparatorRegistry::Add(std::string_view name, ComparatorFn fn)
  {
    m_entries.PushBack(Comparator{name, fn});
    m_index.Insert(HashName(name), static_cast<NGIN::UInt32>(m_entries.Size() - 1));
  }

  const Comparator *ComparatorRegistry::Lookup(std::string_view name) const noexcept
  {
    const auto *idx = m_index.GetPtr(HashName(name));
    if (!idx || m_entries[*idx].name != name)
      return nullptr;
    return &m_entries[*idx];
  }

  std::expected<Comparator, Error> ComparatorRegistry::Resolve(std::string_view name) const
  {
    if (const auto *c = Lookup(name))
      return *c;
    return std::unexpected(Error{ErrorCode::ComparatorNotFound,
                                 fmt::format("Comparison {} is not a valid selection.", name)});
  }

  bool ComparatorRegistry::Contains(std::string_view name) const noexcept { return Lookup(name) != nullptr; }

  NGIN::UIntSize ComparatorRegistry::Size() const noexcept { return m_entries.Size(); }

  std::string_view ComparatorRegistry::NameAt(NGIN::UIntSize i) const noexcept
  {
    if (i >= m_entries.Size())
      return {};
    return m_entries[i].name;
  }

} // namespace Attest

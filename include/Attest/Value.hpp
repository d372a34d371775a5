// Value.hpp
// Closed value type shared by actual results, expectations and arguments
#pragma once

#include <Attest/Export.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Attest
{

  class Value;

  using ValueList = std::vector<Value>;
  // Insertion-ordered; declaration order is observable in reports.
  using ValueMap = std::vector<std::pair<std::string, Value>>;

  enum class ValueKind : unsigned char
  {
    None = 0,
    Bool = 1,
    Int = 2,
    Float = 3,
    String = 4,
    List = 5,
    Map = 6,
  };

  [[nodiscard]] ATTEST_API std::string_view KindName(ValueKind kind) noexcept;

  class Value
  {
  public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, ValueList, ValueMap>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_data(b) {}
    template <class I>
    requires (std::is_integral_v<I> && !std::is_same_v<I, bool> && !std::is_same_v<I, char>)
    Value(I i) : m_data(static_cast<std::int64_t>(i))
    {
    }
    Value(double d) : m_data(d) {}
    Value(float f) : m_data(static_cast<double>(f)) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(std::string_view s) : m_data(std::string{s}) {}
    Value(const char *s) : m_data(std::string{s}) {}
    Value(ValueList l) : m_data(std::move(l)) {}
    Value(ValueMap m) : m_data(std::move(m)) {}

    [[nodiscard]] ValueKind Kind() const noexcept { return static_cast<ValueKind>(m_data.index()); }

    [[nodiscard]] bool IsNone() const noexcept { return Kind() == ValueKind::None; }
    [[nodiscard]] bool IsBool() const noexcept { return Kind() == ValueKind::Bool; }
    [[nodiscard]] bool IsInt() const noexcept { return Kind() == ValueKind::Int; }
    [[nodiscard]] bool IsFloat() const noexcept { return Kind() == ValueKind::Float; }
    [[nodiscard]] bool IsString() const noexcept { return Kind() == ValueKind::String; }
    [[nodiscard]] bool IsList() const noexcept { return Kind() == ValueKind::List; }
    [[nodiscard]] bool IsMap() const noexcept { return Kind() == ValueKind::Map; }
    // bool participates in arithmetic the way it does in the declaration language.
    [[nodiscard]] bool IsNumeric() const noexcept { return IsBool() || IsInt() || IsFloat(); }

    [[nodiscard]] const bool *AsBool() const noexcept { return std::get_if<bool>(&m_data); }
    [[nodiscard]] const std::int64_t *AsInt() const noexcept { return std::get_if<std::int64_t>(&m_data); }
    [[nodiscard]] const double *AsFloat() const noexcept { return std::get_if<double>(&m_data); }
    [[nodiscard]] const std::string *AsString() const noexcept { return std::get_if<std::string>(&m_data); }
    [[nodiscard]] const ValueList *AsList() const noexcept { return std::get_if<ValueList>(&m_data); }
    [[nodiscard]] const ValueMap *AsMap() const noexcept { return std::get_if<ValueMap>(&m_data); }

    // Numeric view for int/float/bool values; 0 otherwise.
    [[nodiscard]] double ToNumber() const noexcept;

    // Map lookup; nullptr when not a map or the key is absent.
    [[nodiscard]] const Value *Find(std::string_view key) const noexcept;

    [[nodiscard]] const Storage &Data() const noexcept { return m_data; }

    // Strict: kinds must match. 1 != 1.0 and true != 1 here.
    friend bool operator==(const Value &a, const Value &b) { return a.m_data == b.m_data; }

  private:
    Storage m_data{};
  };

  [[nodiscard]] ATTEST_API const Value *FindEntry(const ValueMap &map, std::string_view key) noexcept;

  // Rendering used in assertion messages and logs.
  [[nodiscard]] ATTEST_API std::string ToString(const Value &value);

} // namespace Attest

// Convert.hpp - Shared T <-> Value conversion helpers
#pragma once

#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Attest::detail
{

  template <class T>
  struct IsStdVector : std::false_type
  {
  };
  template <class T, class A>
  struct IsStdVector<std::vector<T, A>> : std::true_type
  {
  };

  template <class T>
  struct IsStdOptional : std::false_type
  {
  };
  template <class T>
  struct IsStdOptional<std::optional<T>> : std::true_type
  {
  };

  template <class T>
  struct IsExpected : std::false_type
  {
  };
  template <class T>
  struct IsExpected<std::expected<T, Error>> : std::true_type
  {
  };

  template <class T>
  inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

  // T -> Value. Supports the scalar kinds, strings, vectors and optionals.
  template <class T>
  Value ToValue(T &&v)
  {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, Value>)
      return std::forward<T>(v);
    else if constexpr (std::is_same_v<U, bool>)
      return Value{v};
    else if constexpr (is_integer_v<U>)
      return Value{static_cast<std::int64_t>(v)};
    else if constexpr (std::is_floating_point_v<U>)
      return Value{static_cast<double>(v)};
    else if constexpr (std::is_convertible_v<U, std::string_view>)
      return Value{std::string{std::string_view{v}}};
    else if constexpr (IsStdOptional<U>::value)
    {
      if (!v.has_value())
        return Value{};
      return ToValue(*std::forward<T>(v));
    }
    else if constexpr (IsStdVector<U>::value)
    {
      ValueList out;
      out.reserve(v.size());
      for (auto &&e : v)
        out.push_back(ToValue(e));
      return Value{std::move(out)};
    }
    else
    {
      static_assert(std::is_same_v<U, void>, "type is not representable as an Attest::Value");
    }
  }

  // Try to convert Value -> To (exact kind, integral/floating conversions, lists)
  template <class To>
  std::expected<std::remove_cvref_t<To>, Error> FromValue(const Value &src)
  {
    using Dest = std::remove_cvref_t<To>;
    if constexpr (std::is_same_v<Dest, Value>)
    {
      return src;
    }
    else if constexpr (std::is_same_v<Dest, bool>)
    {
      if (const auto *b = src.AsBool())
        return *b;
    }
    else if constexpr (is_integer_v<Dest>)
    {
      if (const auto *i = src.AsInt())
      {
        if (*i < static_cast<std::int64_t>(std::numeric_limits<Dest>::min()) ||
            (*i > 0 && static_cast<std::uint64_t>(*i) > static_cast<std::uint64_t>(std::numeric_limits<Dest>::max())))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "integer out of range"});
        return static_cast<Dest>(*i);
      }
      if (const auto *f = src.AsFloat())
      {
        // trunc leaves the infinities unchanged; NaN never compares equal.
        if (std::trunc(*f) == *f)
        {
          // max() + 1 is a power of two, so the upper bound is exact as a double.
          constexpr double lo = static_cast<double>(std::numeric_limits<Dest>::min());
          constexpr double hi = static_cast<double>(std::numeric_limits<Dest>::max()) + 1.0;
          if (!std::isfinite(*f) || *f < lo || *f >= hi)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "integer out of range"});
          return static_cast<Dest>(*f);
        }
      }
    }
    else if constexpr (std::is_floating_point_v<Dest>)
    {
      if (src.IsInt() || src.IsFloat())
        return static_cast<Dest>(src.ToNumber());
    }
    else if constexpr (std::is_same_v<Dest, std::string>)
    {
      if (const auto *s = src.AsString())
        return *s;
    }
    else if constexpr (IsStdOptional<Dest>::value)
    {
      if (src.IsNone())
        return Dest{};
      auto inner = FromValue<typename Dest::value_type>(src);
      if (!inner)
        return std::unexpected(inner.error());
      return Dest{std::move(*inner)};
    }
    else if constexpr (IsStdVector<Dest>::value)
    {
      if (const auto *l = src.AsList())
      {
        Dest out;
        out.reserve(l->size());
        for (const auto &e : *l)
        {
          auto converted = FromValue<typename Dest::value_type>(e);
          if (!converted)
            return std::unexpected(converted.error());
          out.push_back(std::move(*converted));
        }
        return out;
      }
    }
    else
    {
      static_assert(std::is_same_v<Dest, void>, "type is not convertible from an Attest::Value");
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 std::string{"argument of kind "} + std::string{KindName(src.Kind())} + " is not convertible"});
  }

  // Normalises a provider return (plain R or std::expected<R, Error>) into a Value result.
  template <class R>
  std::expected<Value, Error> IntoResult(R &&r)
  {
    using U = std::remove_cvref_t<R>;
    if constexpr (IsExpected<U>::value)
    {
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<typename U::value_type>)
        return Value{};
      else
        return ToValue(std::move(*r));
    }
    else
    {
      return ToValue(std::forward<R>(r));
    }
  }

} // namespace Attest::detail

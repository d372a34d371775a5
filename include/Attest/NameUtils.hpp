// NameUtils.hpp
// Naming helpers: UpperCamelCase -> snake_case for resource names, and member
// names derived from pointer-to-member constants using compiler signatures.
#pragma once

#include <Attest/Export.hpp>

#include <string>
#include <string_view>

namespace Attest
{

  // "MountPoint" -> "mount_point", "HTTPServer" -> "http_server"
  [[nodiscard]] ATTEST_API std::string CamelToSnake(std::string_view camel);

} // namespace Attest

namespace Attest::detail
{

  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    constexpr std::string_view sig = __FUNCSIG__;
    // Example: "std::string_view __cdecl Attest::detail::MemberNameFromPretty< &Class::member >(void) noexcept"
    constexpr std::string_view key = "< &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(" >", start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__clang__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // Example: "std::string_view Attest::detail::MemberNameFromPretty() [MemberPtr = &Class::member]"
    constexpr std::string_view key = "[MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(']', start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__GNUC__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // Example: "consteval std::string_view Attest::detail::MemberNameFromPretty() [with auto MemberPtr = &Class::member]"
    constexpr std::string_view key = "[with auto MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    // GCC may append "; std::string_view = ..." before the closing bracket.
    auto end = sig.find_first_of(";]", start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#else
    return {};
#endif
    // Strip the Class:: prefix to keep only the member identifier.
    auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

} // namespace Attest::detail

// Types.hpp
// Public-facing error codes and small handle types
#pragma once

#include <NGIN/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace Attest
{

  using ModuleId = NGIN::UInt64;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    UnsupportedResource = 3,
    ResourceConstruction = 4,
    UnknownMember = 5,
    MissingArgument = 6,
    InvalidComparator = 7,
    ComparatorNotFound = 8,
    InvalidExpectationType = 9,
    ProviderFailure = 10,
    InvalidDocument = 11,
  };

  [[nodiscard]] constexpr std::string_view ErrorCodeName(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::NotFound: return "NotFound";
      case ErrorCode::InvalidArgument: return "InvalidArgument";
      case ErrorCode::UnsupportedResource: return "UnsupportedResource";
      case ErrorCode::ResourceConstruction: return "ResourceConstruction";
      case ErrorCode::UnknownMember: return "UnknownMember";
      case ErrorCode::MissingArgument: return "MissingArgument";
      case ErrorCode::InvalidComparator: return "InvalidComparator";
      case ErrorCode::ComparatorNotFound: return "ComparatorNotFound";
      case ErrorCode::InvalidExpectationType: return "InvalidExpectationType";
      case ErrorCode::ProviderFailure: return "ProviderFailure";
      case ErrorCode::InvalidDocument: return "InvalidDocument";
      default: break;
    }
    return "Unknown";
  }

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}

    // ComparatorNotFound is reported by the comparator registry and is a
    // refinement of InvalidComparator.
    [[nodiscard]] constexpr bool Is(ErrorCode c) const noexcept
    {
      if (code == c)
        return true;
      return c == ErrorCode::InvalidComparator && code == ErrorCode::ComparatorNotFound;
    }
  };

  // Small opaque handles (indices into immutable tables). Intentionally trivial.
  struct ResourceHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  struct PropertyHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 propertyIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && propertyIndex != static_cast<NGIN::UInt32>(-1); }
  };

  struct MethodHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 methodIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && methodIndex != static_cast<NGIN::UInt32>(-1); }
  };

  struct FieldHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 fieldIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && fieldIndex != static_cast<NGIN::UInt32>(-1); }
  };

  // Forward decls of high-level wrappers
  class ResourceType;
  class Property;
  class Method;
  class Field;
  class Instance;
  class Backend;

  using ExpectedResourceType = std::expected<ResourceType, Error>;
  using ExpectedProperty = std::expected<Property, Error>;
  using ExpectedMethod = std::expected<Method, Error>;
  using ExpectedField = std::expected<Field, Error>;
  using ExpectedInstance = std::expected<Instance, Error>;

} // namespace Attest

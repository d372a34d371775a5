// Members.hpp
// Member resolution on a resource: handle level first, then the instance
#pragma once

#include <expected>
#include <string_view>
#include <variant>

#include <Attest/Export.hpp>
#include <Attest/Registry.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

namespace Attest
{

  // Zero-argument attribute evaluated against the instance.
  struct ComputedAttribute
  {
    Property property;
  };

  // Single-argument operation; the argument comes from the expectation's `parameter`.
  struct Operation
  {
    Method method;
  };

  // Anything else the member name denotes (constants, fields, constructor attributes).
  struct PlainValue
  {
    Value value;
  };

  using ResolvedMember = std::variant<ComputedAttribute, Operation, PlainValue>;

  /**
   * Resolve `member` on `type` first (property, method, constant), then on
   * `instance` (registered field, then the subject and bound constructor
   * arguments). UnknownMember when neither level has it.
   */
  [[nodiscard]] ATTEST_API std::expected<ResolvedMember, Error> ResolveMember(const ResourceType &type,
                                                                              const Instance &instance,
                                                                              std::string_view member);

  /**
   * Produce the actual result of a resolved member. Operations take their
   * argument from a map expectation's `parameter` entry; any other
   * expectation is a MissingArgument.
   */
  [[nodiscard]] ATTEST_API std::expected<Value, Error> InvokeMember(const ResolvedMember &resolved,
                                                                    const Instance &instance,
                                                                    std::string_view member,
                                                                    const Value &expectation);

  // ResolveMember followed by InvokeMember.
  [[nodiscard]] ATTEST_API std::expected<Value, Error> GetMemberResult(const ResourceType &type,
                                                                       const Instance &instance,
                                                                       std::string_view member,
                                                                       const Value &expectation);

} // namespace Attest

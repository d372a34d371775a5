#include <Attest/Members.hpp>
#include <Attest/Log.hpp>

#include <fmt/format.h>

namespace Attest
{

  namespace
  {
    // Overload set for std::visit
    template <class... F>
    struct Overloaded : F...
    {
      using F::operator()...;
    };
    template <class... F>
    Overloaded(F...) -> Overloaded<F...>;

    std::expected<Value, Error> InvokeOperation(const Method &method, const Instance &instance,
                                                std::string_view member, const Value &expectation)
    {
      const auto *args = expectation.AsMap();
      if (!args || args->empty())
        return std::unexpected(Error{ErrorCode::MissingArgument,
                                     fmt::format("{} is a method of the {} resource. An argument dict is required.",
                                                 member, instance.Type().TypeName())});
      const Value *parameter = expectation.Find("parameter");
      if (!parameter)
        return std::unexpected(Error{ErrorCode::MissingArgument,
                                     fmt::format("The argument dict supplied has no key named \"parameter\": {}",
                                                 ToString(expectation))});
      return method.Invoke(instance, *parameter);
    }
  } // namespace

  std::expected<ResolvedMember, Error> ResolveMember(const ResourceType &type, const Instance &instance,
                                                     std::string_view member)
  {
    ATTEST_LOG(Debug, "Trying to call {} on {}", member, type.TypeName());
    if (auto p = type.FindProperty(member))
      return ResolvedMember{ComputedAttribute{*p}};
    if (auto m = type.FindMethod(member))
      return ResolvedMember{Operation{*m}};
    if (const Value *c = type.FindConstant(member))
      return ResolvedMember{PlainValue{*c}};

    if (auto f = type.FindField(member))
      return ResolvedMember{PlainValue{f->Load(instance)}};
    if (const Value *a = instance.FindAttribute(member))
      return ResolvedMember{PlainValue{*a}};

    return std::unexpected(Error{ErrorCode::UnknownMember,
                                 fmt::format("The {} resource does not have any property or method named {}",
                                             type.TypeName(), member)});
  }

  std::expected<Value, Error> InvokeMember(const ResolvedMember &resolved, const Instance &instance,
                                           std::string_view member, const Value &expectation)
  {
    return std::visit(Overloaded{
                          [&](const ComputedAttribute &attr) { return attr.property.Get(instance); },
                          [&](const Operation &op) { return InvokeOperation(op.method, instance, member, expectation); },
                          [](const PlainValue &plain) { return std::expected<Value, Error>{plain.value}; },
                      },
                      resolved);
  }

  std::expected<Value, Error> GetMemberResult(const ResourceType &type, const Instance &instance,
                                              std::string_view member, const Value &expectation)
  {
    auto resolved = ResolveMember(type, instance, member);
    if (!resolved)
      return std::unexpected(resolved.error());
    return InvokeMember(*resolved, instance, member, expectation);
  }

} // namespace Attest

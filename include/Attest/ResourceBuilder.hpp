// ResourceBuilder.hpp
// Public ResourceBuilder<T> used inside the ADL hook to describe a resource provider
#pragma once

#include <Attest/Registry.hpp>
#include <Attest/Convert.hpp>
#include <Attest/NameUtils.hpp>

#include <concepts>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Attest
{

  template <class T>
  class ResourceBuilder
  {
  public:
    // Note: constructed by the registry when invoking the ADL hook; binds to a specific resource index.
    explicit ResourceBuilder(NGIN::UInt32 index) : m_index(index) {}

    // Provider-side name in UpperCamelCase. The entry-point name is its snake_case form.
    ResourceBuilder &SetName(std::string_view qualified)
    {
      detail::SetResourceName(m_index, qualified);
      return *this;
    }

    ResourceBuilder &Description(std::string_view text)
    {
      auto &reg = detail::GetRegistry();
      reg.resources[m_index].description = detail::NameFromId(detail::InternNameId(text));
      return *this;
    }

    // Computed attribute: a const, zero-argument member function.
    template <auto Getter>
    ResourceBuilder &Property(std::string_view name);

    // Parameterized operation: a const member function taking exactly one argument.
    template <auto MemFn>
    ResourceBuilder &Method(std::string_view name);

    // Instance data member; name optional and auto-derived if omitted.
    template <auto MemberPtr>
    ResourceBuilder &Field(std::string_view name = {});

    // Type-level plain value.
    ResourceBuilder &Constant(std::string_view name, Value value)
    {
      auto &reg = detail::GetRegistry();
      auto &rdesc = reg.resources[m_index];
      detail::ConstantRuntimeDesc c{};
      c.nameId = detail::InternNameId(name);
      c.name = detail::NameFromId(c.nameId);
      c.value = std::move(value);
      rdesc.constants.PushBack(std::move(c));
      const auto newIdx = static_cast<NGIN::UInt32>(rdesc.constants.Size() - 1);
      rdesc.constantIndex.Insert(rdesc.constants[newIdx].nameId, newIdx);
      return *this;
    }

    // T(BackendPtr, std::string subject, A...). One Parameter(...) per extra argument.
    template <class... A, class... P>
    ResourceBuilder &Constructor(P &&...params);

    // T(BackendPtr). The subject name is not passed.
    ResourceBuilder &ParameterlessConstructor();

    // static bool Pred(const Backend&): false marks the resource unsupported on that backend.
    template <auto Predicate>
    ResourceBuilder &SupportedWhen()
    {
      auto &reg = detail::GetRegistry();
      reg.resources[m_index].Supported = +[](const Backend &backend) -> bool
      { return static_cast<bool>(Predicate(backend)); };
      return *this;
    }

  private:
    NGIN::UInt32 m_index{0};
  };

  // ==== Member registration machinery ====
  namespace detail
  {
    template <typename>
    struct GetterTraits;

    template <class C, class R>
    struct GetterTraits<R (C::*)() const>
    {
      using Class = C;
      using Ret = R;
      template <auto Getter>
      static std::expected<Value, Error> Get(const void *obj)
      {
        const auto *c = static_cast<const C *>(obj);
        return IntoResult((c->*Getter)());
      }
    };

    template <class C, class R>
    struct GetterTraits<R (C::*)() const noexcept> : GetterTraits<R (C::*)() const>
    {
    };

    template <typename>
    struct MethodTraits;

    template <class C, class R, class A>
    struct MethodTraits<R (C::*)(A) const>
    {
      using Class = C;
      using Ret = R;
      using Arg = std::remove_cvref_t<A>;
      template <auto MemFn>
      static std::expected<Value, Error> Invoke(const void *obj, const Value &argument)
      {
        auto converted = FromValue<Arg>(argument);
        if (!converted)
          return std::unexpected(converted.error());
        const auto *c = static_cast<const C *>(obj);
        return IntoResult((c->*MemFn)(std::move(*converted)));
      }
    };

    template <class C, class R, class A>
    struct MethodTraits<R (C::*)(A) const noexcept> : MethodTraits<R (C::*)(A) const>
    {
    };

    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    static Value FieldLoad(const void *obj)
    {
      using C = typename MemberPtrTraits<decltype(MemberPtr)>::Class;
      const auto *c = static_cast<const C *>(obj);
      return ToValue(c->*MemberPtr);
    }

    template <class T>
    concept HasValidate = requires(const T &t) {
      { t.Validate() } -> std::same_as<std::expected<void, Error>>;
    };

    // Fetch a named argument (or its default) and convert it to the constructor parameter type.
    template <class A>
    std::expected<std::remove_cvref_t<A>, Error> BindParameter(const ParameterRuntimeDesc &param, const ValueMap &arguments)
    {
      const Value *source = FindEntry(arguments, param.name);
      if (!source)
      {
        if (!param.defaultValue)
          return std::unexpected(Error{ErrorCode::ResourceConstruction,
                                       "missing required constructor argument " + std::string{param.name}});
        source = &*param.defaultValue;
      }
      auto converted = FromValue<A>(*source);
      if (!converted)
        return std::unexpected(Error{ErrorCode::ResourceConstruction,
                                     "constructor argument " + std::string{param.name} + ": " + converted.error().message});
      return converted;
    }

    template <class T>
    std::expected<std::shared_ptr<void>, Error> Validated(std::shared_ptr<T> obj)
    {
      if constexpr (HasValidate<T>)
      {
        auto valid = obj->Validate();
        if (!valid)
          return std::unexpected(Error{ErrorCode::ResourceConstruction, valid.error().message});
      }
      return std::shared_ptr<void>(std::move(obj));
    }
  } // namespace detail

  template <class T>
  template <auto Getter>
  inline ResourceBuilder<T> &ResourceBuilder<T>::Property(std::string_view name)
  {
    using Traits = detail::GetterTraits<decltype(Getter)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Property getter must belong to T");
    auto &reg = detail::GetRegistry();
    auto &rdesc = reg.resources[m_index];
    detail::PropertyRuntimeDesc p{};
    p.nameId = detail::InternNameId(name);
    p.name = detail::NameFromId(p.nameId);
    p.typeId = detail::TypeIdOf<typename Traits::Ret>();
    p.Get = &Traits::template Get<Getter>;
    rdesc.properties.PushBack(std::move(p));
    const auto newIdx = static_cast<NGIN::UInt32>(rdesc.properties.Size() - 1);
    rdesc.propertyIndex.Insert(rdesc.properties[newIdx].nameId, newIdx);
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline ResourceBuilder<T> &ResourceBuilder<T>::Method(std::string_view name)
  {
    using Traits = detail::MethodTraits<decltype(MemFn)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Method must belong to T");
    auto &reg = detail::GetRegistry();
    auto &rdesc = reg.resources[m_index];
    detail::MethodRuntimeDesc m{};
    m.nameId = detail::InternNameId(name);
    m.name = detail::NameFromId(m.nameId);
    m.returnTypeId = detail::TypeIdOf<typename Traits::Ret>();
    m.paramTypeId = detail::TypeIdOf<typename Traits::Arg>();
    m.Invoke = &Traits::template Invoke<MemFn>;
    rdesc.methods.PushBack(std::move(m));
    const auto newIdx = static_cast<NGIN::UInt32>(rdesc.methods.Size() - 1);
    rdesc.methodIndex.Insert(rdesc.methods[newIdx].nameId, newIdx);
    return *this;
  }

  template <class T>
  template <auto MemberPtr>
  inline ResourceBuilder<T> &ResourceBuilder<T>::Field(std::string_view name)
  {
    using Member = typename detail::MemberPtrTraits<decltype(MemberPtr)>::Member;
    auto &reg = detail::GetRegistry();
    auto &rdesc = reg.resources[m_index];
    detail::FieldRuntimeDesc f{};
    {
      auto svName = name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name;
      f.nameId = detail::InternNameId(svName);
      f.name = detail::NameFromId(f.nameId);
    }
    f.typeId = detail::TypeIdOf<Member>();
    f.Load = &detail::FieldLoad<MemberPtr>;
    rdesc.fields.PushBack(std::move(f));
    const auto newIdx = static_cast<NGIN::UInt32>(rdesc.fields.Size() - 1);
    rdesc.fieldIndex.Insert(rdesc.fields[newIdx].nameId, newIdx);
    return *this;
  }

  // ==== Constructor registration ====
  template <class T>
  template <class... A, class... P>
  inline ResourceBuilder<T> &ResourceBuilder<T>::Constructor(P &&...params)
  {
    static_assert(sizeof...(A) == sizeof...(P), "one Parameter(...) is required per constructor argument");
    static_assert((std::is_convertible_v<P, ParameterDesc> && ...), "constructor parameters are described with Parameter(...)");
    auto &reg = detail::GetRegistry();
    auto &rdesc = reg.resources[m_index];
    detail::CtorRuntimeDesc c{};
    c.takesSubject = true;
    (c.paramTypeIds.PushBack(detail::TypeIdOf<A>()), ...);
    auto push = [&](ParameterDesc d)
    {
      detail::ParameterRuntimeDesc pd{};
      pd.name = detail::NameFromId(detail::InternNameId(d.name));
      pd.defaultValue = std::move(d.defaultValue);
      c.parameters.PushBack(std::move(pd));
    };
    (push(ParameterDesc(std::forward<P>(params))), ...);
    c.Construct = [](const BackendPtr &backend, std::string_view subject, const ValueMap &arguments,
                     const detail::ParameterList &parameters) -> std::expected<std::shared_ptr<void>, Error>
    {
      if (parameters.Size() != sizeof...(A))
        return std::unexpected(Error{ErrorCode::ResourceConstruction, "bad arity"});
      return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::expected<std::shared_ptr<void>, Error>
      {
        std::tuple<std::expected<std::remove_cvref_t<A>, Error>...> bound{
            detail::BindParameter<A>(parameters[I], arguments)...};
        std::optional<Error> failure;
        (
            [&]
            {
              if (!failure && !std::get<I>(bound).has_value())
                failure = std::get<I>(bound).error();
            }(),
            ...);
        if (failure)
          return std::unexpected(std::move(*failure));
        return detail::Validated(
            std::make_shared<T>(backend, std::string{subject}, std::move(*std::get<I>(bound))...));
      }(std::index_sequence_for<A...>{});
    };
    rdesc.hasConstructor = true;
    rdesc.constructor = std::move(c);
    return *this;
  }

  template <class T>
  inline ResourceBuilder<T> &ResourceBuilder<T>::ParameterlessConstructor()
  {
    auto &reg = detail::GetRegistry();
    auto &rdesc = reg.resources[m_index];
    detail::CtorRuntimeDesc c{};
    c.takesSubject = false;
    c.Construct = [](const BackendPtr &backend, std::string_view, const ValueMap &,
                     const detail::ParameterList &) -> std::expected<std::shared_ptr<void>, Error>
    { return detail::Validated(std::make_shared<T>(backend)); };
    rdesc.hasConstructor = true;
    rdesc.constructor = std::move(c);
    return *this;
  }

} // namespace Attest

// Registry.hpp
// Process-wide provider directory: immutable resource descriptions and the query API
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <Attest/Export.hpp>
#include <Attest/Backend.hpp>
#include <Attest/NameUtils.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

namespace Attest
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class ResourceBuilder;

  // Named constructor parameter; parameters without a default are required.
  struct ParameterDesc
  {
    std::string_view name;
    std::optional<Value> defaultValue{};
  };

  [[nodiscard]] inline ParameterDesc Parameter(std::string_view name) { return ParameterDesc{name, std::nullopt}; }
  [[nodiscard]] inline ParameterDesc Parameter(std::string_view name, Value defaultValue)
  {
    return ParameterDesc{name, std::move(defaultValue)};
  }

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global registry interner
    ATTEST_API NameId InternNameId(std::string_view s) noexcept;
    ATTEST_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    ATTEST_API std::string_view NameFromId(NameId id) noexcept;

    // Compute FNV-based type id for a type
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    struct PropertyRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      std::expected<Value, Error> (*Get)(const void *){nullptr};
    };

    struct MethodRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 returnTypeId{0};
      NGIN::UInt64 paramTypeId{0};
      std::expected<Value, Error> (*Invoke)(const void *, const Value &){nullptr};
    };

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      Value (*Load)(const void *){nullptr};
    };

    struct ConstantRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      Value value{};
    };

    struct ParameterRuntimeDesc
    {
      std::string_view name;
      std::optional<Value> defaultValue{};
    };

    using ParameterList = NGIN::Containers::Vector<ParameterRuntimeDesc>;

    struct CtorRuntimeDesc
    {
      bool takesSubject{true};
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      ParameterList parameters;
      std::expected<std::shared_ptr<void>, Error> (*Construct)(const BackendPtr &, std::string_view,
                                                               const ValueMap &, const ParameterList &){nullptr};
    };

    struct ResourceRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      std::string_view typeName;
      NameId typeNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId{0};
      ModuleId moduleId{0};
      std::string_view description;
      NGIN::Containers::Vector<PropertyRuntimeDesc> properties;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
      NGIN::Containers::Vector<MethodRuntimeDesc> methods;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> methodIndex;
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<ConstantRuntimeDesc> constants;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> constantIndex;
      bool hasConstructor{false};
      CtorRuntimeDesc constructor;
      bool (*Supported)(const Backend &){nullptr};
    };

    struct Registry
    {
      NGIN::Containers::Vector<ResourceRuntimeDesc> resources;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;
      // Entry-point (snake_case) name to index. First registrant of a name wins.
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byTypeName;

      StringInterner names;
    };

    ATTEST_API Registry &GetRegistry() noexcept;

    // Re-derives the snake_case entry-point name after a rename.
    ATTEST_API void SetResourceName(NGIN::UInt32 index, std::string_view qualified);

    template <class T>
    concept HasAttestDescribe = requires(ResourceBuilder<T> &b) {
      // ADL friend should be declared as: friend void AttestDescribe(Tag<T>, ResourceBuilder<T>&)
      { AttestDescribe(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Ensure a resource type is present; returns its index
    template <class T>
    NGIN::UInt32 EnsureRegistered(ModuleId moduleId = ModuleId{0})
    {
      using U = std::remove_cvref_t<T>;
      static_assert(HasAttestDescribe<U>, "resource types must provide AttestDescribe(Tag<T>, ResourceBuilder<T>&)");
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      ResourceRuntimeDesc rec{};
      rec.typeId = tid;
      rec.moduleId = moduleId;

      const auto idx = static_cast<NGIN::UInt32>(reg.resources.Size());
      reg.resources.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      // Default name derived from the unqualified C++ type name; SetName overrides it.
      {
        auto qn = NGIN::Meta::TypeName<U>::qualifiedName;
        auto dc = qn.rfind("::");
        SetResourceName(idx, dc == std::string_view::npos ? qn : qn.substr(dc + 2));
      }

      ResourceBuilder<U> b{idx};
      AttestDescribe(Tag<U>{}, b); // ADL - provider describes its members
      return idx;
    }

  } // namespace detail

  class ATTEST_API Property
  {
  public:
    constexpr Property() = default;
    explicit constexpr Property(PropertyHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;

    // Evaluate the computed attribute against an instance of the owning resource.
    [[nodiscard]] std::expected<Value, Error> Get(const Instance &instance) const;

  private:
    PropertyHandle m_h{};
  };

  class ATTEST_API Method
  {
  public:
    constexpr Method() = default;
    explicit constexpr Method(MethodHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 ParameterTypeId() const;

    // Single-argument invocation; the argument is converted to the declared parameter type.
    [[nodiscard]] std::expected<Value, Error> Invoke(const Instance &instance, const Value &argument) const;

  private:
    MethodHandle m_h{};
  };

  class ATTEST_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] Value Load(const Instance &instance) const;

  private:
    FieldHandle m_h{};
  };

  /**
   * ResourceType
   *
   * Handle to one registered resource provider. Lookups on the handle cover
   * the type level (properties, methods, constants); fields are per-instance
   * data and are only reachable once an Instance exists.
   */
  class ATTEST_API ResourceType
  {
  public:
    constexpr ResourceType() = default;
    explicit constexpr ResourceType(ResourceHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] ResourceHandle Handle() const noexcept { return m_h; }
    // Provider-side name, e.g. "PipPackage".
    [[nodiscard]] std::string_view QualifiedName() const;
    // Entry-point name, e.g. "pip_package".
    [[nodiscard]] std::string_view TypeName() const;
    [[nodiscard]] std::string_view Description() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] ModuleId GetModuleId() const;

    [[nodiscard]] NGIN::UIntSize PropertyCount() const;
    [[nodiscard]] Property PropertyAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Property> FindProperty(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] Method MethodAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Method> FindMethod(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize ConstantCount() const;
    [[nodiscard]] std::string_view ConstantNameAt(NGIN::UIntSize i) const;
    [[nodiscard]] const Value *FindConstant(std::string_view name) const;

    // Constructor signature
    [[nodiscard]] bool HasConstructor() const;
    [[nodiscard]] bool TakesSubject() const;
    [[nodiscard]] std::vector<std::string_view> ConstructorParameters() const;

    // False when the provider declared itself unavailable for this backend/platform.
    [[nodiscard]] bool IsSupportedOn(const Backend &backend) const;

    // Instantiate with the subject name and named constructor arguments.
    [[nodiscard]] ExpectedInstance Construct(const BackendPtr &backend, std::string_view subject,
                                             const ValueMap &arguments) const;

  private:
    ResourceHandle m_h{};
  };

  /**
   * Instance
   *
   * One constructed resource. Owns the provider object and keeps its
   * backend alive. Attributes hold the subject ("name") and the bound
   * constructor arguments, in that order.
   */
  class ATTEST_API Instance
  {
  public:
    Instance(ResourceType type, std::shared_ptr<void> object, BackendPtr backend, std::string subject, ValueMap attributes);

    [[nodiscard]] ResourceType Type() const noexcept { return m_type; }
    [[nodiscard]] const void *Object() const noexcept { return m_object.get(); }
    [[nodiscard]] const BackendPtr &GetBackend() const noexcept { return m_backend; }
    [[nodiscard]] std::string_view Subject() const noexcept { return m_subject; }
    [[nodiscard]] const ValueMap &Attributes() const noexcept { return m_attributes; }
    [[nodiscard]] const Value *FindAttribute(std::string_view name) const noexcept;

  private:
    ResourceType m_type;
    std::shared_ptr<void> m_object;
    BackendPtr m_backend;
    std::string m_subject;
    ValueMap m_attributes;
  };

  // Queries
  ATTEST_API ExpectedResourceType GetResourceType(std::string_view qualifiedName);
  ATTEST_API std::optional<ResourceType> FindResourceType(std::string_view qualifiedName);
  // Lookup by entry-point name, e.g. "pip_package".
  ATTEST_API std::optional<ResourceType> FindResourceTypeByEntryName(std::string_view typeName);
  [[nodiscard]] ATTEST_API NGIN::UIntSize ResourceTypeCount();
  [[nodiscard]] ATTEST_API ResourceType ResourceTypeAt(NGIN::UIntSize i);
  // Entry-point names of every resource that owns one, in registration order.
  [[nodiscard]] ATTEST_API std::vector<std::string> ListResourceTypes();

  template <class T>
  ResourceType GetResourceType()
  {
    return ResourceType{ResourceHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<ResourceType> TryGetResourceType()
  {
    using U = std::remove_cvref_t<T>;
    auto &reg = detail::GetRegistry();
    const auto tid = detail::TypeIdOf<U>();
    if (auto *p = reg.byTypeId.GetPtr(tid))
      return ResourceType{ResourceHandle{*p}};
    return std::nullopt;
  }

} // namespace Attest

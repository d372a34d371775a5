#include <Attest/Registry.hpp>
#include <Attest/NameUtils.hpp>
#include <Attest/Log.hpp>

#include <optional>

namespace Attest::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  void SetResourceName(NGIN::UInt32 index, std::string_view qualified)
  {
    auto &reg = GetRegistry();
    auto &rdesc = reg.resources[index];
    if (rdesc.qualifiedNameId != InvalidNameId)
      reg.byName.Remove(rdesc.qualifiedNameId);
    if (rdesc.typeNameId != InvalidNameId)
    {
      const auto *owner = reg.byTypeName.GetPtr(rdesc.typeNameId);
      if (owner && *owner == index)
        reg.byTypeName.Remove(rdesc.typeNameId);
    }
    rdesc.qualifiedNameId = InternNameId(qualified);
    rdesc.qualifiedName = NameFromId(rdesc.qualifiedNameId);
    rdesc.typeNameId = InternNameId(CamelToSnake(rdesc.qualifiedName));
    rdesc.typeName = NameFromId(rdesc.typeNameId);
    reg.byName.Insert(rdesc.qualifiedNameId, index);

    if (const auto *owner = reg.byTypeName.GetPtr(rdesc.typeNameId); owner && *owner != index)
    {
      ATTEST_LOG(Error, "Resource {} maps to entry point {}, already taken by {}; it gets no entry point",
                 rdesc.qualifiedName, rdesc.typeName, reg.resources[*owner].qualifiedName);
      return;
    }
    reg.byTypeName.Insert(rdesc.typeNameId, index);
  }

} // namespace Attest::detail

namespace Attest
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kInvalidHandle = "invalid handle";

    bool IsTypeAlive(NGIN::UInt32 index)
    {
      const auto &reg = GetRegistry();
      return index < reg.resources.Size();
    }

    bool IsTypeAlive(ResourceHandle h)
    {
      return h.IsValid() && IsTypeAlive(h.index);
    }

    bool IsPropertyAlive(PropertyHandle h)
    {
      if (!h.IsValid() || !IsTypeAlive(h.typeIndex))
        return false;
      return h.propertyIndex < GetRegistry().resources[h.typeIndex].properties.Size();
    }

    bool IsMethodAlive(MethodHandle h)
    {
      if (!h.IsValid() || !IsTypeAlive(h.typeIndex))
        return false;
      return h.methodIndex < GetRegistry().resources[h.typeIndex].methods.Size();
    }

    bool IsFieldAlive(FieldHandle h)
    {
      if (!h.IsValid() || !IsTypeAlive(h.typeIndex))
        return false;
      return h.fieldIndex < GetRegistry().resources[h.typeIndex].fields.Size();
    }

    // Members are only reachable through an instance of the type that declares them.
    std::optional<Error> CheckOwner(NGIN::UInt32 typeIndex, const Instance &instance)
    {
      if (instance.Type().Handle().index != typeIndex || instance.Object() == nullptr)
        return Error{ErrorCode::InvalidArgument, "instance does not belong to the member's resource type"};
      return std::nullopt;
    }

    template <class Index>
    std::optional<NGIN::UInt32> LookupIndex(const Index &index, std::string_view name)
    {
      NameId nid{};
      if (!detail::FindNameId(name, nid))
        return std::nullopt;
      if (auto *p = index.GetPtr(nid))
        return *p;
      return std::nullopt;
    }
  } // namespace

  // Property
  bool Property::IsValid() const noexcept { return IsPropertyAlive(m_h); }

  std::string_view Property::Name() const
  {
    if (!IsPropertyAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.typeIndex].properties[m_h.propertyIndex].name;
  }

  NGIN::UInt64 Property::TypeId() const
  {
    if (!IsPropertyAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.typeIndex].properties[m_h.propertyIndex].typeId;
  }

  std::expected<Value, Error> Property::Get(const Instance &instance) const
  {
    if (!IsPropertyAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kInvalidHandle}});
    if (auto err = CheckOwner(m_h.typeIndex, instance))
      return std::unexpected(std::move(*err));
    const auto &p = GetRegistry().resources[m_h.typeIndex].properties[m_h.propertyIndex];
    return p.Get(instance.Object());
  }

  // Method
  bool Method::IsValid() const noexcept { return IsMethodAlive(m_h); }

  std::string_view Method::Name() const
  {
    if (!IsMethodAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.typeIndex].methods[m_h.methodIndex].name;
  }

  NGIN::UInt64 Method::ParameterTypeId() const
  {
    if (!IsMethodAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.typeIndex].methods[m_h.methodIndex].paramTypeId;
  }

  std::expected<Value, Error> Method::Invoke(const Instance &instance, const Value &argument) const
  {
    if (!IsMethodAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kInvalidHandle}});
    if (auto err = CheckOwner(m_h.typeIndex, instance))
      return std::unexpected(std::move(*err));
    const auto &m = GetRegistry().resources[m_h.typeIndex].methods[m_h.methodIndex];
    return m.Invoke(instance.Object(), argument);
  }

  // Field
  bool Field::IsValid() const noexcept { return IsFieldAlive(m_h); }

  std::string_view Field::Name() const
  {
    if (!IsFieldAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.typeIndex].fields[m_h.fieldIndex].name;
  }

  NGIN::UInt64 Field::TypeId() const
  {
    if (!IsFieldAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.typeIndex].fields[m_h.fieldIndex].typeId;
  }

  Value Field::Load(const Instance &instance) const
  {
    if (!IsFieldAlive(m_h) || CheckOwner(m_h.typeIndex, instance))
      return Value{};
    const auto &f = GetRegistry().resources[m_h.typeIndex].fields[m_h.fieldIndex];
    return f.Load(instance.Object());
  }

  // ResourceType
  bool ResourceType::IsValid() const noexcept { return IsTypeAlive(m_h); }

  std::string_view ResourceType::QualifiedName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.index].qualifiedName;
  }

  std::string_view ResourceType::TypeName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.index].typeName;
  }

  std::string_view ResourceType::Description() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().resources[m_h.index].description;
  }

  NGIN::UInt64 ResourceType::GetTypeId() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].typeId;
  }

  ModuleId ResourceType::GetModuleId() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].moduleId;
  }

  NGIN::UIntSize ResourceType::PropertyCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].properties.Size();
  }

  Property ResourceType::PropertyAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Property{};
    return Property{PropertyHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  std::optional<Property> ResourceType::FindProperty(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    if (auto idx = LookupIndex(GetRegistry().resources[m_h.index].propertyIndex, name))
      return Property{PropertyHandle{m_h.index, *idx}};
    return std::nullopt;
  }

  NGIN::UIntSize ResourceType::MethodCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].methods.Size();
  }

  Method ResourceType::MethodAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Method{};
    return Method{MethodHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  std::optional<Method> ResourceType::FindMethod(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    if (auto idx = LookupIndex(GetRegistry().resources[m_h.index].methodIndex, name))
      return Method{MethodHandle{m_h.index, *idx}};
    return std::nullopt;
  }

  NGIN::UIntSize ResourceType::FieldCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].fields.Size();
  }

  Field ResourceType::FieldAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Field{};
    return Field{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  std::optional<Field> ResourceType::FindField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    if (auto idx = LookupIndex(GetRegistry().resources[m_h.index].fieldIndex, name))
      return Field{FieldHandle{m_h.index, *idx}};
    return std::nullopt;
  }

  NGIN::UIntSize ResourceType::ConstantCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().resources[m_h.index].constants.Size();
  }

  std::string_view ResourceType::ConstantNameAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return {};
    const auto &constants = GetRegistry().resources[m_h.index].constants;
    if (i >= constants.Size())
      return {};
    return constants[i].name;
  }

  const Value *ResourceType::FindConstant(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return nullptr;
    const auto &rdesc = GetRegistry().resources[m_h.index];
    if (auto idx = LookupIndex(rdesc.constantIndex, name))
      return &rdesc.constants[*idx].value;
    return nullptr;
  }

  bool ResourceType::HasConstructor() const
  {
    if (!IsTypeAlive(m_h))
      return false;
    return GetRegistry().resources[m_h.index].hasConstructor;
  }

  bool ResourceType::TakesSubject() const
  {
    if (!HasConstructor())
      return false;
    return GetRegistry().resources[m_h.index].constructor.takesSubject;
  }

  std::vector<std::string_view> ResourceType::ConstructorParameters() const
  {
    std::vector<std::string_view> out;
    if (!HasConstructor())
      return out;
    const auto &params = GetRegistry().resources[m_h.index].constructor.parameters;
    out.reserve(params.Size());
    for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
      out.push_back(params[i].name);
    return out;
  }

  bool ResourceType::IsSupportedOn(const Backend &backend) const
  {
    if (!IsTypeAlive(m_h))
      return false;
    const auto &rdesc = GetRegistry().resources[m_h.index];
    return rdesc.Supported == nullptr || rdesc.Supported(backend);
  }

  ExpectedInstance ResourceType::Construct(const BackendPtr &backend, std::string_view subject,
                                           const ValueMap &arguments) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, std::string{kInvalidHandle}});
    if (!backend)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "no backend supplied"});
    const auto &rdesc = GetRegistry().resources[m_h.index];
    if (!rdesc.hasConstructor || rdesc.constructor.Construct == nullptr)
      return std::unexpected(Error{ErrorCode::ResourceConstruction,
                                   "the " + std::string{rdesc.typeName} + " resource cannot be constructed"});

    const auto &ctor = rdesc.constructor;
    auto object = ctor.Construct(backend, subject, arguments, ctor.parameters);
    if (!object)
    {
      ATTEST_LOG(Debug, "constructing {} {} failed: {}", rdesc.typeName, subject, object.error().message);
      return std::unexpected(std::move(object.error()));
    }

    ValueMap attributes;
    if (ctor.takesSubject)
    {
      attributes.emplace_back("name", Value{subject});
      for (NGIN::UIntSize i = 0; i < ctor.parameters.Size(); ++i)
      {
        const auto &param = ctor.parameters[i];
        if (const Value *given = FindEntry(arguments, param.name))
          attributes.emplace_back(std::string{param.name}, *given);
        else if (param.defaultValue)
          attributes.emplace_back(std::string{param.name}, *param.defaultValue);
      }
    }
    return Instance{*this, std::move(*object), backend, std::string{subject}, std::move(attributes)};
  }

  // Instance
  Instance::Instance(ResourceType type, std::shared_ptr<void> object, BackendPtr backend, std::string subject,
                     ValueMap attributes)
      : m_type(type), m_object(std::move(object)), m_backend(std::move(backend)), m_subject(std::move(subject)),
        m_attributes(std::move(attributes))
  {
  }

  const Value *Instance::FindAttribute(std::string_view name) const noexcept
  {
    return FindEntry(m_attributes, name);
  }

  // Queries
  ExpectedResourceType GetResourceType(std::string_view qualifiedName)
  {
    if (auto t = FindResourceType(qualifiedName))
      return *t;
    return std::unexpected(Error{ErrorCode::NotFound,
                                 "no resource type named " + std::string{qualifiedName}});
  }

  std::optional<ResourceType> FindResourceType(std::string_view qualifiedName)
  {
    auto &reg = GetRegistry();
    if (auto idx = LookupIndex(reg.byName, qualifiedName))
      return ResourceType{ResourceHandle{*idx}};
    return std::nullopt;
  }

  std::optional<ResourceType> FindResourceTypeByEntryName(std::string_view typeName)
  {
    auto &reg = GetRegistry();
    if (auto idx = LookupIndex(reg.byTypeName, typeName))
      return ResourceType{ResourceHandle{*idx}};
    return std::nullopt;
  }

  NGIN::UIntSize ResourceTypeCount() { return GetRegistry().resources.Size(); }

  ResourceType ResourceTypeAt(NGIN::UIntSize i)
  {
    if (i >= ResourceTypeCount())
      return ResourceType{};
    return ResourceType{ResourceHandle{static_cast<NGIN::UInt32>(i)}};
  }

  std::vector<std::string> ListResourceTypes()
  {
    const auto &reg = GetRegistry();
    std::vector<std::string> names;
    names.reserve(reg.resources.Size());
    for (NGIN::UIntSize i = 0; i < reg.resources.Size(); ++i)
    {
      const auto *owner = reg.byTypeName.GetPtr(reg.resources[i].typeNameId);
      if (owner && *owner == i)
        names.emplace_back(reg.resources[i].typeName);
    }
    return names;
  }

} // namespace Attest

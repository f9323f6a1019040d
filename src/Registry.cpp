#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Value.hpp>

namespace NGIN::Dispatch::detail
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

  const TypeRuntimeDesc *FindTypeDesc(NGIN::UInt64 typeId) noexcept
  {
    auto &reg = GetRegistry();
    const auto *idx = reg.byTypeId.GetPtr(typeId);
    return idx ? &reg.types[*idx] : nullptr;
  }

} // namespace NGIN::Dispatch::detail

namespace NGIN::Dispatch
{

  using detail::GetRegistry;
  using detail::LockRegistry;

  namespace
  {
    bool IsTypeAlive(NGIN::UInt32 index)
    {
      return index < GetRegistry().types.Size();
    }

    bool IsFieldAlive(NGIN::UInt32 typeIndex, NGIN::UInt32 fieldIndex)
    {
      return IsTypeAlive(typeIndex) && fieldIndex < GetRegistry().types[typeIndex].fields.Size();
    }

    bool IsPropertyAlive(NGIN::UInt32 typeIndex, NGIN::UInt32 propertyIndex)
    {
      return IsTypeAlive(typeIndex) && propertyIndex < GetRegistry().types[typeIndex].properties.Size();
    }

    bool IsMethodAlive(NGIN::UInt32 typeIndex, NGIN::UInt32 methodIndex)
    {
      return IsTypeAlive(typeIndex) && methodIndex < GetRegistry().types[typeIndex].methods.Size();
    }

    BindingFailure StaleHandle(OperationKind op)
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::MemberNotFound;
      f.operation = op;
      f.message = "stale handle";
      return f;
    }
  } // namespace

  // Field
  bool Field::IsValid() const noexcept
  {
    auto lock = LockRegistry();
    return IsFieldAlive(m_typeIndex, m_fieldIndex);
  }

  std::string_view Field::Name() const
  {
    auto lock = LockRegistry();
    if (!IsFieldAlive(m_typeIndex, m_fieldIndex))
      return {};
    return GetRegistry().types[m_typeIndex].fields[m_fieldIndex].name;
  }

  NGIN::UInt64 Field::TypeId() const
  {
    auto lock = LockRegistry();
    if (!IsFieldAlive(m_typeIndex, m_fieldIndex))
      return 0;
    return GetRegistry().types[m_typeIndex].fields[m_fieldIndex].typeId;
  }

  Value Field::GetValue(const void *obj) const
  {
    Value (*load)(const void *) = nullptr;
    {
      auto lock = LockRegistry();
      if (!IsFieldAlive(m_typeIndex, m_fieldIndex))
        return Value::Null();
      load = GetRegistry().types[m_typeIndex].fields[m_fieldIndex].Load;
    }
    return load ? load(obj) : Value::Null();
  }

  std::expected<void, BindingFailure> Field::SetValue(void *obj, const Value &value) const
  {
    detail::StoreFn store = nullptr;
    {
      auto lock = LockRegistry();
      if (!IsFieldAlive(m_typeIndex, m_fieldIndex))
        return std::unexpected(StaleHandle(OperationKind::SetMember));
      store = GetRegistry().types[m_typeIndex].fields[m_fieldIndex].Store;
    }
    return store(obj, value);
  }

  // Property
  bool Property::IsValid() const noexcept
  {
    auto lock = LockRegistry();
    return IsPropertyAlive(m_typeIndex, m_propertyIndex);
  }

  std::string_view Property::Name() const
  {
    auto lock = LockRegistry();
    if (!IsPropertyAlive(m_typeIndex, m_propertyIndex))
      return {};
    return GetRegistry().types[m_typeIndex].properties[m_propertyIndex].name;
  }

  NGIN::UInt64 Property::TypeId() const
  {
    auto lock = LockRegistry();
    if (!IsPropertyAlive(m_typeIndex, m_propertyIndex))
      return 0;
    return GetRegistry().types[m_typeIndex].properties[m_propertyIndex].typeId;
  }

  bool Property::IsReadOnly() const
  {
    auto lock = LockRegistry();
    if (!IsPropertyAlive(m_typeIndex, m_propertyIndex))
      return true;
    return GetRegistry().types[m_typeIndex].properties[m_propertyIndex].Set == nullptr;
  }

  Value Property::GetValue(const void *obj) const
  {
    Value (*get)(const void *) = nullptr;
    {
      auto lock = LockRegistry();
      if (!IsPropertyAlive(m_typeIndex, m_propertyIndex))
        return Value::Null();
      get = GetRegistry().types[m_typeIndex].properties[m_propertyIndex].Get;
    }
    return get ? get(obj) : Value::Null();
  }

  std::expected<void, BindingFailure> Property::SetValue(void *obj, const Value &value) const
  {
    detail::StoreFn set = nullptr;
    {
      auto lock = LockRegistry();
      if (!IsPropertyAlive(m_typeIndex, m_propertyIndex))
        return std::unexpected(StaleHandle(OperationKind::SetMember));
      set = GetRegistry().types[m_typeIndex].properties[m_propertyIndex].Set;
    }
    if (!set)
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::MemberNotFound;
      f.operation = OperationKind::SetMember;
      f.message = "property is read-only";
      return std::unexpected(std::move(f));
    }
    return set(obj, value);
  }

  // Method
  bool Method::IsValid() const noexcept
  {
    auto lock = LockRegistry();
    return IsMethodAlive(m_typeIndex, m_methodIndex);
  }

  std::string_view Method::GetName() const
  {
    auto lock = LockRegistry();
    if (!IsMethodAlive(m_typeIndex, m_methodIndex))
      return {};
    return GetRegistry().types[m_typeIndex].methods[m_methodIndex].name;
  }

  NGIN::UIntSize Method::GetParameterCount() const
  {
    auto lock = LockRegistry();
    if (!IsMethodAlive(m_typeIndex, m_methodIndex))
      return 0;
    return GetRegistry().types[m_typeIndex].methods[m_methodIndex].paramTypeIds.Size();
  }

  bool Method::IsVariadic() const
  {
    auto lock = LockRegistry();
    if (!IsMethodAlive(m_typeIndex, m_methodIndex))
      return false;
    return GetRegistry().types[m_typeIndex].methods[m_methodIndex].variadic;
  }

  NGIN::UInt64 Method::GetReturnTypeId() const
  {
    auto lock = LockRegistry();
    if (!IsMethodAlive(m_typeIndex, m_methodIndex))
      return 0;
    return GetRegistry().types[m_typeIndex].methods[m_methodIndex].returnTypeId;
  }

  // Type
  bool Type::IsValid() const noexcept
  {
    auto lock = LockRegistry();
    return m_h.IsValid() && IsTypeAlive(m_h.index);
  }

  std::string_view Type::QualifiedName() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].typeId;
  }

  NGIN::UIntSize Type::Size() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].sizeBytes;
  }

  NGIN::UIntSize Type::Alignment() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].alignBytes;
  }

  NGIN::UIntSize Type::FieldCount() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].fields.Size();
  }

  Field Type::FieldAt(NGIN::UIntSize i) const
  {
    return Field{m_h.index, static_cast<NGIN::UInt32>(i)};
  }

  std::optional<Field> Type::FindField(std::string_view name) const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    NameId id{};
    if (!detail::FindNameId(name, id))
      return std::nullopt;
    const auto *p = GetRegistry().types[m_h.index].fieldIndex.GetPtr(id);
    if (!p)
      return std::nullopt;
    return Field{m_h.index, *p};
  }

  NGIN::UIntSize Type::PropertyCount() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].properties.Size();
  }

  Property Type::PropertyAt(NGIN::UIntSize i) const
  {
    return Property{m_h.index, static_cast<NGIN::UInt32>(i)};
  }

  std::optional<Property> Type::FindProperty(std::string_view name) const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    NameId id{};
    if (!detail::FindNameId(name, id))
      return std::nullopt;
    const auto *p = GetRegistry().types[m_h.index].propertyIndex.GetPtr(id);
    if (!p)
      return std::nullopt;
    return Property{m_h.index, *p};
  }

  NGIN::UIntSize Type::MethodCount() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].methods.Size();
  }

  Method Type::MethodAt(NGIN::UIntSize i) const
  {
    return Method{m_h.index, static_cast<NGIN::UInt32>(i)};
  }

  NGIN::UIntSize Type::OverloadCount(std::string_view name) const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    NameId id{};
    if (!detail::FindNameId(name, id))
      return 0;
    const auto *vec = GetRegistry().types[m_h.index].methodOverloads.GetPtr(id);
    return vec ? vec->Size() : 0;
  }

  NGIN::UIntSize Type::OperatorCount() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].operators.Size();
  }

  bool Type::HasOperator(BinaryOperator op) const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return false;
    const auto &ops = GetRegistry().types[m_h.index].operators;
    for (NGIN::UIntSize i = 0; i < ops.Size(); ++i)
      if (ops[i].op == op)
        return true;
    return false;
  }

  NGIN::UIntSize Type::ConversionCount() const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].conversions.Size();
  }

  bool Type::ConvertsTo(NGIN::UInt64 targetTypeId, ConversionMode mode) const
  {
    auto lock = LockRegistry();
    if (!IsTypeAlive(m_h.index))
      return false;
    const auto &convs = GetRegistry().types[m_h.index].conversions;
    for (NGIN::UIntSize i = 0; i < convs.Size(); ++i)
    {
      if (convs[i].targetTypeId != targetTypeId)
        continue;
      // Explicit requests also accept implicit conversions.
      if (mode == ConversionMode::Explicit || convs[i].mode == ConversionMode::Implicit)
        return true;
    }
    return false;
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto lock = LockRegistry();
    NameId id{};
    if (!detail::FindNameId(name, id))
      return std::nullopt;
    const auto *p = GetRegistry().byName.GetPtr(id);
    if (!p)
      return std::nullopt;
    return Type{TypeHandle{*p}};
  }

  std::optional<Type> FindType(NGIN::UInt64 typeId)
  {
    auto lock = LockRegistry();
    const auto *p = GetRegistry().byTypeId.GetPtr(typeId);
    if (!p)
      return std::nullopt;
    return Type{TypeHandle{*p}};
  }

} // namespace NGIN::Dispatch

// Registry.hpp
// Type surface consulted by the reflection fallback binder
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <string_view>
#include <expected>
#include <type_traits>
#include <optional>
#include <mutex>
#include <utility>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace NGIN::Dispatch: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  // Reserved method name under which call operators are stored.
  inline constexpr std::string_view kCallOperatorName = "operator()";

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    NGIN_DISPATCH_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_DISPATCH_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    NGIN_DISPATCH_API std::string_view NameFromId(NameId id) noexcept;

    // FNV-based type id; the shape id of every non-null value
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      static const NGIN::UInt64 id = [] {
        auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
        return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
      }();
      return id;
    }

    using InvokeFn = std::expected<Value, BindingFailure> (*)(void *, const Value *, NGIN::UIntSize);
    using StoreFn = std::expected<void, BindingFailure> (*)(void *, const Value &);

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId;
      Value (*Load)(const void *){nullptr};
      StoreFn Store{nullptr};
    };

    struct PropertyRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId;
      Value (*Get)(const void *){nullptr};
      StoreFn Set{nullptr};
    };

    struct MethodRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt64 returnTypeId;
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      // Variadic methods take the whole argument list and rank last.
      bool variadic{false};
      InvokeFn Invoke{nullptr};
    };

    struct OperatorRuntimeDesc
    {
      BinaryOperator op{BinaryOperator::Add};
      NGIN::UInt64 lhsTypeId{0};
      NGIN::UInt64 rhsTypeId{0};
      NGIN::UInt64 returnTypeId{0};
      std::expected<Value, BindingFailure> (*Apply)(const Value &, const Value &){nullptr};
    };

    struct ConversionRuntimeDesc
    {
      NGIN::UInt64 targetTypeId{0};
      ConversionMode mode{ConversionMode::Implicit};
      Value (*Convert)(const void *){nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId;
      NGIN::UIntSize sizeBytes;
      NGIN::UIntSize alignBytes;
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<PropertyRuntimeDesc> properties;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
      NGIN::Containers::Vector<MethodRuntimeDesc> methods;
      NGIN::Containers::FlatHashMap<NameId, NGIN::Containers::Vector<NGIN::UInt32>> methodOverloads;
      NGIN::Containers::Vector<OperatorRuntimeDesc> operators;
      NGIN::Containers::Vector<ConversionRuntimeDesc> conversions;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
      // Recursive: describing a type may register the types it mentions.
      std::recursive_mutex mutex;
    };

    NGIN_DISPATCH_API Registry &GetRegistry() noexcept;

    [[nodiscard]] inline std::unique_lock<std::recursive_mutex> LockRegistry()
    {
      return std::unique_lock<std::recursive_mutex>{GetRegistry().mutex};
    }

    // Looks up a registered type by id. Caller holds the registry lock.
    [[nodiscard]] NGIN_DISPATCH_API const TypeRuntimeDesc *FindTypeDesc(NGIN::UInt64 typeId) noexcept;

    template <class T>
    concept HasNginReflectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void NginReflect(Tag<T>, TypeBuilder<T>&)
      { NginReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Dispatch::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto lock = LockRegistry();
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.typeId = tid;
      rec.sizeBytes = sizeof(U);
      rec.alignBytes = alignof(U);

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);

      if constexpr (HasNginReflectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NginReflect(Tag<U>{}, b);
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NGIN::Dispatch::Describe<U>::Do(b);
      }
      return idx;
    }

  } // namespace detail

  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  class NGIN_DISPATCH_API Field
  {
  public:
    constexpr Field() = default;
    constexpr Field(NGIN::UInt32 typeIdx, NGIN::UInt32 fieldIdx) : m_typeIndex(typeIdx), m_fieldIndex(fieldIdx) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;

    [[nodiscard]] Value GetValue(const void *obj) const;
    [[nodiscard]] std::expected<void, BindingFailure> SetValue(void *obj, const Value &value) const;

  private:
    NGIN::UInt32 m_typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_fieldIndex{static_cast<NGIN::UInt32>(-1)};
  };

  class NGIN_DISPATCH_API Property
  {
  public:
    constexpr Property() = default;
    constexpr Property(NGIN::UInt32 typeIdx, NGIN::UInt32 propertyIdx) : m_typeIndex(typeIdx), m_propertyIndex(propertyIdx) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] bool IsReadOnly() const;

    [[nodiscard]] Value GetValue(const void *obj) const;
    [[nodiscard]] std::expected<void, BindingFailure> SetValue(void *obj, const Value &value) const;

  private:
    NGIN::UInt32 m_typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_propertyIndex{static_cast<NGIN::UInt32>(-1)};
  };

  class NGIN_DISPATCH_API Method
  {
  public:
    constexpr Method() = default;
    constexpr Method(NGIN::UInt32 typeIdx, NGIN::UInt32 methodIdx) : m_typeIndex(typeIdx), m_methodIndex(methodIdx) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view GetName() const;
    [[nodiscard]] NGIN::UIntSize GetParameterCount() const;
    [[nodiscard]] bool IsVariadic() const;
    [[nodiscard]] NGIN::UInt64 GetReturnTypeId() const;

  private:
    NGIN::UInt32 m_typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 m_methodIndex{static_cast<NGIN::UInt32>(-1)};
  };

  class NGIN_DISPATCH_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] NGIN::UIntSize Alignment() const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize PropertyCount() const;
    [[nodiscard]] Property PropertyAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Property> FindProperty(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] Method MethodAt(NGIN::UIntSize i) const;
    // Number of overloads registered under `name` (call operators: kCallOperatorName).
    [[nodiscard]] NGIN::UIntSize OverloadCount(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize OperatorCount() const;
    [[nodiscard]] bool HasOperator(BinaryOperator op) const;
    [[nodiscard]] NGIN::UIntSize ConversionCount() const;
    [[nodiscard]] bool ConvertsTo(NGIN::UInt64 targetTypeId, ConversionMode mode) const;

  private:
    TypeHandle m_h{};
  };

  // Queries
  [[nodiscard]] NGIN_DISPATCH_API std::optional<Type> FindType(std::string_view name);
  [[nodiscard]] NGIN_DISPATCH_API std::optional<Type> FindType(NGIN::UInt64 typeId);

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    return FindType(detail::TypeIdOf<std::remove_cvref_t<T>>());
  }

  // Optional eager registration helper
  template <class T>
  inline bool AutoRegister()
  {
    (void)detail::EnsureRegistered<T>();
    return true;
  }

} // namespace NGIN::Dispatch

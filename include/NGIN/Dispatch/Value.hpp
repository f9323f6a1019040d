// Value.hpp
// Runtime operand handed to the engine: null, boxed, borrowed or shared
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Registry.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Dispatch
{
  class MetaObject;

  namespace detail
  {
    template <class T>
    inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

    // Primitive shapes: arithmetic types and std::string. Everything else is reflected.
    template <class T>
    inline constexpr bool is_primitive_v =
        is_numeric_v<T> || std::is_same_v<std::remove_cvref_t<T>, std::string>;

    template <class U>
    MetaObject *MetaObjectOf(void *p) noexcept
    {
      return static_cast<U *>(p);
    }

    template <class U>
    constexpr ShapeKind ShapeKindOf() noexcept
    {
      if constexpr (std::is_base_of_v<MetaObject, U>)
        return ShapeKind::Meta;
      else if constexpr (is_primitive_v<U>)
        return ShapeKind::Primitive;
      else
        return ShapeKind::Reflected;
    }
  } // namespace detail

  class NGIN_DISPATCH_API Value
  {
  public:
    enum class Storage : NGIN::UInt8
    {
      Null = 0,
      Boxed,
      Borrowed,
      Shared,
    };

    Value() = default;

    [[nodiscard]] static Value Null() noexcept { return Value{}; }

    // Owns a copy. String literals are stored as std::string.
    template <class T>
      requires(!std::is_same_v<std::remove_cvref_t<T>, Value>)
    [[nodiscard]] static Value Box(T &&v)
    {
      using U = std::remove_cvref_t<T>;
      if constexpr (std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>)
      {
        return Box(std::string{v});
      }
      else
      {
        Value out;
        out.m_storage = Storage::Boxed;
        out.m_box = Any{std::forward<T>(v)};
        out.Stamp<U>();
        return out;
      }
    }

    // Borrows; the caller keeps `obj` alive for as long as the Value is used.
    // Bound members may write through the reference; box const objects instead.
    template <class T>
      requires(!std::is_same_v<std::remove_cvref_t<T>, Value> && !std::is_const_v<T>)
    [[nodiscard]] static Value Ref(T &obj) noexcept
    {
      using U = std::remove_volatile_t<T>;
      Value out;
      out.m_storage = Storage::Borrowed;
      out.m_ptr = static_cast<void *>(const_cast<U *>(&obj));
      out.Stamp<U>();
      return out;
    }

    template <class T>
      requires(!std::is_const_v<T>)
    [[nodiscard]] static Value Share(std::shared_ptr<T> obj) noexcept
    {
      if (!obj)
        return Value{};
      Value out;
      out.m_storage = Storage::Shared;
      out.m_ptr = static_cast<void *>(obj.get());
      out.m_owner = std::move(obj);
      out.Stamp<T>();
      return out;
    }

    [[nodiscard]] bool IsNull() const noexcept { return m_storage == Storage::Null; }
    [[nodiscard]] Storage GetStorage() const noexcept { return m_storage; }
    [[nodiscard]] ShapeKind GetShapeKind() const noexcept { return m_shape; }
    [[nodiscard]] NGIN::UInt64 GetTypeId() const noexcept { return m_typeId; }

    template <class T>
    [[nodiscard]] bool Is() const
    {
      return !IsNull() && m_typeId == detail::TypeIdOf<std::remove_cvref_t<T>>();
    }

    // Address of the underlying object; nullptr for null.
    [[nodiscard]] void *Data() const noexcept;

    // Unchecked access; use Is<T>() or Get<T>() when the type is not known.
    template <class T>
    [[nodiscard]] T &As() const noexcept
    {
      return *static_cast<T *>(Data());
    }

    template <class T>
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, BindingFailure> Get() const
    {
      using U = std::remove_cvref_t<T>;
      if (IsNull())
      {
        BindingFailure f{};
        f.kind = DispatchErrorKind::NullReceiver;
        f.operation = OperationKind::Convert;
        f.message = "value is null";
        return std::unexpected(std::move(f));
      }
      if (!Is<U>())
      {
        BindingFailure f{};
        f.kind = DispatchErrorKind::ArgumentMismatch;
        f.operation = OperationKind::Convert;
        f.shapes.PushBack(ShapeKey{m_shape, m_typeId});
        f.message = "value holds a different type";
        return std::unexpected(std::move(f));
      }
      return As<U>();
    }

    // Non-null only for values whose type derives from MetaObject.
    [[nodiscard]] MetaObject *GetMetaObject() const noexcept
    {
      return m_metaOf ? m_metaOf(Data()) : nullptr;
    }

    // Makes sure the value's type is present in the type surface; returns its type index.
    [[nodiscard]] NGIN::UInt32 EnsureDescribed() const
    {
      return m_describe ? m_describe() : static_cast<NGIN::UInt32>(-1);
    }

  private:
    template <class U>
    void Stamp()
    {
      m_typeId = detail::TypeIdOf<U>();
      m_shape = detail::ShapeKindOf<U>();
      if constexpr (std::is_base_of_v<MetaObject, U>)
        m_metaOf = &detail::MetaObjectOf<U>;
      if constexpr (!detail::is_primitive_v<U>)
        m_describe = &detail::EnsureRegistered<U>;
    }

    Storage m_storage{Storage::Null};
    ShapeKind m_shape{ShapeKind::Null};
    NGIN::UInt64 m_typeId{0};
    Any m_box{};
    void *m_ptr{nullptr};
    std::shared_ptr<void> m_owner{};
    MetaObject *(*m_metaOf)(void *){nullptr};
    NGIN::UInt32 (*m_describe)(){nullptr};
  };

  inline void *Value::Data() const noexcept
  {
    switch (m_storage)
    {
    case Storage::Boxed:
      return const_cast<void *>(static_cast<const void *>(m_box.Data()));
    case Storage::Borrowed:
    case Storage::Shared:
      return m_ptr;
    case Storage::Null:
      break;
    }
    return nullptr;
  }

} // namespace NGIN::Dispatch

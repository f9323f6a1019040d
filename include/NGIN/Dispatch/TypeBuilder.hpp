// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL friend to describe a type's dispatch surface
#pragma once

#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Value.hpp>
#include <NGIN/Dispatch/Convert.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Dispatch
{

  template <class T>
  class TypeBuilder
  {
  public:
    // Constructed by the registry when invoking ADL reflect; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Optional name override. Defaults to Meta::TypeName<T>.
    TypeBuilder &SetName(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Public data member, readable and writable through Get/SetMember.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name);

    // Getter-only property; SetMember on it fails.
    template <auto Getter>
    TypeBuilder &Property(std::string_view name);

    template <auto Getter, auto Setter>
    TypeBuilder &Property(std::string_view name);

    // Const or non-const member function. Repeating a name adds an overload.
    template <auto MemFn>
    TypeBuilder &Method(std::string_view name);

    // Catch-all overload taking the whole argument list as std::span<const Value>.
    template <auto MemFn>
    TypeBuilder &VariadicMethod(std::string_view name);

    // Makes values of T callable through Invoke(arity).
    template <auto MemFn>
    TypeBuilder &CallOperator();

    // Binary operator. Fn is a free function (L, R) or a member function of T taking R.
    template <BinaryOperator Op, auto Fn>
    TypeBuilder &Operator();

    // User-defined conversion: a const member function of T with no parameters.
    template <auto MemFn>
    TypeBuilder &Conversion(ConversionMode mode = ConversionMode::Implicit);

  private:
    void AddMethod(detail::MethodRuntimeDesc &&m);

    NGIN::UInt32 m_index{0};
  };

  namespace detail
  {
    template <class M>
    using ParamT = std::remove_cv_t<std::remove_reference_t<M>>;

    template <class R>
    inline NGIN::UInt64 ReturnTypeIdOf()
    {
      if constexpr (std::is_void_v<R>)
        return 0;
      else
        return TypeIdOf<ParamT<R>>();
    }

    template <class R>
    inline Value BoxResult(R &&r)
    {
      if constexpr (std::is_same_v<ParamT<R>, Value>)
        return std::forward<R>(r);
      else
        return Value::Box(ParamT<R>(std::forward<R>(r)));
    }

    template <auto MemberPtr>
    static Value FieldLoad(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto *c = static_cast<const C *>(obj);
      return Value::Box(static_cast<const M &>(c->*MemberPtr));
    }

    template <auto MemberPtr>
    static std::expected<void, BindingFailure> FieldStore(void *obj, const Value &value)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto converted = ConvertValue<M>(value);
      if (!converted)
      {
        converted.error().operation = OperationKind::SetMember;
        return std::unexpected(std::move(converted.error()));
      }
      auto *c = static_cast<C *>(obj);
      (c->*MemberPtr) = std::move(*converted);
      return {};
    }

    template <typename>
    struct MethodTraits;

    template <class Tuple, std::size_t... I>
    inline void PushParamIds(MethodRuntimeDesc &m, std::index_sequence<I...>)
    {
      (m.paramTypeIds.PushBack(TypeIdOf<ParamT<std::tuple_element_t<I, Tuple>>>()), ...);
    }

    inline BindingFailure ArityFailure()
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::ArgumentMismatch;
      f.operation = OperationKind::InvokeMember;
      f.message = "bad arity";
      return f;
    }

    template <class Obj, class R, class... A>
    struct MethodCall
    {
      template <auto MemFn, std::size_t... I>
      static std::expected<Value, BindingFailure> Call(Obj *c, const Value *args, std::index_sequence<I...>)
      {
        if (((ConvertValue<ParamT<A>>(args[I]).has_value()) && ...))
        {
          if constexpr (std::is_void_v<R>)
          {
            (c->*MemFn)(*ConvertValue<ParamT<A>>(args[I])...);
            return Value::Null();
          }
          else
          {
            return BoxResult((c->*MemFn)(*ConvertValue<ParamT<A>>(args[I])...));
          }
        }
        BindingFailure f{};
        f.kind = DispatchErrorKind::ArgumentMismatch;
        f.operation = OperationKind::InvokeMember;
        f.message = "argument conversion failed";
        return std::unexpected(std::move(f));
      }
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsConst = false;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      using Args = std::tuple<A...>;
      template <auto MemFn>
      static std::expected<Value, BindingFailure> Invoke(void *obj, const Value *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(ArityFailure());
        return MethodCall<C, R, A...>::template Call<MemFn>(static_cast<C *>(obj), args, std::index_sequence_for<A...>{});
      }
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsConst = true;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      using Args = std::tuple<A...>;
      template <auto MemFn>
      static std::expected<Value, BindingFailure> Invoke(void *obj, const Value *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(ArityFailure());
        return MethodCall<const C, R, A...>::template Call<MemFn>(static_cast<const C *>(obj), args, std::index_sequence_for<A...>{});
      }
    };

    template <typename>
    struct VariadicTraits;

    template <class C, class R>
    struct VariadicTraits<R (C::*)(std::span<const Value>)>
    {
      using Class = C;
      using Ret = R;
      template <auto MemFn>
      static std::expected<Value, BindingFailure> Invoke(void *obj, const Value *args, NGIN::UIntSize count)
      {
        auto *c = static_cast<C *>(obj);
        if constexpr (std::is_void_v<R>)
        {
          (c->*MemFn)(std::span<const Value>{args, count});
          return Value::Null();
        }
        else
          return BoxResult((c->*MemFn)(std::span<const Value>{args, count}));
      }
    };

    template <class C, class R>
    struct VariadicTraits<R (C::*)(std::span<const Value>) const>
    {
      using Class = C;
      using Ret = R;
      template <auto MemFn>
      static std::expected<Value, BindingFailure> Invoke(void *obj, const Value *args, NGIN::UIntSize count)
      {
        auto *c = static_cast<const C *>(obj);
        if constexpr (std::is_void_v<R>)
        {
          (c->*MemFn)(std::span<const Value>{args, count});
          return Value::Null();
        }
        else
          return BoxResult((c->*MemFn)(std::span<const Value>{args, count}));
      }
    };

    template <typename>
    struct GetterTraits;
    template <class C, class R>
    struct GetterTraits<R (C::*)() const>
    {
      using Class = C;
      using Ret = R;
    };

    template <typename>
    struct SetterTraits;
    template <class C, class R, class A>
    struct SetterTraits<R (C::*)(A)>
    {
      using Class = C;
      using Arg = A;
    };

    template <auto Getter>
    static Value PropertyGet(const void *obj)
    {
      using C = typename GetterTraits<decltype(Getter)>::Class;
      return BoxResult((static_cast<const C *>(obj)->*Getter)());
    }

    template <auto Setter>
    static std::expected<void, BindingFailure> PropertySet(void *obj, const Value &value)
    {
      using Traits = SetterTraits<decltype(Setter)>;
      using C = typename Traits::Class;
      auto converted = ConvertValue<ParamT<typename Traits::Arg>>(value);
      if (!converted)
      {
        converted.error().operation = OperationKind::SetMember;
        return std::unexpected(std::move(converted.error()));
      }
      (static_cast<C *>(obj)->*Setter)(std::move(*converted));
      return {};
    }

    template <typename>
    struct OperatorTraits;

    template <class R, class L, class Rhs>
    struct OperatorTraits<R (*)(L, Rhs)>
    {
      using Ret = R;
      using Lhs = ParamT<L>;
      using RhsT = ParamT<Rhs>;
      template <auto Fn>
      static R Call(const Lhs &l, const RhsT &r) { return Fn(l, r); }
    };

    template <class C, class R, class Rhs>
    struct OperatorTraits<R (C::*)(Rhs) const>
    {
      using Ret = R;
      using Lhs = C;
      using RhsT = ParamT<Rhs>;
      template <auto Fn>
      static R Call(const Lhs &l, const RhsT &r) { return (l.*Fn)(r); }
    };

    template <auto Fn>
    static std::expected<Value, BindingFailure> OperatorApply(const Value &lhs, const Value &rhs)
    {
      using Traits = OperatorTraits<decltype(Fn)>;
      auto l = ConvertValue<typename Traits::Lhs>(lhs);
      if (!l)
        return std::unexpected(std::move(l.error()));
      auto r = ConvertValue<typename Traits::RhsT>(rhs);
      if (!r)
        return std::unexpected(std::move(r.error()));
      if constexpr (std::is_void_v<typename Traits::Ret>)
      {
        Traits::template Call<Fn>(*l, *r);
        return Value::Null();
      }
      else
        return BoxResult(Traits::template Call<Fn>(*l, *r));
    }

    template <auto MemFn>
    static Value ConversionApply(const void *obj)
    {
      using C = typename GetterTraits<decltype(MemFn)>::Class;
      return BoxResult((static_cast<const C *>(obj)->*MemFn)());
    }
  } // namespace detail

  template <class T>
  inline void TypeBuilder<T>::AddMethod(detail::MethodRuntimeDesc &&m)
  {
    auto &tdesc = detail::GetRegistry().types[m_index];
    tdesc.methods.PushBack(std::move(m));
    const auto newIndex = static_cast<NGIN::UInt32>(tdesc.methods.Size() - 1);
    auto *vecPtr = tdesc.methodOverloads.GetPtr(tdesc.methods[newIndex].nameId);
    if (!vecPtr)
    {
      NGIN::Containers::Vector<NGIN::UInt32> v;
      v.PushBack(newIndex);
      tdesc.methodOverloads.Insert(tdesc.methods[newIndex].nameId, std::move(v));
    }
    else
    {
      vecPtr->PushBack(newIndex);
    }
  }

  template <class T>
  template <auto MemberPtr>
  inline TypeBuilder<T> &TypeBuilder<T>::Field(std::string_view name)
  {
    using MemberT = detail::MemberTypeT<MemberPtr>;
    static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Field must belong to T");
    auto &tdesc = detail::GetRegistry().types[m_index];
    detail::FieldRuntimeDesc f{};
    f.nameId = detail::InternNameId(name);
    f.name = detail::NameFromId(f.nameId);
    f.typeId = detail::TypeIdOf<MemberT>();
    f.Load = &detail::FieldLoad<MemberPtr>;
    f.Store = &detail::FieldStore<MemberPtr>;
    tdesc.fields.PushBack(std::move(f));
    const auto newIdx = static_cast<NGIN::UInt32>(tdesc.fields.Size() - 1);
    tdesc.fieldIndex.Insert(tdesc.fields[newIdx].nameId, newIdx);
    return *this;
  }

  template <class T>
  template <auto Getter>
  inline TypeBuilder<T> &TypeBuilder<T>::Property(std::string_view name)
  {
    using Traits = detail::GetterTraits<decltype(Getter)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Getter must belong to T");
    auto &tdesc = detail::GetRegistry().types[m_index];
    detail::PropertyRuntimeDesc p{};
    p.nameId = detail::InternNameId(name);
    p.name = detail::NameFromId(p.nameId);
    p.typeId = detail::ReturnTypeIdOf<typename Traits::Ret>();
    p.Get = &detail::PropertyGet<Getter>;
    tdesc.properties.PushBack(std::move(p));
    const auto newIdx = static_cast<NGIN::UInt32>(tdesc.properties.Size() - 1);
    tdesc.propertyIndex.Insert(tdesc.properties[newIdx].nameId, newIdx);
    return *this;
  }

  template <class T>
  template <auto Getter, auto Setter>
  inline TypeBuilder<T> &TypeBuilder<T>::Property(std::string_view name)
  {
    static_assert(std::is_same_v<typename detail::SetterTraits<decltype(Setter)>::Class, T>, "Setter must belong to T");
    Property<Getter>(name);
    auto &tdesc = detail::GetRegistry().types[m_index];
    tdesc.properties[tdesc.properties.Size() - 1].Set = &detail::PropertySet<Setter>;
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline TypeBuilder<T> &TypeBuilder<T>::Method(std::string_view name)
  {
    using Traits = detail::MethodTraits<decltype(MemFn)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Method must belong to T");
    detail::MethodRuntimeDesc m{};
    m.nameId = detail::InternNameId(name);
    m.name = detail::NameFromId(m.nameId);
    m.returnTypeId = detail::ReturnTypeIdOf<typename Traits::Ret>();
    constexpr auto N = Traits::Arity;
    if constexpr (N > 0)
    {
      using Tuple = typename Traits::Args;
      detail::PushParamIds<Tuple>(m, std::make_index_sequence<N>{});
    }
    m.Invoke = &Traits::template Invoke<MemFn>;
    AddMethod(std::move(m));
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline TypeBuilder<T> &TypeBuilder<T>::VariadicMethod(std::string_view name)
  {
    using Traits = detail::VariadicTraits<decltype(MemFn)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Method must belong to T");
    detail::MethodRuntimeDesc m{};
    m.nameId = detail::InternNameId(name);
    m.name = detail::NameFromId(m.nameId);
    m.returnTypeId = detail::ReturnTypeIdOf<typename Traits::Ret>();
    m.variadic = true;
    m.Invoke = &Traits::template Invoke<MemFn>;
    AddMethod(std::move(m));
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline TypeBuilder<T> &TypeBuilder<T>::CallOperator()
  {
    return Method<MemFn>(kCallOperatorName);
  }

  template <class T>
  template <BinaryOperator Op, auto Fn>
  inline TypeBuilder<T> &TypeBuilder<T>::Operator()
  {
    using Traits = detail::OperatorTraits<decltype(Fn)>;
    static_assert(std::is_same_v<typename Traits::Lhs, T> || std::is_same_v<typename Traits::RhsT, T>,
                  "Operator must take T on one side");
    detail::OperatorRuntimeDesc o{};
    o.op = Op;
    o.lhsTypeId = detail::TypeIdOf<typename Traits::Lhs>();
    o.rhsTypeId = detail::TypeIdOf<typename Traits::RhsT>();
    o.returnTypeId = detail::ReturnTypeIdOf<typename Traits::Ret>();
    o.Apply = &detail::OperatorApply<Fn>;
    detail::GetRegistry().types[m_index].operators.PushBack(std::move(o));
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline TypeBuilder<T> &TypeBuilder<T>::Conversion(ConversionMode mode)
  {
    using Traits = detail::GetterTraits<decltype(MemFn)>;
    static_assert(std::is_same_v<typename Traits::Class, T>, "Conversion must belong to T");
    static_assert(!std::is_void_v<typename Traits::Ret>, "Conversion must return a value");
    detail::ConversionRuntimeDesc c{};
    c.targetTypeId = detail::TypeIdOf<typename Traits::Ret>();
    c.mode = mode;
    c.Convert = &detail::ConversionApply<MemFn>;
    detail::GetRegistry().types[m_index].conversions.PushBack(std::move(c));
    return *this;
  }

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/ReflectionBinder.hpp>
#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Convert.hpp>

#include <climits>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace NGIN::Dispatch
{

  namespace
  {
    using detail::TypeRuntimeDesc;
    using ValueVector = NGIN::Containers::Vector<Value>;
    constexpr auto kNoIndex = static_cast<NGIN::UInt32>(-1);

    BindingFailure Fail(DispatchErrorKind kind, std::string message)
    {
      BindingFailure f{};
      f.kind = kind;
      f.message = std::move(message);
      f.permanent = true;
      return f;
    }

    BindingFailure Fail(DispatchErrorKind kind, std::string message, NGIN::Containers::Vector<OverloadDiagnostic> diags)
    {
      auto f = Fail(kind, std::move(message));
      f.diagnostics = std::move(diags);
      return f;
    }

    // Caller holds the registry lock and has described every operand.
    const TypeRuntimeDesc *DescOf(const Envelope &e) noexcept
    {
      if (e.IsNull())
        return nullptr;
      return detail::FindTypeDesc(e.value->GetTypeId());
    }

    std::string TypeNameOf(const Envelope &e)
    {
      if (e.IsNull())
        return "null";
      const auto tid = e.value->GetTypeId();
      if (auto prim = detail::PrimitiveName(tid); !prim.empty())
        return std::string{prim};
      if (const auto *desc = detail::FindTypeDesc(tid))
        return std::string{desc->qualifiedName};
      return "<unregistered>";
    }

    std::string Quoted(std::string_view s)
    {
      std::string out{"'"};
      out += s;
      out += "'";
      return out;
    }

    // Per-argument conversion applied before the bound target runs.
    struct ArgPlan
    {
      Value (*userConvert)(const void *){nullptr};
    };

    using PlanVector = NGIN::Containers::Vector<ArgPlan>;

    int ArgCost(const Envelope &arg, NGIN::UInt64 want, ArgPlan &plan)
    {
      plan = ArgPlan{};
      if (want == detail::TypeIdOf<Value>())
        return detail::kExactCost;
      if (arg.IsNull())
        return detail::kNotConvertible;
      const auto have = arg.value->GetTypeId();
      const int numeric = detail::ImplicitNumericCost(have, want);
      if (numeric < detail::kNotConvertible)
        return numeric;
      if (const auto *desc = detail::FindTypeDesc(have))
      {
        for (NGIN::UIntSize i = 0; i < desc->conversions.Size(); ++i)
        {
          const auto &c = desc->conversions[i];
          if (c.targetTypeId == want && c.mode == ConversionMode::Implicit)
          {
            plan.userConvert = c.Convert;
            return detail::kUserImplicitCost;
          }
        }
      }
      return detail::kNotConvertible;
    }

    bool NeedsConversion(const PlanVector &plans) noexcept
    {
      for (NGIN::UIntSize i = 0; i < plans.Size(); ++i)
        if (plans[i].userConvert)
          return true;
      return false;
    }

    Value ApplyPlan(const ArgPlan &plan, const Value &v)
    {
      return plan.userConvert ? plan.userConvert(v.Data()) : v;
    }

    // Operands after the receiver, converted per plan.
    ValueVector ConvertArgs(const PlanVector &plans, std::span<const Value> args)
    {
      ValueVector out;
      out.Reserve(args.size());
      for (NGIN::UIntSize i = 0; i < args.size(); ++i)
        out.PushBack(i < plans.Size() ? ApplyPlan(plans[i], args[i]) : args[i]);
      return out;
    }

    Binding MethodBinding(detail::InvokeFn invoke, PlanVector plans)
    {
      if (!NeedsConversion(plans))
      {
        return Binding::FromTarget(
            [invoke](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            {
              auto args = ops.subspan(1);
              return invoke(ops[0].Data(), args.data(), args.size());
            },
            BindingSource::Reflection);
      }
      return Binding::FromTarget(
          [invoke, plans = std::move(plans)](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
          {
            auto args = ConvertArgs(plans, ops.subspan(1));
            const Value *first = args.Size() ? &args[0] : nullptr;
            return invoke(ops[0].Data(), first, args.Size());
          },
          BindingSource::Reflection);
    }

    struct Ranked
    {
      NGIN::UInt32 index{kNoIndex};
      PlanVector plans{};
    };

    void MarkTies(NGIN::Containers::Vector<OverloadDiagnostic> &diags, int bestCost)
    {
      for (NGIN::UIntSize i = 0; i < diags.Size(); ++i)
        if (diags[i].code == DiagnosticCode::None && diags[i].totalCost == bestCost)
          diags[i].code = DiagnosticCode::Ambiguous;
    }

    // Single cheapest overload wins; equal best totals are ambiguous.
    std::expected<Ranked, BindingFailure> RankMethods(const TypeRuntimeDesc &desc,
                                                      const NGIN::Containers::Vector<NGIN::UInt32> &overloads,
                                                      std::span<const Envelope> args,
                                                      std::string_view what)
    {
      NGIN::Containers::Vector<OverloadDiagnostic> diags;
      diags.Reserve(overloads.Size());
      int bestCost = INT_MAX;
      NGIN::UIntSize bestCount = 0;
      Ranked best{};
      for (NGIN::UIntSize k = 0; k < overloads.Size(); ++k)
      {
        const auto mi = overloads[k];
        const auto &m = desc.methods[mi];
        OverloadDiagnostic diag{};
        diag.memberIndex = mi;
        diag.name = m.name;
        diag.arity = m.paramTypeIds.Size();
        PlanVector plans;
        int total = 0;
        bool ok = true;
        if (m.variadic)
        {
          diag.arity = args.size();
          total = detail::kVariadicCost;
        }
        else if (m.paramTypeIds.Size() != args.size())
        {
          diag.code = DiagnosticCode::ArityMismatch;
          auto diff = m.paramTypeIds.Size() > args.size() ? m.paramTypeIds.Size() - args.size() : args.size() - m.paramTypeIds.Size();
          diag.totalCost = 10000 + static_cast<int>(diff);
          ok = false;
        }
        else
        {
          plans.Reserve(args.size());
          for (NGIN::UIntSize i = 0; i < args.size(); ++i)
          {
            ArgPlan plan{};
            const int cost = ArgCost(args[i], m.paramTypeIds[i], plan);
            if (cost >= detail::kNotConvertible)
            {
              diag.code = DiagnosticCode::NonConvertible;
              diag.argIndex = i;
              diag.totalCost = 20000 + static_cast<int>(i);
              ok = false;
              break;
            }
            total += cost;
            plans.PushBack(plan);
          }
        }
        if (ok)
        {
          diag.totalCost = total;
          if (total < bestCost)
          {
            bestCost = total;
            bestCount = 1;
            best.index = mi;
            best.plans = std::move(plans);
          }
          else if (total == bestCost)
          {
            ++bestCount;
          }
        }
        diags.PushBack(std::move(diag));
      }
      if (bestCount == 0)
        return std::unexpected(Fail(DispatchErrorKind::ArgumentMismatch, "no viable overload of " + std::string{what}, std::move(diags)));
      if (bestCount > 1)
      {
        MarkTies(diags, bestCost);
        return std::unexpected(Fail(DispatchErrorKind::AmbiguousMatch,
                                    std::to_string(bestCount) + " overloads of " + std::string{what} + " rank equally (cost " + std::to_string(bestCost) + ")",
                                    std::move(diags)));
      }
      return best;
    }

    struct RankedOperator
    {
      const detail::OperatorRuntimeDesc *op{nullptr};
      ArgPlan lhs{};
      ArgPlan rhs{};
    };

    // Operator candidates of one table. No viable candidate is not an error here.
    std::expected<RankedOperator, BindingFailure> RankOperators(const TypeRuntimeDesc &desc, BinaryOperator op,
                                                                const Envelope &left, const Envelope &right)
    {
      NGIN::Containers::Vector<OverloadDiagnostic> diags;
      int bestCost = INT_MAX;
      NGIN::UIntSize bestCount = 0;
      RankedOperator best{};
      for (NGIN::UIntSize i = 0; i < desc.operators.Size(); ++i)
      {
        const auto &o = desc.operators[i];
        if (o.op != op)
          continue;
        OverloadDiagnostic diag{};
        diag.memberIndex = static_cast<NGIN::UInt32>(i);
        diag.name = ToString(op);
        diag.arity = 2;
        ArgPlan lp{}, rp{};
        const int lc = ArgCost(left, o.lhsTypeId, lp);
        const int rc = lc < detail::kNotConvertible ? ArgCost(right, o.rhsTypeId, rp) : detail::kNotConvertible;
        if (lc >= detail::kNotConvertible || rc >= detail::kNotConvertible)
        {
          diag.code = DiagnosticCode::NonConvertible;
          diag.argIndex = lc >= detail::kNotConvertible ? 0 : 1;
          diag.totalCost = 20000 + static_cast<int>(diag.argIndex);
        }
        else
        {
          diag.totalCost = lc + rc;
          if (diag.totalCost < bestCost)
          {
            bestCost = diag.totalCost;
            bestCount = 1;
            best = RankedOperator{&o, lp, rp};
          }
          else if (diag.totalCost == bestCost)
          {
            ++bestCount;
          }
        }
        diags.PushBack(std::move(diag));
      }
      if (bestCount > 1)
      {
        MarkTies(diags, bestCost);
        return std::unexpected(Fail(DispatchErrorKind::AmbiguousMatch,
                                    "operator " + std::string{ToString(op)} + " is ambiguous on " + std::string{desc.qualifiedName},
                                    std::move(diags)));
      }
      return best;
    }

    Binding OperatorBinding(const RankedOperator &r)
    {
      auto apply = r.op->Apply;
      auto lhs = r.lhs;
      auto rhs = r.rhs;
      return Binding::FromTarget(
          [apply, lhs, rhs](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
          {
            if (!lhs.userConvert && !rhs.userConvert)
              return apply(ops[0], ops[1]);
            return apply(ApplyPlan(lhs, ops[0]), ApplyPlan(rhs, ops[1]));
          },
          BindingSource::Reflection);
    }

    bool IsArithmetic(BinaryOperator op) noexcept
    {
      switch (op)
      {
      case BinaryOperator::Add:
      case BinaryOperator::Subtract:
      case BinaryOperator::Multiply:
      case BinaryOperator::Divide:
      case BinaryOperator::Modulo:
        return true;
      default:
        return false;
      }
    }

    bool IsEquality(BinaryOperator op) noexcept
    {
      return op == BinaryOperator::Equal || op == BinaryOperator::NotEqual;
    }

    // Signed + - * wrap instead of overflowing.
    template <class T>
    T Wrapping(BinaryOperator op, T l, T r) noexcept
    {
      if constexpr (std::is_signed_v<T> && std::is_integral_v<T>)
      {
        using U = std::make_unsigned_t<T>;
        const auto ul = static_cast<U>(l);
        const auto ur = static_cast<U>(r);
        if (op == BinaryOperator::Add)
          return static_cast<T>(ul + ur);
        if (op == BinaryOperator::Subtract)
          return static_cast<T>(ul - ur);
        return static_cast<T>(ul * ur);
      }
      else
      {
        if (op == BinaryOperator::Add)
          return static_cast<T>(l + r);
        if (op == BinaryOperator::Subtract)
          return static_cast<T>(l - r);
        return static_cast<T>(l * r);
      }
    }

    template <class T>
    void CheckIntegerDivisor(T l, T r, const char *what)
    {
      if (r == 0)
        throw std::domain_error(std::string{"integer "} + what + " by zero");
      if constexpr (std::is_signed_v<T>)
      {
        if (l == std::numeric_limits<T>::min() && r == T(-1))
          throw std::overflow_error(std::string{"integer "} + what + " overflow");
      }
    }

    template <class T>
    Value ApplyBuiltin(BinaryOperator op, T l, T r)
    {
      switch (op)
      {
      case BinaryOperator::Add:
      case BinaryOperator::Subtract:
      case BinaryOperator::Multiply:
        return Value::Box(Wrapping(op, l, r));
      case BinaryOperator::Divide:
        if constexpr (std::is_integral_v<T>)
          CheckIntegerDivisor(l, r, "division");
        return Value::Box(static_cast<T>(l / r));
      case BinaryOperator::Modulo:
        if constexpr (std::is_integral_v<T>)
        {
          CheckIntegerDivisor(l, r, "modulo");
          return Value::Box(static_cast<T>(l % r));
        }
        else
          return Value::Box(static_cast<T>(std::fmod(l, r)));
      case BinaryOperator::Equal:
        return Value::Box(l == r);
      case BinaryOperator::NotEqual:
        return Value::Box(l != r);
      case BinaryOperator::Less:
        return Value::Box(l < r);
      case BinaryOperator::LessEqual:
        return Value::Box(l <= r);
      case BinaryOperator::Greater:
        return Value::Box(l > r);
      case BinaryOperator::GreaterEqual:
        return Value::Box(l >= r);
      case BinaryOperator::Coalesce:
        break;
      }
      return Value::Box(l);
    }

    bool IsWideUnsigned(const detail::NumericReader &n) noexcept
    {
      return n.info.kind == detail::NumKind::UInt && n.info.rank >= 4;
    }

    // A signed integer mixed with a 64-bit unsigned has no common type that holds both ranges.
    bool MixesSignedWithWideUnsigned(NGIN::UInt64 lt, NGIN::UInt64 rt) noexcept
    {
      auto lr = detail::NumericReaderFor(lt);
      auto rr = detail::NumericReaderFor(rt);
      if (!lr || !rr)
        return false;
      return (IsWideUnsigned(*lr) && rr->info.kind == detail::NumKind::Int) ||
             (IsWideUnsigned(*rr) && lr->info.kind == detail::NumKind::Int);
    }

    // Built-in numeric operators. Operands promote to long double when either is long double,
    // to double when either is floating, to unsigned long long when both are unsigned and one
    // is 64-bit, otherwise to long long.
    std::optional<Binding> NumericBuiltin(BinaryOperator op, NGIN::UInt64 lt, NGIN::UInt64 rt)
    {
      auto lr = detail::NumericReaderFor(lt);
      auto rr = detail::NumericReaderFor(rt);
      if (!lr || !rr)
        return std::nullopt;
      // bool takes part in equality only
      if ((lr->info.rank == 0 || rr->info.rank == 0) && !IsEquality(op))
        return std::nullopt;
      const auto l = *lr;
      const auto r = *rr;
      const bool longDouble = (l.info.kind == detail::NumKind::Float && l.info.rank >= 3) ||
                              (r.info.kind == detail::NumKind::Float && r.info.rank >= 3);
      if (longDouble)
      {
        return Binding::FromTarget(
            [op, l, r](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            { return ApplyBuiltin<long double>(op, l.ToFloat(ops[0].Data()), r.ToFloat(ops[1].Data())); },
            BindingSource::Builtin);
      }
      if (l.info.kind == detail::NumKind::Float || r.info.kind == detail::NumKind::Float)
      {
        return Binding::FromTarget(
            [op, l, r](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            {
              return ApplyBuiltin<double>(op, static_cast<double>(l.ToFloat(ops[0].Data())),
                                          static_cast<double>(r.ToFloat(ops[1].Data())));
            },
            BindingSource::Builtin);
      }
      if (IsWideUnsigned(l) || IsWideUnsigned(r))
      {
        return Binding::FromTarget(
            [op, l, r](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            {
              return ApplyBuiltin<unsigned long long>(op, l.ToUnsigned(ops[0].Data()), r.ToUnsigned(ops[1].Data()));
            },
            BindingSource::Builtin);
      }
      return Binding::FromTarget(
          [op, l, r](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
          {
            return ApplyBuiltin<long long>(op, l.ToSigned(ops[0].Data()), r.ToSigned(ops[1].Data()));
          },
          BindingSource::Builtin);
    }

    std::optional<Binding> StringBuiltin(BinaryOperator op, NGIN::UInt64 lt, NGIN::UInt64 rt)
    {
      if (!detail::IsStringTid(lt) || !detail::IsStringTid(rt))
        return std::nullopt;
      if (IsArithmetic(op) && op != BinaryOperator::Add)
        return std::nullopt;
      return Binding::FromTarget(
          [op](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
          {
            const auto &l = ops[0].As<std::string>();
            const auto &r = ops[1].As<std::string>();
            switch (op)
            {
            case BinaryOperator::Add:
              return Value::Box(l + r);
            case BinaryOperator::Equal:
              return Value::Box(l == r);
            case BinaryOperator::NotEqual:
              return Value::Box(l != r);
            case BinaryOperator::Less:
              return Value::Box(l < r);
            case BinaryOperator::LessEqual:
              return Value::Box(l <= r);
            case BinaryOperator::Greater:
              return Value::Box(l > r);
            case BinaryOperator::GreaterEqual:
              return Value::Box(l >= r);
            default:
              break;
            }
            return ops[0];
          },
          BindingSource::Builtin);
    }

    Binding Constant(Value v)
    {
      return Binding::FromTarget([v = std::move(v)](std::span<const Value>) -> std::expected<Value, BindingFailure>
                                 { return v; },
                                 BindingSource::Builtin);
    }

    Binding Passthrough(NGIN::UIntSize operandIndex, BindingSource source)
    {
      return Binding::FromTarget([operandIndex](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                 { return ops[operandIndex]; },
                                 source);
    }
  } // namespace

  std::expected<Binding, BindingFailure> ReflectionBinder::Resolve(const Operation &op,
                                                                   std::span<const Envelope> operands) const
  {
    if (auto ok = op.ValidateOperands(operands.size()); !ok)
      return std::unexpected(std::move(ok.error()));

    auto lock = detail::LockRegistry();
    // Register every operand type up front; later lookups hold pointers into the registry.
    for (const auto &e : operands)
      if (!e.IsNull())
        (void)e.value->EnsureDescribed();

    switch (op.Kind())
    {
    case OperationKind::GetMember:
      return ResolveGetMember(op, operands);
    case OperationKind::SetMember:
      return ResolveSetMember(op, operands);
    case OperationKind::InvokeMember:
    case OperationKind::Invoke:
      return ResolveInvoke(op, operands);
    case OperationKind::Convert:
      return ResolveConvert(op, operands);
    case OperationKind::BinaryOp:
      return ResolveBinary(op, operands);
    }
    return std::unexpected(Fail(DispatchErrorKind::MemberNotFound, "unknown operation"));
  }

  std::expected<Binding, BindingFailure> ReflectionBinder::ResolveGetMember(const Operation &op,
                                                                            std::span<const Envelope> operands) const
  {
    const auto &receiver = operands[0];
    if (receiver.IsNull())
      return std::unexpected(Fail(DispatchErrorKind::NullReceiver, "cannot read member " + Quoted(op.Name()) + " of null"));
    const auto *desc = DescOf(receiver);
    NameId id{};
    if (desc && detail::FindNameId(op.Name(), id))
    {
      if (const auto *fi = desc->fieldIndex.GetPtr(id))
      {
        auto load = desc->fields[*fi].Load;
        return Binding::FromTarget([load](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                   { return load(ops[0].Data()); },
                                   BindingSource::Reflection);
      }
      if (const auto *pi = desc->propertyIndex.GetPtr(id))
      {
        auto get = desc->properties[*pi].Get;
        return Binding::FromTarget([get](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                   { return get(ops[0].Data()); },
                                   BindingSource::Reflection);
      }
    }
    return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                TypeNameOf(receiver) + " has no field or property " + Quoted(op.Name())));
  }

  std::expected<Binding, BindingFailure> ReflectionBinder::ResolveSetMember(const Operation &op,
                                                                            std::span<const Envelope> operands) const
  {
    const auto &receiver = operands[0];
    const auto &value = operands[1];
    if (receiver.IsNull())
      return std::unexpected(Fail(DispatchErrorKind::NullReceiver, "cannot assign member " + Quoted(op.Name()) + " of null"));
    const auto *desc = DescOf(receiver);
    NameId id{};
    if (desc && detail::FindNameId(op.Name(), id))
    {
      NGIN::UInt64 memberType = 0;
      detail::StoreFn store = nullptr;
      if (const auto *fi = desc->fieldIndex.GetPtr(id))
      {
        memberType = desc->fields[*fi].typeId;
        store = desc->fields[*fi].Store;
      }
      else if (const auto *pi = desc->propertyIndex.GetPtr(id))
      {
        memberType = desc->properties[*pi].typeId;
        store = desc->properties[*pi].Set;
        if (!store)
          return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                      "property " + Quoted(op.Name()) + " of " + TypeNameOf(receiver) + " is read-only"));
      }
      if (store)
      {
        ArgPlan plan{};
        if (ArgCost(value, memberType, plan) >= detail::kNotConvertible)
          return std::unexpected(Fail(DispatchErrorKind::ArgumentMismatch,
                                      "cannot assign " + TypeNameOf(value) + " to member " + Quoted(op.Name()) + " of " + TypeNameOf(receiver)));
        return Binding::FromTarget(
            [store, plan](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            {
              Value v = ApplyPlan(plan, ops[1]);
              auto stored = store(ops[0].Data(), v);
              if (!stored)
                return std::unexpected(std::move(stored.error()));
              return v;
            },
            BindingSource::Reflection);
      }
    }
    return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                TypeNameOf(receiver) + " has no field or property " + Quoted(op.Name())));
  }

  std::expected<Binding, BindingFailure> ReflectionBinder::ResolveInvoke(const Operation &op,
                                                                         std::span<const Envelope> operands) const
  {
    const bool isCall = op.Kind() == OperationKind::Invoke;
    const std::string_view name = isCall ? kCallOperatorName : op.Name();
    const auto &receiver = operands[0];
    if (receiver.IsNull())
      return std::unexpected(Fail(DispatchErrorKind::NullReceiver,
                                  isCall ? std::string{"cannot call null"} : "cannot invoke " + Quoted(name) + " on null"));
    const auto *desc = DescOf(receiver);
    NameId id{};
    const NGIN::Containers::Vector<NGIN::UInt32> *overloads = nullptr;
    if (desc && detail::FindNameId(name, id))
      overloads = desc->methodOverloads.GetPtr(id);
    if (!overloads || overloads->Size() == 0)
      return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                  isCall ? TypeNameOf(receiver) + " is not callable"
                                         : TypeNameOf(receiver) + " has no method " + Quoted(name)));
    auto ranked = RankMethods(*desc, *overloads, operands.subspan(1), name);
    if (!ranked)
      return std::unexpected(std::move(ranked.error()));
    return MethodBinding(desc->methods[ranked->index].Invoke, std::move(ranked->plans));
  }

  std::expected<Binding, BindingFailure> ReflectionBinder::ResolveConvert(const Operation &op,
                                                                          std::span<const Envelope> operands) const
  {
    const auto &source = operands[0];
    const auto target = op.TargetTypeId();
    if (source.IsNull())
      return std::unexpected(Fail(DispatchErrorKind::NullReceiver, "cannot convert null to " + std::string{op.Name()}));
    const auto have = source.value->GetTypeId();
    if (have == target)
      return Passthrough(0, BindingSource::Builtin);

    const auto from = detail::NumInfoFromTid(have);
    const auto to = detail::NumInfoFromTid(target);
    if (from.kind != detail::NumKind::None && to.kind != detail::NumKind::None)
    {
      const bool allowed = op.Mode() == ConversionMode::Explicit ||
                           detail::ImplicitNumericCost(have, target) < detail::kNotConvertible;
      if (allowed)
      {
        return Binding::FromTarget(
            [target](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
            {
              // Shape was checked at bind time, so the cast cannot fail here.
              return *detail::NumericCast(ops[0], target);
            },
            BindingSource::Builtin);
      }
    }

    if (const auto *desc = DescOf(source))
    {
      for (NGIN::UIntSize i = 0; i < desc->conversions.Size(); ++i)
      {
        const auto &c = desc->conversions[i];
        if (c.targetTypeId != target)
          continue;
        if (c.mode == ConversionMode::Explicit && op.Mode() == ConversionMode::Implicit)
          continue;
        auto convert = c.Convert;
        return Binding::FromTarget([convert](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                   { return convert(ops[0].Data()); },
                                   BindingSource::Reflection);
      }
    }
    const char *mode = op.Mode() == ConversionMode::Explicit ? "explicit" : "implicit";
    return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                std::string{"no "} + mode + " conversion from " + TypeNameOf(source) + " to " + std::string{op.Name()}));
  }

  std::expected<Binding, BindingFailure> ReflectionBinder::ResolveBinary(const Operation &op,
                                                                         std::span<const Envelope> operands) const
  {
    const auto oper = op.Operator();
    const auto &left = operands[0];
    const auto &right = operands[1];

    // ?? never consults operator tables
    if (oper == BinaryOperator::Coalesce)
      return Passthrough(left.IsNull() ? 1 : 0, BindingSource::Builtin);

    if (left.IsNull() || right.IsNull())
    {
      if (IsEquality(oper))
      {
        const bool equal = left.IsNull() && right.IsNull();
        return Constant(Value::Box(oper == BinaryOperator::Equal ? equal : !equal));
      }
      return std::unexpected(Fail(DispatchErrorKind::NullReceiver,
                                  "operator " + std::string{ToString(oper)} + " does not accept null (" +
                                      TypeNameOf(left) + ", " + TypeNameOf(right) + ")"));
    }

    // Left operand's table first, then the right's.
    const auto *ldesc = DescOf(left);
    const auto *rdesc = DescOf(right);
    if (ldesc)
    {
      auto r = RankOperators(*ldesc, oper, left, right);
      if (!r)
        return std::unexpected(std::move(r.error()));
      if (r->op)
        return OperatorBinding(*r);
    }
    if (rdesc && rdesc != ldesc)
    {
      auto r = RankOperators(*rdesc, oper, left, right);
      if (!r)
        return std::unexpected(std::move(r.error()));
      if (r->op)
        return OperatorBinding(*r);
    }

    const auto lt = left.value->GetTypeId();
    const auto rt = right.value->GetTypeId();
    if (MixesSignedWithWideUnsigned(lt, rt))
      return std::unexpected(Fail(DispatchErrorKind::AmbiguousMatch,
                                  "operator " + std::string{ToString(oper)} + " is ambiguous for (" + TypeNameOf(left) +
                                      ", " + TypeNameOf(right) + "): signed and 64-bit unsigned operands"));
    if (auto b = NumericBuiltin(oper, lt, rt))
      return std::move(*b);
    if (auto b = StringBuiltin(oper, lt, rt))
      return std::move(*b);

    return std::unexpected(Fail(DispatchErrorKind::MemberNotFound,
                                "no operator " + std::string{ToString(oper)} + " for (" + TypeNameOf(left) + ", " +
                                    TypeNameOf(right) + ")"));
  }

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Convert.hpp>

#include <cstdio>
#include <string>

namespace NGIN::Dispatch
{

  std::string_view ToString(ShapeKind kind) noexcept
  {
    switch (kind)
    {
    case ShapeKind::Null:
      return "Null";
    case ShapeKind::Primitive:
      return "Primitive";
    case ShapeKind::Reflected:
      return "Reflected";
    case ShapeKind::Meta:
      return "Meta";
    }
    return "?";
  }

  std::string_view ToString(OperationKind kind) noexcept
  {
    switch (kind)
    {
    case OperationKind::GetMember:
      return "GetMember";
    case OperationKind::SetMember:
      return "SetMember";
    case OperationKind::InvokeMember:
      return "InvokeMember";
    case OperationKind::Invoke:
      return "Invoke";
    case OperationKind::Convert:
      return "Convert";
    case OperationKind::BinaryOp:
      return "BinaryOp";
    }
    return "?";
  }

  std::string_view ToString(BinaryOperator op) noexcept
  {
    switch (op)
    {
    case BinaryOperator::Add:
      return "+";
    case BinaryOperator::Subtract:
      return "-";
    case BinaryOperator::Multiply:
      return "*";
    case BinaryOperator::Divide:
      return "/";
    case BinaryOperator::Modulo:
      return "%";
    case BinaryOperator::Equal:
      return "==";
    case BinaryOperator::NotEqual:
      return "!=";
    case BinaryOperator::Less:
      return "<";
    case BinaryOperator::LessEqual:
      return "<=";
    case BinaryOperator::Greater:
      return ">";
    case BinaryOperator::GreaterEqual:
      return ">=";
    case BinaryOperator::Coalesce:
      return "??";
    }
    return "?";
  }

  std::string_view ToString(DispatchErrorKind kind) noexcept
  {
    switch (kind)
    {
    case DispatchErrorKind::MemberNotFound:
      return "MemberNotFound";
    case DispatchErrorKind::AmbiguousMatch:
      return "AmbiguousMatch";
    case DispatchErrorKind::ArgumentMismatch:
      return "ArgumentMismatch";
    case DispatchErrorKind::NullReceiver:
      return "NullReceiver";
    case DispatchErrorKind::MetaObjectError:
      return "MetaObjectError";
    case DispatchErrorKind::ShapeChangedDuringBind:
      return "ShapeChangedDuringBind";
    }
    return "?";
  }

  namespace
  {
    std::string ShapeName(const ShapeKey &key)
    {
      if (key.IsNull())
        return "null";
      if (auto prim = detail::PrimitiveName(key.id); !prim.empty())
        return std::string{prim};
      {
        auto lock = detail::LockRegistry();
        if (const auto *desc = detail::FindTypeDesc(key.id))
          return std::string{desc->qualifiedName};
      }
      char buf[32];
      std::snprintf(buf, sizeof(buf), "#%016llx", static_cast<unsigned long long>(key.id));
      return std::string{ToString(key.kind)} + buf;
    }

    std::string_view CodeName(DiagnosticCode code) noexcept
    {
      switch (code)
      {
      case DiagnosticCode::None:
        return "viable";
      case DiagnosticCode::ArityMismatch:
        return "arity mismatch";
      case DiagnosticCode::NonConvertible:
        return "argument not convertible";
      case DiagnosticCode::Ambiguous:
        return "ambiguous";
      }
      return "?";
    }
  } // namespace

  std::string FormatFailure(const BindingFailure &failure)
  {
    std::string out;
    out += ToString(failure.kind);
    out += ": ";
    out += ToString(failure.operation);
    if (!failure.member.empty())
    {
      out += " '";
      out += failure.member;
      out += "'";
    }
    out += " on (";
    for (NGIN::UIntSize i = 0; i < failure.shapes.Size(); ++i)
    {
      if (i)
        out += ", ";
      out += ShapeName(failure.shapes[i]);
    }
    out += ")";
    if (!failure.message.empty())
    {
      out += ": ";
      out += failure.message;
    }
    if (failure.permanent)
      out += " [permanent]";
    for (NGIN::UIntSize i = 0; i < failure.diagnostics.Size(); ++i)
    {
      const auto &d = failure.diagnostics[i];
      out += "\n  candidate ";
      out += d.name;
      out += "/";
      out += std::to_string(d.arity);
      out += ": ";
      out += CodeName(d.code);
      if (d.code == DiagnosticCode::NonConvertible)
      {
        out += " at #";
        out += std::to_string(d.argIndex);
      }
      else if (d.code == DiagnosticCode::None || d.code == DiagnosticCode::Ambiguous)
      {
        out += ", cost ";
        out += std::to_string(d.totalCost);
      }
    }
    return out;
  }

  DispatchError::DispatchError(BindingFailure failure)
      : std::runtime_error(FormatFailure(failure)), m_failure(std::move(failure))
  {
  }

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/Operation.hpp>

#include <string>

namespace NGIN::Dispatch
{

  Operation Operation::GetMember(std::string_view name)
  {
    Operation op;
    op.m_kind = OperationKind::GetMember;
    op.m_name = std::string{name};
    return op;
  }

  Operation Operation::SetMember(std::string_view name)
  {
    Operation op;
    op.m_kind = OperationKind::SetMember;
    op.m_name = std::string{name};
    op.m_arity = 1;
    return op;
  }

  Operation Operation::InvokeMember(std::string_view name, NGIN::UIntSize arity)
  {
    Operation op;
    op.m_kind = OperationKind::InvokeMember;
    op.m_name = std::string{name};
    op.m_arity = arity;
    return op;
  }

  Operation Operation::Invoke(NGIN::UIntSize arity)
  {
    Operation op;
    op.m_kind = OperationKind::Invoke;
    op.m_arity = arity;
    return op;
  }

  Operation Operation::Binary(BinaryOperator oper)
  {
    Operation op;
    op.m_kind = OperationKind::BinaryOp;
    op.m_operator = oper;
    op.m_arity = 1;
    return op;
  }

  Operation Operation::Convert(NGIN::UInt64 targetTypeId, std::string_view targetName, ConversionMode mode)
  {
    Operation op;
    op.m_kind = OperationKind::Convert;
    op.m_targetTypeId = targetTypeId;
    op.m_name = std::string{targetName};
    op.m_mode = mode;
    return op;
  }

  NGIN::UIntSize Operation::OperandCount() const noexcept
  {
    switch (m_kind)
    {
    case OperationKind::GetMember:
    case OperationKind::Convert:
      return 1;
    case OperationKind::SetMember:
    case OperationKind::BinaryOp:
      return 2;
    case OperationKind::InvokeMember:
    case OperationKind::Invoke:
      return 1 + m_arity;
    }
    return 0;
  }

  std::expected<void, BindingFailure> Operation::Validate() const
  {
    const bool named = m_kind == OperationKind::GetMember || m_kind == OperationKind::SetMember ||
                       m_kind == OperationKind::InvokeMember;
    if (named && m_name.empty())
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::ArgumentMismatch;
      f.operation = m_kind;
      f.message = "member name is empty";
      return std::unexpected(std::move(f));
    }
    if (m_kind == OperationKind::Convert && m_targetTypeId == 0)
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::ArgumentMismatch;
      f.operation = m_kind;
      f.message = "conversion has no target type";
      return std::unexpected(std::move(f));
    }
    return {};
  }

  std::expected<void, BindingFailure> Operation::ValidateOperands(NGIN::UIntSize count) const
  {
    if (auto ok = Validate(); !ok)
      return ok;
    if (count != OperandCount())
    {
      BindingFailure f{};
      f.kind = DispatchErrorKind::ArgumentMismatch;
      f.operation = m_kind;
      f.member = m_name;
      f.message = "expected " + std::to_string(OperandCount()) + " operands, got " + std::to_string(count);
      return std::unexpected(std::move(f));
    }
    return {};
  }

  std::string ToString(const Operation &op)
  {
    std::string out{ToString(op.Kind())};
    out += "(";
    switch (op.Kind())
    {
    case OperationKind::GetMember:
    case OperationKind::SetMember:
      out += op.Name();
      break;
    case OperationKind::InvokeMember:
      out += op.Name();
      out += "/";
      out += std::to_string(op.Arity());
      break;
    case OperationKind::Invoke:
      out += std::to_string(op.Arity());
      break;
    case OperationKind::Convert:
      out += op.Mode() == ConversionMode::Explicit ? "explicit " : "";
      out += op.Name();
      break;
    case OperationKind::BinaryOp:
      out += ToString(op.Operator());
      break;
    }
    out += ")";
    return out;
  }

} // namespace NGIN::Dispatch

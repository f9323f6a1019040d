#include <NGIN/Dispatch/MetaObject.hpp>

namespace NGIN::Dispatch
{

  MetaResult MetaObject::TryGetMember(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult MetaObject::TrySetMember(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult MetaObject::TryInvokeMember(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult MetaObject::TryInvoke(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult MetaObject::TryConvert(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult MetaObject::TryBinaryOperation(const Operation &, std::span<const Envelope>)
  {
    return MetaResult::NotApplicable();
  }

  MetaResult DispatchToMetaObject(MetaObject &meta, const Operation &op, std::span<const Envelope> operands)
  {
    switch (op.Kind())
    {
    case OperationKind::GetMember:
      return meta.TryGetMember(op, operands);
    case OperationKind::SetMember:
      return meta.TrySetMember(op, operands);
    case OperationKind::InvokeMember:
      return meta.TryInvokeMember(op, operands);
    case OperationKind::Invoke:
      return meta.TryInvoke(op, operands);
    case OperationKind::Convert:
      return meta.TryConvert(op, operands);
    case OperationKind::BinaryOp:
      return meta.TryBinaryOperation(op, operands);
    }
    return MetaResult::NotApplicable();
  }

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/Binder.hpp>
#include <NGIN/Dispatch/MetaObject.hpp>

#include <string>

namespace NGIN::Dispatch
{

  namespace
  {
    // Fills the context every failure must carry so it can be reported without the type surface.
    BindingFailure Complete(BindingFailure failure, const Operation &op, std::span<const Envelope> operands)
    {
      failure.operation = op.Kind();
      if (failure.member.empty())
      {
        if (op.Kind() == OperationKind::BinaryOp)
          failure.member = std::string{ToString(op.Operator())};
        else
          failure.member = std::string{op.Name()};
      }
      if (failure.shapes.Size() == 0)
      {
        failure.shapes.Reserve(operands.size());
        for (const auto &e : operands)
          failure.shapes.PushBack(e.shape);
      }
      return failure;
    }
  } // namespace

  std::expected<Binding, BindingFailure> Binder::Bind(const Operation &op, std::span<const Envelope> operands) const
  {
    if (auto ok = op.ValidateOperands(operands.size()); !ok)
      return std::unexpected(Complete(std::move(ok.error()), op, operands));

    if (operands[0].meta)
    {
      auto result = DispatchToMetaObject(*operands[0].meta, op, operands);
      if (result.IsResolved())
      {
        if (!result.Target())
        {
          BindingFailure f{};
          f.kind = DispatchErrorKind::MetaObjectError;
          f.message = "meta-object resolved to an empty target";
          return std::unexpected(Complete(std::move(f), op, operands));
        }
        return Binding::FromTarget(result.TakeTarget(), BindingSource::MetaObject);
      }
      if (result.IsFailed())
      {
        BindingFailure f{};
        f.kind = DispatchErrorKind::MetaObjectError;
        f.message = result.Reason();
        f.permanent = false;
        return std::unexpected(Complete(std::move(f), op, operands));
      }
    }

    auto bound = m_reflection.Resolve(op, operands);
    if (!bound)
      return std::unexpected(Complete(std::move(bound.error()), op, operands));
    return bound;
  }

} // namespace NGIN::Dispatch

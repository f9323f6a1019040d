// MetaObject.hpp
// Host-supplied resolution hooks consulted before reflection
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Binding.hpp>
#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/Operation.hpp>

#include <optional>
#include <span>
#include <string>
#include <utility>

namespace NGIN::Dispatch
{

  // Tri-state answer of a meta-object hook. NotApplicable is the routine "ask reflection" path.
  class MetaResult
  {
  public:
    enum class State : NGIN::UInt8
    {
      NotApplicable = 0,
      Resolved,
      Failed,
    };

    [[nodiscard]] static MetaResult Resolved(BindingTarget target)
    {
      MetaResult r;
      r.m_state = State::Resolved;
      r.m_target = std::move(target);
      return r;
    }
    [[nodiscard]] static MetaResult NotApplicable() { return MetaResult{}; }
    [[nodiscard]] static MetaResult Failed(std::string reason)
    {
      MetaResult r;
      r.m_state = State::Failed;
      r.m_reason = std::move(reason);
      return r;
    }

    [[nodiscard]] State GetState() const noexcept { return m_state; }
    [[nodiscard]] bool IsResolved() const noexcept { return m_state == State::Resolved; }
    [[nodiscard]] bool IsNotApplicable() const noexcept { return m_state == State::NotApplicable; }
    [[nodiscard]] bool IsFailed() const noexcept { return m_state == State::Failed; }

    [[nodiscard]] const BindingTarget &Target() const noexcept { return m_target; }
    [[nodiscard]] BindingTarget TakeTarget() noexcept { return std::move(m_target); }
    [[nodiscard]] const std::string &Reason() const noexcept { return m_reason; }

  private:
    State m_state{State::NotApplicable};
    BindingTarget m_target{};
    std::string m_reason{};
  };

  // Derive a host type from MetaObject to take over binding for its values. Every hook
  // defaults to NotApplicable, so a host may override only the operations it handles.
  // Hooks receive the operand envelopes of the bind; the returned target receives the
  // operand values of each later execution, so it must not capture the envelopes.
  class NGIN_DISPATCH_API MetaObject
  {
  public:
    virtual ~MetaObject() = default;

    // Extra shape discriminator mixed into the host's type id. Hosts whose binding
    // depends on runtime state (e.g. a property bag's key set) return a key for that state.
    [[nodiscard]] virtual std::optional<NGIN::UInt64> CustomShapeKey() const { return std::nullopt; }

    [[nodiscard]] virtual MetaResult TryGetMember(const Operation &op, std::span<const Envelope> operands);
    [[nodiscard]] virtual MetaResult TrySetMember(const Operation &op, std::span<const Envelope> operands);
    [[nodiscard]] virtual MetaResult TryInvokeMember(const Operation &op, std::span<const Envelope> operands);
    [[nodiscard]] virtual MetaResult TryInvoke(const Operation &op, std::span<const Envelope> operands);
    [[nodiscard]] virtual MetaResult TryConvert(const Operation &op, std::span<const Envelope> operands);
    [[nodiscard]] virtual MetaResult TryBinaryOperation(const Operation &op, std::span<const Envelope> operands);

  protected:
    MetaObject() = default;
    MetaObject(const MetaObject &) = default;
    MetaObject &operator=(const MetaObject &) = default;
  };

  // Routes to the hook matching op.Kind().
  [[nodiscard]] NGIN_DISPATCH_API MetaResult DispatchToMetaObject(MetaObject &meta, const Operation &op,
                                                                  std::span<const Envelope> operands);

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/Binding.hpp>

namespace NGIN::Dispatch
{

  Binding Binding::FromTarget(BindingTarget target, BindingSource source)
  {
    auto s = std::make_shared<State>();
    s->target = std::move(target);
    s->source = source;
    return Binding{std::move(s)};
  }

  Binding Binding::PermanentFailure(BindingFailure failure)
  {
    auto s = std::make_shared<State>();
    s->failure = std::move(failure);
    s->failure.permanent = true;
    s->failed = true;
    return Binding{std::move(s)};
  }

  bool Binding::IsFailure() const noexcept
  {
    return m_state && m_state->failed;
  }

  BindingSource Binding::Source() const noexcept
  {
    return m_state ? m_state->source : BindingSource::Reflection;
  }

  const BindingFailure &Binding::Failure() const
  {
    static const BindingFailure kNone{};
    return m_state ? m_state->failure : kNone;
  }

  std::expected<Value, BindingFailure> Binding::Invoke(std::span<const Value> operands) const
  {
    if (!m_state || m_state->failed || !m_state->target)
      return std::unexpected(Failure());
    return m_state->target(operands);
  }

} // namespace NGIN::Dispatch

// Binding.hpp
// Executable plan produced by the binder for one shape tuple
#pragma once

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Value.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <span>

namespace NGIN::Dispatch
{
  // Receives the operands of the current execution in operand order.
  using BindingTarget = std::function<std::expected<Value, BindingFailure>(std::span<const Value>)>;

  enum class BindingSource : NGIN::UInt8
  {
    MetaObject = 0,
    Reflection,
    Builtin,
  };

  // Either a target or a permanent-failure sentinel. Cheap to copy; the payload is shared.
  class NGIN_DISPATCH_API Binding
  {
  public:
    Binding() = default;

    [[nodiscard]] static Binding FromTarget(BindingTarget target, BindingSource source);
    [[nodiscard]] static Binding PermanentFailure(BindingFailure failure);

    [[nodiscard]] bool IsValid() const noexcept { return static_cast<bool>(m_state); }
    [[nodiscard]] bool IsFailure() const noexcept;
    [[nodiscard]] BindingSource Source() const noexcept;
    // Only meaningful when IsFailure().
    [[nodiscard]] const BindingFailure &Failure() const;

    // Runs the target, or returns the recorded failure. Exceptions from the target propagate.
    [[nodiscard]] std::expected<Value, BindingFailure> Invoke(std::span<const Value> operands) const;

  private:
    struct State
    {
      BindingTarget target{};
      BindingSource source{BindingSource::Reflection};
      BindingFailure failure{};
      bool failed{false};
    };

    explicit Binding(std::shared_ptr<const State> s) : m_state(std::move(s)) {}

    std::shared_ptr<const State> m_state{};
  };

} // namespace NGIN::Dispatch

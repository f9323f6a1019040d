// Binder.hpp
// Two-tier binder: the first operand's meta-object, then reflection
#pragma once

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Binding.hpp>
#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/Operation.hpp>
#include <NGIN/Dispatch/ReflectionBinder.hpp>

#include <expected>
#include <span>

namespace NGIN::Dispatch
{

  // Holds no mutable state and is shared by every call site of an engine.
  //
  // A meta-object that resolves or fails is authoritative; only NotApplicable falls
  // through to reflection. Meta-object failures are transient (never cached) since
  // host state may change. Every failure carries the operation, member name, operand
  // shapes and a formatted message.
  class NGIN_DISPATCH_API Binder
  {
  public:
    [[nodiscard]] std::expected<Binding, BindingFailure> Bind(const Operation &op,
                                                             std::span<const Envelope> operands) const;

  private:
    ReflectionBinder m_reflection{};
  };

} // namespace NGIN::Dispatch

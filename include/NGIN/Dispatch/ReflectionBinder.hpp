// ReflectionBinder.hpp
// Resolves operations against the registered type surface
#pragma once

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Binding.hpp>
#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/Operation.hpp>

#include <expected>
#include <span>

namespace NGIN::Dispatch
{

  // Stateless. Failures derived from the type surface are marked permanent since the
  // surface never changes after registration.
  class NGIN_DISPATCH_API ReflectionBinder
  {
  public:
    [[nodiscard]] std::expected<Binding, BindingFailure> Resolve(const Operation &op,
                                                                std::span<const Envelope> operands) const;

  private:
    [[nodiscard]] std::expected<Binding, BindingFailure> ResolveGetMember(const Operation &op, std::span<const Envelope> operands) const;
    [[nodiscard]] std::expected<Binding, BindingFailure> ResolveSetMember(const Operation &op, std::span<const Envelope> operands) const;
    [[nodiscard]] std::expected<Binding, BindingFailure> ResolveInvoke(const Operation &op, std::span<const Envelope> operands) const;
    [[nodiscard]] std::expected<Binding, BindingFailure> ResolveConvert(const Operation &op, std::span<const Envelope> operands) const;
    [[nodiscard]] std::expected<Binding, BindingFailure> ResolveBinary(const Operation &op, std::span<const Envelope> operands) const;
  };

} // namespace NGIN::Dispatch

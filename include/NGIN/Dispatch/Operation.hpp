// Operation.hpp
// Immutable descriptor of one late-bound operation
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Registry.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <type_traits>

namespace NGIN::Dispatch
{

  // Operands are laid out receiver first, then arguments left to right:
  //   GetMember    receiver
  //   SetMember    receiver, value
  //   InvokeMember receiver, arg0 .. argN-1
  //   Invoke       callee, arg0 .. argN-1
  //   Convert      value
  //   BinaryOp     left, right
  class NGIN_DISPATCH_API Operation
  {
  public:
    [[nodiscard]] static Operation GetMember(std::string_view name);
    [[nodiscard]] static Operation SetMember(std::string_view name);
    [[nodiscard]] static Operation InvokeMember(std::string_view name, NGIN::UIntSize arity);
    [[nodiscard]] static Operation Invoke(NGIN::UIntSize arity);
    [[nodiscard]] static Operation Binary(BinaryOperator op);
    [[nodiscard]] static Operation Convert(NGIN::UInt64 targetTypeId, std::string_view targetName, ConversionMode mode);

    template <class T>
    [[nodiscard]] static Operation Convert(ConversionMode mode = ConversionMode::Implicit)
    {
      using U = std::remove_cvref_t<T>;
      return Convert(detail::TypeIdOf<U>(), NGIN::Meta::TypeName<U>::qualifiedName, mode);
    }

    [[nodiscard]] OperationKind Kind() const noexcept { return m_kind; }
    // Member name for GetMember, SetMember and InvokeMember; target type name for Convert.
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] NGIN::UIntSize Arity() const noexcept { return m_arity; }
    [[nodiscard]] NGIN::UIntSize OperandCount() const noexcept;
    [[nodiscard]] BinaryOperator Operator() const noexcept { return m_operator; }
    [[nodiscard]] NGIN::UInt64 TargetTypeId() const noexcept { return m_targetTypeId; }
    [[nodiscard]] ConversionMode Mode() const noexcept { return m_mode; }

    // Checks the descriptor invariants (non-empty member names, a target type for Convert).
    [[nodiscard]] std::expected<void, BindingFailure> Validate() const;

    // Checks the descriptor and that `count` operands were supplied.
    [[nodiscard]] std::expected<void, BindingFailure> ValidateOperands(NGIN::UIntSize count) const;

    friend bool operator==(const Operation &, const Operation &) = default;

  private:
    Operation() = default;

    OperationKind m_kind{OperationKind::GetMember};
    std::string m_name{};
    NGIN::UIntSize m_arity{0};
    BinaryOperator m_operator{BinaryOperator::Add};
    NGIN::UInt64 m_targetTypeId{0};
    ConversionMode m_mode{ConversionMode::Implicit};
  };

  // e.g. "InvokeMember(Add/1)"
  [[nodiscard]] NGIN_DISPATCH_API std::string ToString(const Operation &op);

} // namespace NGIN::Dispatch

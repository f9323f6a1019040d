// Types.hpp
// Shape keys, operation kinds, and the binding failure record
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <NGIN/Dispatch/Export.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace NGIN::Dispatch
{

  using Any = NGIN::Utilities::Any<>;

  // Tagged shape of an operand. Null is reserved and never produced for a real type.
  enum class ShapeKind : NGIN::UInt8
  {
    Null = 0,
    Primitive = 1,
    Reflected = 2,
    Meta = 3,
  };

  struct ShapeKey
  {
    ShapeKind kind{ShapeKind::Null};
    NGIN::UInt64 id{0};

    [[nodiscard]] static constexpr ShapeKey Null() noexcept { return ShapeKey{}; }
    [[nodiscard]] constexpr bool IsNull() const noexcept { return kind == ShapeKind::Null; }

    friend constexpr bool operator==(const ShapeKey &, const ShapeKey &) noexcept = default;
  };

  enum class OperationKind : NGIN::UInt8
  {
    GetMember = 0,
    SetMember = 1,
    InvokeMember = 2,
    Invoke = 3,
    Convert = 4,
    BinaryOp = 5,
  };

  enum class BinaryOperator : NGIN::UInt8
  {
    Add = 0,
    Subtract,
    Multiply,
    Divide,
    Modulo,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Coalesce,
  };

  enum class ConversionMode : NGIN::UInt8
  {
    Implicit = 0,
    Explicit = 1,
  };

  enum class DispatchErrorKind : unsigned
  {
    MemberNotFound = 1,
    AmbiguousMatch = 2,
    ArgumentMismatch = 3,
    NullReceiver = 4,
    MetaObjectError = 5,
    ShapeChangedDuringBind = 6,
  };

  enum class DiagnosticCode : unsigned
  {
    None = 0,
    ArityMismatch = 1,
    NonConvertible = 2,
    Ambiguous = 3,
  };

  // One record per candidate examined during overload resolution.
  struct OverloadDiagnostic
  {
    NGIN::UInt32 memberIndex{static_cast<NGIN::UInt32>(-1)};
    std::string_view name{};
    NGIN::UIntSize arity{0};
    DiagnosticCode code{DiagnosticCode::None};
    NGIN::UIntSize argIndex{static_cast<NGIN::UIntSize>(-1)};
    int totalCost{0};
  };

  // Binder-level failure. Converted to DispatchError at the call-site boundary.
  struct BindingFailure
  {
    DispatchErrorKind kind{DispatchErrorKind::MemberNotFound};
    OperationKind operation{OperationKind::GetMember};
    std::string member{};
    NGIN::Containers::Vector<ShapeKey> shapes{};
    std::string message{};
    NGIN::Containers::Vector<OverloadDiagnostic> diagnostics{};
    // Set when the same shape tuple can never bind; such failures are cached.
    bool permanent{false};
  };

  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(ShapeKind kind) noexcept;
  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(OperationKind kind) noexcept;
  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(BinaryOperator op) noexcept;
  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(DispatchErrorKind kind) noexcept;

  // Human-readable diagnostic built from the failure record alone.
  [[nodiscard]] NGIN_DISPATCH_API std::string FormatFailure(const BindingFailure &failure);

  // Raised when an operation could not be dispatched. Errors thrown by a
  // successfully bound operation are never wrapped in this type.
  class NGIN_DISPATCH_API DispatchError : public std::runtime_error
  {
  public:
    explicit DispatchError(BindingFailure failure);

    [[nodiscard]] DispatchErrorKind Kind() const noexcept { return m_failure.kind; }
    [[nodiscard]] const BindingFailure &Failure() const noexcept { return m_failure; }

  private:
    BindingFailure m_failure;
  };

  class Value;
  class Type;
  class Field;
  class Property;
  class Method;

} // namespace NGIN::Dispatch

// Convert.hpp
// Value -> T conversion helpers and numeric conversion ranking
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Value.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace NGIN::Dispatch::detail
{
  enum class NumKind
  {
    None,
    Int,
    UInt,
    Float
  };

  struct NumInfo
  {
    NumKind kind;
    int rank;
  };

  [[nodiscard]] NGIN_DISPATCH_API NumInfo NumInfoFromTid(NGIN::UInt64 tid) noexcept;
  [[nodiscard]] NGIN_DISPATCH_API bool IsStringTid(NGIN::UInt64 tid) noexcept;
  // Spelling of a primitive type id ("int", "std::string"); empty for other ids.
  [[nodiscard]] NGIN_DISPATCH_API std::string_view PrimitiveName(NGIN::UInt64 tid) noexcept;

  // Conversion costs used by overload ranking. Lower wins.
  inline constexpr int kExactCost = 0;
  inline constexpr int kUserImplicitCost = 10;
  inline constexpr int kVariadicCost = 100;
  inline constexpr int kNotConvertible = 1000;

  // Implicit cost between two primitive type ids: exact 0, same-kind widening 1,
  // unsigned to wider signed 2, integer to floating 3. Narrowing is not implicit.
  [[nodiscard]] NGIN_DISPATCH_API int ImplicitNumericCost(NGIN::UInt64 have, NGIN::UInt64 want) noexcept;

  // Typed readers for one numeric type id, resolved once at bind time.
  struct NumericReader
  {
    NumInfo info{NumKind::None, -1};
    long double (*ToFloat)(const void *){nullptr};
    long long (*ToSigned)(const void *){nullptr};
    unsigned long long (*ToUnsigned)(const void *){nullptr};
  };

  [[nodiscard]] NGIN_DISPATCH_API std::optional<NumericReader> NumericReaderFor(NGIN::UInt64 tid) noexcept;

  // Any numeric to any numeric, narrowing allowed. std::nullopt when either side is not numeric.
  [[nodiscard]] NGIN_DISPATCH_API std::optional<Value> NumericCast(const Value &src, NGIN::UInt64 targetTid);

  // Exact match or arithmetic conversion of a primitive Value into To.
  template <class To>
  inline std::expected<std::remove_cv_t<std::remove_reference_t<To>>, BindingFailure>
  ConvertValue(const Value &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    if constexpr (std::is_same_v<Dest, Value>)
    {
      return src;
    }
    else
    {
      const auto tid = src.GetTypeId();
      if (!src.IsNull() && tid == TypeIdOf<Dest>())
      {
        return src.template As<Dest>();
      }
      if constexpr (is_numeric_v<Dest>)
      {
        if (tid == TypeIdOf<bool>())
          return static_cast<Dest>(src.template As<bool>());
        if (tid == TypeIdOf<signed char>())
          return static_cast<Dest>(src.template As<signed char>());
        if (tid == TypeIdOf<unsigned char>())
          return static_cast<Dest>(src.template As<unsigned char>());
        if (tid == TypeIdOf<char>())
          return static_cast<Dest>(src.template As<char>());
        if (tid == TypeIdOf<short>())
          return static_cast<Dest>(src.template As<short>());
        if (tid == TypeIdOf<unsigned short>())
          return static_cast<Dest>(src.template As<unsigned short>());
        if (tid == TypeIdOf<int>())
          return static_cast<Dest>(src.template As<int>());
        if (tid == TypeIdOf<unsigned int>())
          return static_cast<Dest>(src.template As<unsigned int>());
        if (tid == TypeIdOf<long>())
          return static_cast<Dest>(src.template As<long>());
        if (tid == TypeIdOf<unsigned long>())
          return static_cast<Dest>(src.template As<unsigned long>());
        if (tid == TypeIdOf<long long>())
          return static_cast<Dest>(src.template As<long long>());
        if (tid == TypeIdOf<unsigned long long>())
          return static_cast<Dest>(src.template As<unsigned long long>());
        if (tid == TypeIdOf<float>())
          return static_cast<Dest>(src.template As<float>());
        if (tid == TypeIdOf<double>())
          return static_cast<Dest>(src.template As<double>());
        if (tid == TypeIdOf<long double>())
          return static_cast<Dest>(src.template As<long double>());
      }
      BindingFailure f{};
      f.kind = DispatchErrorKind::ArgumentMismatch;
      f.operation = OperationKind::Convert;
      f.shapes.PushBack(ShapeKey{src.GetShapeKind(), tid});
      f.message = "argument type not convertible";
      return std::unexpected(std::move(f));
    }
  }

} // namespace NGIN::Dispatch::detail

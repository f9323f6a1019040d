#include <NGIN/Dispatch/Convert.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace NGIN::Dispatch::detail
{

  namespace
  {
    struct PrimitiveEntry
    {
      NGIN::UInt64 tid{0};
      std::string_view name{};
      NumInfo info{NumKind::None, -1};
      long double (*ToFloat)(const void *){nullptr};
      long long (*ToSigned)(const void *){nullptr};
      unsigned long long (*ToUnsigned)(const void *){nullptr};
      Value (*FromFloat)(long double){nullptr};
      Value (*FromSigned)(long long){nullptr};
      Value (*FromUnsigned)(unsigned long long){nullptr};
    };

    // Explicit floating conversion; values the target cannot represent are an error of the conversion.
    template <class T>
    T FloatTo(long double v)
    {
      if constexpr (std::is_same_v<T, bool>)
      {
        return v != 0;
      }
      else if constexpr (std::is_integral_v<T>)
      {
        const long double t = std::trunc(v);
        const long double lo = static_cast<long double>(std::numeric_limits<T>::min());
        const long double hi = std::ldexp(1.0L, std::numeric_limits<T>::digits);
        if (!(t >= lo && t < hi))
          throw std::overflow_error("floating value out of range of integer target");
        return static_cast<T>(t);
      }
      else
      {
        if (std::isfinite(v) && std::fabs(v) > static_cast<long double>(std::numeric_limits<T>::max()))
          throw std::overflow_error("floating value out of range of floating target");
        return static_cast<T>(v);
      }
    }

    template <class T>
    PrimitiveEntry MakeNumeric(std::string_view name, NumKind kind, int rank)
    {
      PrimitiveEntry e{};
      e.tid = TypeIdOf<T>();
      e.name = name;
      e.info = NumInfo{kind, rank};
      e.ToFloat = [](const void *p) { return static_cast<long double>(*static_cast<const T *>(p)); };
      e.ToSigned = [](const void *p) { return static_cast<long long>(*static_cast<const T *>(p)); };
      e.ToUnsigned = [](const void *p) { return static_cast<unsigned long long>(*static_cast<const T *>(p)); };
      e.FromFloat = [](long double v) { return Value::Box(FloatTo<T>(v)); };
      e.FromSigned = [](long long v) { return Value::Box(static_cast<T>(v)); };
      e.FromUnsigned = [](unsigned long long v) { return Value::Box(static_cast<T>(v)); };
      return e;
    }

    using PrimitiveTable = std::array<PrimitiveEntry, 16>;

    const PrimitiveTable &Primitives()
    {
      static const PrimitiveTable table = [] {
        PrimitiveTable t{};
        t[0] = MakeNumeric<bool>("bool", NumKind::UInt, 0);
        t[1] = MakeNumeric<signed char>("signed char", NumKind::Int, 1);
        t[2] = MakeNumeric<unsigned char>("unsigned char", NumKind::UInt, 1);
        t[3] = MakeNumeric<char>("char", NumKind::Int, 1);
        t[4] = MakeNumeric<short>("short", NumKind::Int, 2);
        t[5] = MakeNumeric<unsigned short>("unsigned short", NumKind::UInt, 2);
        t[6] = MakeNumeric<int>("int", NumKind::Int, 3);
        t[7] = MakeNumeric<unsigned int>("unsigned int", NumKind::UInt, 3);
        t[8] = MakeNumeric<long>("long", NumKind::Int, 4);
        t[9] = MakeNumeric<unsigned long>("unsigned long", NumKind::UInt, 4);
        t[10] = MakeNumeric<long long>("long long", NumKind::Int, 5);
        t[11] = MakeNumeric<unsigned long long>("unsigned long long", NumKind::UInt, 5);
        t[12] = MakeNumeric<float>("float", NumKind::Float, 1);
        t[13] = MakeNumeric<double>("double", NumKind::Float, 2);
        t[14] = MakeNumeric<long double>("long double", NumKind::Float, 3);
        t[15].tid = TypeIdOf<std::string>();
        t[15].name = "std::string";
        return t;
      }();
      return table;
    }

    const PrimitiveEntry *FindPrimitive(NGIN::UInt64 tid) noexcept
    {
      for (const auto &e : Primitives())
        if (e.tid == tid)
          return &e;
      return nullptr;
    }
  } // namespace

  NumInfo NumInfoFromTid(NGIN::UInt64 tid) noexcept
  {
    if (const auto *e = FindPrimitive(tid))
      return e->info;
    return {NumKind::None, -1};
  }

  bool IsStringTid(NGIN::UInt64 tid) noexcept
  {
    return tid == TypeIdOf<std::string>();
  }

  std::string_view PrimitiveName(NGIN::UInt64 tid) noexcept
  {
    if (const auto *e = FindPrimitive(tid))
      return e->name;
    return {};
  }

  int ImplicitNumericCost(NGIN::UInt64 have, NGIN::UInt64 want) noexcept
  {
    if (have == want)
      return kExactCost;
    const auto h = NumInfoFromTid(have);
    const auto w = NumInfoFromTid(want);
    if (h.kind == NumKind::None || w.kind == NumKind::None)
      return kNotConvertible;
    // bool only converts explicitly
    if (h.rank == 0 || w.rank == 0)
      return kNotConvertible;
    if (h.kind == w.kind && h.rank <= w.rank)
      return 1;
    if (h.kind == NumKind::UInt && w.kind == NumKind::Int && h.rank < w.rank)
      return 2;
    if (w.kind == NumKind::Float && (h.kind == NumKind::Int || h.kind == NumKind::UInt))
      return 3;
    return kNotConvertible;
  }

  std::optional<NumericReader> NumericReaderFor(NGIN::UInt64 tid) noexcept
  {
    const auto *e = FindPrimitive(tid);
    if (!e || e->info.kind == NumKind::None)
      return std::nullopt;
    return NumericReader{e->info, e->ToFloat, e->ToSigned, e->ToUnsigned};
  }

  std::optional<Value> NumericCast(const Value &src, NGIN::UInt64 targetTid)
  {
    if (src.IsNull())
      return std::nullopt;
    const auto *from = FindPrimitive(src.GetTypeId());
    const auto *to = FindPrimitive(targetTid);
    if (!from || !to || from->info.kind == NumKind::None || to->info.kind == NumKind::None)
      return std::nullopt;
    const void *p = src.Data();
    switch (from->info.kind)
    {
    case NumKind::Float:
      return to->FromFloat(from->ToFloat(p));
    case NumKind::Int:
      return to->FromSigned(from->ToSigned(p));
    case NumKind::UInt:
      return to->FromUnsigned(from->ToUnsigned(p));
    case NumKind::None:
      break;
    }
    return std::nullopt;
  }

} // namespace NGIN::Dispatch::detail

// Trace.hpp
// Optional per-site event sink for cache diagnostics
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Dispatch/Export.hpp>

#include <functional>
#include <string_view>

namespace NGIN::Dispatch
{
  class Operation;
  class ShapeTuple;
  class Binding;
  struct BindingFailure;

  enum class TraceEventKind : NGIN::UInt8
  {
    Hit = 0,
    Miss,
    Bind,
    BindFailed,
    Evict,
    Promote,
    PermanentFailure,
    ShapeChangeRetry,
  };

  // Pointers are valid only during the callback.
  struct TraceEvent
  {
    TraceEventKind kind{TraceEventKind::Hit};
    const Operation *operation{nullptr};
    const ShapeTuple *shapes{nullptr};
    const BindingFailure *failure{nullptr};
    NGIN::UIntSize cacheSize{0};
    // Set on Hit and Bind.
    const Binding *binding{nullptr};
  };

  // Invoked synchronously on the executing thread; must be thread-safe when the site is shared.
  using TraceSink = std::function<void(const TraceEvent &)>;

  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(TraceEventKind kind) noexcept;

} // namespace NGIN::Dispatch

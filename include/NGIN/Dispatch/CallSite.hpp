// CallSite.hpp
// Per-expression inline cache of bindings keyed by operand shape tuple
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Value.hpp>
#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/Binding.hpp>
#include <NGIN/Dispatch/Binder.hpp>
#include <NGIN/Dispatch/Operation.hpp>
#include <NGIN/Dispatch/Trace.hpp>

#include <array>
#include <atomic>
#include <expected>
#include <initializer_list>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Dispatch
{

  inline constexpr NGIN::UIntSize kMaxInlineCapacity = 4;
  inline constexpr NGIN::UIntSize kDefaultInlineCapacity = 4;
  inline constexpr NGIN::UInt32 kDefaultPromotionThreshold = 16;

  struct CallSiteOptions
  {
    // Entries kept in the inline snapshot, 1..kMaxInlineCapacity.
    NGIN::UIntSize inlineCapacity{kDefaultInlineCapacity};
    // Misses after which evicted entries move to the polymorphic table. Must be > 0.
    NGIN::UInt32 promotionThreshold{kDefaultPromotionThreshold};
    bool enablePolymorphicTable{true};
    TraceSink trace{};

    [[nodiscard]] NGIN_DISPATCH_API std::expected<void, std::string_view> Validate() const;
  };

  struct CallSiteStats
  {
    NGIN::UInt64 hits{0};
    NGIN::UInt64 misses{0};
    NGIN::UInt64 binds{0};
    NGIN::UInt64 bindFailures{0};
    NGIN::UInt64 evictions{0};
    NGIN::UInt64 shapeChangeRetries{0};
    bool promoted{false};
  };

  // Per shape tuple. Rebound marks a binding installed after the site had already
  // bound a different tuple.
  enum class SiteState : NGIN::UInt8
  {
    Unbound = 0,
    Bound,
    Rebound,
    PermanentlyFailing,
  };

  [[nodiscard]] NGIN_DISPATCH_API std::string_view ToString(SiteState state) noexcept;

  namespace detail
  {
    struct CacheEntry
    {
      ShapeTuple shapes{};
      Binding binding{};
      bool rebound{false};
      mutable std::atomic<NGIN::UInt64> lastUsed{0};
    };

    // Immutable once published; a miss builds a new snapshot and swaps it in.
    struct CacheSnapshot
    {
      NGIN::Containers::Vector<std::shared_ptr<const CacheEntry>> inlineEntries{};
      NGIN::Containers::Vector<std::shared_ptr<const CacheEntry>> polymorphic{};
      // Tuple hash -> index into polymorphic. Colliding tuples are found by linear scan.
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> polymorphicIndex{};
      bool promoted{false};
    };

    template <class A>
    inline Value ToOperand(A &&a)
    {
      if constexpr (std::is_same_v<std::remove_cvref_t<A>, Value>)
        return std::forward<A>(a);
      else
        return Value::Box(std::forward<A>(a));
    }
  } // namespace detail

  // One per static call location. Safe to execute from many threads at once: hits read
  // an immutable snapshot with a single atomic load; misses bind and publish a new
  // snapshot with a compare-exchange loop (last installer wins).
  class NGIN_DISPATCH_API CallSite
  {
  public:
    // Throws std::invalid_argument for invalid options or an invalid operation.
    CallSite(Operation op, const Binder &binder, CallSiteOptions options = {});

    CallSite(const CallSite &) = delete;
    CallSite &operator=(const CallSite &) = delete;

    [[nodiscard]] std::expected<Value, BindingFailure> TryExecute(std::span<const Value> operands);
    [[nodiscard]] std::expected<Value, BindingFailure> TryExecute(std::initializer_list<Value> operands)
    {
      return TryExecute(std::span<const Value>{operands.begin(), operands.size()});
    }

    // Throws DispatchError when the operation cannot be dispatched. Exceptions raised
    // by the bound operation itself propagate unchanged.
    Value Execute(std::span<const Value> operands);
    Value Execute(std::initializer_list<Value> operands)
    {
      return Execute(std::span<const Value>{operands.begin(), operands.size()});
    }

    // Non-Value arguments are boxed.
    template <class... A>
    Value Call(A &&...args)
    {
      std::array<Value, sizeof...(A)> operands{detail::ToOperand(std::forward<A>(args))...};
      return Execute(std::span<const Value>{operands.data(), operands.size()});
    }

    [[nodiscard]] SiteState StateOf(std::span<const Value> operands) const;
    [[nodiscard]] SiteState StateOf(std::initializer_list<Value> operands) const
    {
      return StateOf(std::span<const Value>{operands.begin(), operands.size()});
    }

    [[nodiscard]] CallSiteStats Stats() const noexcept;
    [[nodiscard]] NGIN::UIntSize InlineSize() const noexcept;
    [[nodiscard]] NGIN::UIntSize CacheSize() const noexcept;
    [[nodiscard]] bool IsPromoted() const noexcept;

    // Drops every entry, including permanent failures, and the promotion state.
    void Clear();
    // Drops only permanent-failure entries.
    void ClearFailures();

    [[nodiscard]] const Operation &GetOperation() const noexcept { return m_operation; }
    [[nodiscard]] const CallSiteOptions &Options() const noexcept { return m_options; }

  private:
    using Snapshot = detail::CacheSnapshot;
    using EntryPtr = std::shared_ptr<const detail::CacheEntry>;

    [[nodiscard]] EntryPtr Lookup(const Snapshot &snap, const ShapeTuple &shapes) const noexcept;
    [[nodiscard]] std::expected<Value, BindingFailure> RunEntry(const detail::CacheEntry &entry,
                                                               std::span<const Value> operands) const;
    [[nodiscard]] std::expected<Value, BindingFailure> Miss(std::span<const Value> operands, WrappedOperands wrapped);
    void Install(const ShapeTuple &shapes, Binding binding);
    void Emit(TraceEventKind kind, const ShapeTuple *shapes, const BindingFailure *failure = nullptr,
              const Binding *binding = nullptr) const;

    Operation m_operation;
    const Binder *m_binder;
    CallSiteOptions m_options;

    std::atomic<std::shared_ptr<const Snapshot>> m_snapshot;
    std::atomic<NGIN::UInt64> m_clock{0};

    mutable std::atomic<NGIN::UInt64> m_hits{0};
    std::atomic<NGIN::UInt64> m_misses{0};
    // Misses counted toward promotion; reset by Clear().
    std::atomic<NGIN::UInt64> m_promotionMisses{0};
    std::atomic<NGIN::UInt64> m_binds{0};
    std::atomic<NGIN::UInt64> m_bindFailures{0};
    std::atomic<NGIN::UInt64> m_evictions{0};
    std::atomic<NGIN::UInt64> m_shapeChangeRetries{0};
  };

} // namespace NGIN::Dispatch

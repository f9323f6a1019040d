#include <NGIN/Dispatch/CallSite.hpp>

#include <stdexcept>
#include <string>

namespace NGIN::Dispatch
{

  std::string_view ToString(SiteState state) noexcept
  {
    switch (state)
    {
    case SiteState::Unbound:
      return "Unbound";
    case SiteState::Bound:
      return "Bound";
    case SiteState::Rebound:
      return "Rebound";
    case SiteState::PermanentlyFailing:
      return "PermanentlyFailing";
    }
    return "?";
  }

  std::string_view ToString(TraceEventKind kind) noexcept
  {
    switch (kind)
    {
    case TraceEventKind::Hit:
      return "Hit";
    case TraceEventKind::Miss:
      return "Miss";
    case TraceEventKind::Bind:
      return "Bind";
    case TraceEventKind::BindFailed:
      return "BindFailed";
    case TraceEventKind::Evict:
      return "Evict";
    case TraceEventKind::Promote:
      return "Promote";
    case TraceEventKind::PermanentFailure:
      return "PermanentFailure";
    case TraceEventKind::ShapeChangeRetry:
      return "ShapeChangeRetry";
    }
    return "?";
  }

  std::expected<void, std::string_view> CallSiteOptions::Validate() const
  {
    if (inlineCapacity < 1 || inlineCapacity > kMaxInlineCapacity)
      return std::unexpected(std::string_view{"inlineCapacity must be between 1 and kMaxInlineCapacity"});
    if (promotionThreshold == 0)
      return std::unexpected(std::string_view{"promotionThreshold must be positive"});
    return {};
  }

  namespace
  {
    using EntryVector = NGIN::Containers::Vector<std::shared_ptr<const detail::CacheEntry>>;

    void IndexPolymorphic(detail::CacheSnapshot &snap)
    {
      for (NGIN::UIntSize i = 0; i < snap.polymorphic.Size(); ++i)
      {
        const auto hash = snap.polymorphic[i]->shapes.Hash();
        if (!snap.polymorphicIndex.GetPtr(hash))
          snap.polymorphicIndex.Insert(hash, static_cast<NGIN::UInt32>(i));
      }
    }

    BindingFailure WithShapes(BindingFailure failure, const Operation &op, const ShapeTuple &shapes)
    {
      failure.operation = op.Kind();
      if (failure.member.empty())
        failure.member = op.Kind() == OperationKind::BinaryOp ? std::string{ToString(op.Operator())}
                                                              : std::string{op.Name()};
      failure.shapes = shapes.Keys();
      return failure;
    }
  } // namespace

  CallSite::CallSite(Operation op, const Binder &binder, CallSiteOptions options)
      : m_operation(std::move(op)), m_binder(&binder), m_options(std::move(options)),
        m_snapshot(std::make_shared<const Snapshot>())
  {
    if (auto ok = m_options.Validate(); !ok)
      throw std::invalid_argument(std::string{ok.error()});
    if (auto ok = m_operation.Validate(); !ok)
      throw std::invalid_argument(ok.error().message);
  }

  CallSite::EntryPtr CallSite::Lookup(const Snapshot &snap, const ShapeTuple &shapes) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < snap.inlineEntries.Size(); ++i)
      if (snap.inlineEntries[i]->shapes == shapes)
        return snap.inlineEntries[i];
    if (snap.polymorphic.Size() == 0)
      return nullptr;
    const auto *idx = snap.polymorphicIndex.GetPtr(shapes.Hash());
    if (!idx)
      return nullptr;
    if (snap.polymorphic[*idx]->shapes == shapes)
      return snap.polymorphic[*idx];
    for (NGIN::UIntSize i = 0; i < snap.polymorphic.Size(); ++i)
      if (snap.polymorphic[i]->shapes == shapes)
        return snap.polymorphic[i];
    return nullptr;
  }

  std::expected<Value, BindingFailure> CallSite::RunEntry(const detail::CacheEntry &entry,
                                                          std::span<const Value> operands) const
  {
    if (entry.binding.IsFailure())
    {
      Emit(TraceEventKind::PermanentFailure, &entry.shapes, &entry.binding.Failure());
      return std::unexpected(entry.binding.Failure());
    }
    return entry.binding.Invoke(operands);
  }

  std::expected<Value, BindingFailure> CallSite::TryExecute(std::span<const Value> operands)
  {
    if (auto ok = m_operation.ValidateOperands(operands.size()); !ok)
      return std::unexpected(WithShapes(std::move(ok.error()), m_operation, ShapesOf(operands)));

    auto wrapped = WrapAll(operands);
    const auto snap = m_snapshot.load(std::memory_order_acquire);
    if (auto entry = Lookup(*snap, wrapped.shapes))
    {
      entry->lastUsed.store(m_clock.fetch_add(1, std::memory_order_relaxed) + 1, std::memory_order_relaxed);
      m_hits.fetch_add(1, std::memory_order_relaxed);
      if (m_options.trace)
        Emit(TraceEventKind::Hit, &wrapped.shapes, nullptr, &entry->binding);
      return RunEntry(*entry, operands);
    }
    return Miss(operands, std::move(wrapped));
  }

  Value CallSite::Execute(std::span<const Value> operands)
  {
    auto result = TryExecute(operands);
    if (!result)
      throw DispatchError(std::move(result.error()));
    return std::move(*result);
  }

  std::expected<Value, BindingFailure> CallSite::Miss(std::span<const Value> operands, WrappedOperands wrapped)
  {
    m_misses.fetch_add(1, std::memory_order_relaxed);
    m_promotionMisses.fetch_add(1, std::memory_order_relaxed);
    Emit(TraceEventKind::Miss, &wrapped.shapes);

    for (int attempt = 0;; ++attempt)
    {
      const std::span<const Envelope> envelopes{&wrapped.envelopes[0], wrapped.envelopes.Size()};
      auto bound = m_binder->Bind(m_operation, envelopes);

      // A binding is only valid for the tuple it was produced for.
      auto after = ShapesOf(operands);
      if (!(after == wrapped.shapes))
      {
        if (attempt == 0)
        {
          m_shapeChangeRetries.fetch_add(1, std::memory_order_relaxed);
          Emit(TraceEventKind::ShapeChangeRetry, &after);
          wrapped = WrapAll(operands);
          continue;
        }
        BindingFailure f{};
        f.kind = DispatchErrorKind::ShapeChangedDuringBind;
        f.message = "operand shapes changed while binding";
        f.permanent = false;
        m_bindFailures.fetch_add(1, std::memory_order_relaxed);
        auto failure = WithShapes(std::move(f), m_operation, after);
        Emit(TraceEventKind::BindFailed, &after, &failure);
        return std::unexpected(std::move(failure));
      }

      if (!bound)
      {
        m_bindFailures.fetch_add(1, std::memory_order_relaxed);
        Emit(TraceEventKind::BindFailed, &wrapped.shapes, &bound.error());
        if (bound.error().permanent)
          Install(wrapped.shapes, Binding::PermanentFailure(bound.error()));
        return std::unexpected(std::move(bound.error()));
      }

      m_binds.fetch_add(1, std::memory_order_relaxed);
      Emit(TraceEventKind::Bind, &wrapped.shapes, nullptr, &*bound);
      Install(wrapped.shapes, *bound);
      return bound->Invoke(operands);
    }
  }

  void CallSite::Install(const ShapeTuple &shapes, Binding binding)
  {
    auto entry = std::make_shared<detail::CacheEntry>();
    entry->shapes = shapes;
    entry->binding = std::move(binding);
    entry->lastUsed.store(m_clock.fetch_add(1, std::memory_order_relaxed) + 1, std::memory_order_relaxed);

    const bool wantPromotion = m_options.enablePolymorphicTable &&
                               m_promotionMisses.load(std::memory_order_relaxed) >= m_options.promotionThreshold;

    auto current = m_snapshot.load(std::memory_order_acquire);
    for (;;)
    {
      auto next = std::make_shared<Snapshot>();
      next->promoted = current->promoted || wantPromotion;
      entry->rebound = false;

      for (NGIN::UIntSize i = 0; i < current->inlineEntries.Size(); ++i)
      {
        const auto &e = current->inlineEntries[i];
        if (e->shapes == shapes)
          continue;
        entry->rebound = entry->rebound || !e->binding.IsFailure();
        next->inlineEntries.PushBack(e);
      }
      for (NGIN::UIntSize i = 0; i < current->polymorphic.Size(); ++i)
      {
        const auto &e = current->polymorphic[i];
        if (e->shapes == shapes)
          continue;
        entry->rebound = entry->rebound || !e->binding.IsFailure();
        next->polymorphic.PushBack(e);
      }

      EntryPtr evicted{};
      if (next->inlineEntries.Size() >= m_options.inlineCapacity)
      {
        NGIN::UIntSize lru = 0;
        for (NGIN::UIntSize i = 1; i < next->inlineEntries.Size(); ++i)
          if (next->inlineEntries[i]->lastUsed.load(std::memory_order_relaxed) <
              next->inlineEntries[lru]->lastUsed.load(std::memory_order_relaxed))
            lru = i;
        evicted = next->inlineEntries[lru];
        EntryVector kept;
        kept.Reserve(next->inlineEntries.Size());
        for (NGIN::UIntSize i = 0; i < next->inlineEntries.Size(); ++i)
          if (i != lru)
            kept.PushBack(next->inlineEntries[i]);
        next->inlineEntries = std::move(kept);
      }
      next->inlineEntries.PushBack(EntryPtr{entry});
      if (evicted && next->promoted)
        next->polymorphic.PushBack(evicted);
      IndexPolymorphic(*next);

      const bool promotedNow = next->promoted && !current->promoted;
      const auto size = next->inlineEntries.Size() + next->polymorphic.Size();
      std::shared_ptr<const Snapshot> published = std::move(next);
      if (m_snapshot.compare_exchange_weak(current, published, std::memory_order_acq_rel, std::memory_order_acquire))
      {
        if (evicted)
        {
          m_evictions.fetch_add(1, std::memory_order_relaxed);
          if (m_options.trace)
          {
            TraceEvent ev{TraceEventKind::Evict, &m_operation, &evicted->shapes, nullptr, size};
            m_options.trace(ev);
          }
        }
        if (promotedNow)
          Emit(TraceEventKind::Promote, &shapes);
        return;
      }
    }
  }

  void CallSite::Emit(TraceEventKind kind, const ShapeTuple *shapes, const BindingFailure *failure,
                      const Binding *binding) const
  {
    if (!m_options.trace)
      return;
    TraceEvent ev{kind, &m_operation, shapes, failure, CacheSize(), binding};
    m_options.trace(ev);
  }

  SiteState CallSite::StateOf(std::span<const Value> operands) const
  {
    const auto shapes = ShapesOf(operands);
    const auto snap = m_snapshot.load(std::memory_order_acquire);
    auto entry = Lookup(*snap, shapes);
    if (!entry)
      return SiteState::Unbound;
    if (entry->binding.IsFailure())
      return SiteState::PermanentlyFailing;
    return entry->rebound ? SiteState::Rebound : SiteState::Bound;
  }

  CallSiteStats CallSite::Stats() const noexcept
  {
    CallSiteStats s{};
    s.hits = m_hits.load(std::memory_order_relaxed);
    s.misses = m_misses.load(std::memory_order_relaxed);
    s.binds = m_binds.load(std::memory_order_relaxed);
    s.bindFailures = m_bindFailures.load(std::memory_order_relaxed);
    s.evictions = m_evictions.load(std::memory_order_relaxed);
    s.shapeChangeRetries = m_shapeChangeRetries.load(std::memory_order_relaxed);
    s.promoted = IsPromoted();
    return s;
  }

  NGIN::UIntSize CallSite::InlineSize() const noexcept
  {
    return m_snapshot.load(std::memory_order_acquire)->inlineEntries.Size();
  }

  NGIN::UIntSize CallSite::CacheSize() const noexcept
  {
    const auto snap = m_snapshot.load(std::memory_order_acquire);
    return snap->inlineEntries.Size() + snap->polymorphic.Size();
  }

  bool CallSite::IsPromoted() const noexcept
  {
    return m_snapshot.load(std::memory_order_acquire)->promoted;
  }

  void CallSite::Clear()
  {
    m_promotionMisses.store(0, std::memory_order_relaxed);
    m_snapshot.store(std::make_shared<const Snapshot>(), std::memory_order_release);
  }

  void CallSite::ClearFailures()
  {
    auto current = m_snapshot.load(std::memory_order_acquire);
    for (;;)
    {
      auto next = std::make_shared<Snapshot>();
      next->promoted = current->promoted;
      for (NGIN::UIntSize i = 0; i < current->inlineEntries.Size(); ++i)
        if (!current->inlineEntries[i]->binding.IsFailure())
          next->inlineEntries.PushBack(current->inlineEntries[i]);
      for (NGIN::UIntSize i = 0; i < current->polymorphic.Size(); ++i)
        if (!current->polymorphic[i]->binding.IsFailure())
          next->polymorphic.PushBack(current->polymorphic[i]);
      IndexPolymorphic(*next);
      std::shared_ptr<const Snapshot> published = std::move(next);
      if (m_snapshot.compare_exchange_weak(current, published, std::memory_order_acq_rel, std::memory_order_acquire))
        return;
    }
  }

} // namespace NGIN::Dispatch

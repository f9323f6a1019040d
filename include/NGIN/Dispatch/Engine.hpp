// Engine.hpp
// Entry point: owns the shared binder and creates call sites
#pragma once

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Value.hpp>
#include <NGIN/Dispatch/Binder.hpp>
#include <NGIN/Dispatch/CallSite.hpp>
#include <NGIN/Dispatch/Operation.hpp>

#include <expected>
#include <initializer_list>
#include <memory>
#include <span>

namespace NGIN::Dispatch
{

  struct EngineOptions
  {
    // Options given to sites created without explicit options.
    CallSiteOptions siteDefaults{};
  };

  class NGIN_DISPATCH_API DispatchEngine
  {
  public:
    DispatchEngine() = default;
    // Throws std::invalid_argument when siteDefaults do not validate.
    explicit DispatchEngine(EngineOptions options);

    DispatchEngine(const DispatchEngine &) = delete;
    DispatchEngine &operator=(const DispatchEngine &) = delete;

    // Sites borrow the engine's binder; the engine must outlive them.
    [[nodiscard]] std::unique_ptr<CallSite> CreateSite(Operation op) const;
    [[nodiscard]] std::unique_ptr<CallSite> CreateSite(Operation op, CallSiteOptions options) const;

    // Binds from scratch on every call. No cache involved.
    [[nodiscard]] std::expected<Value, BindingFailure> TryExecuteUncached(const Operation &op,
                                                                         std::span<const Value> operands) const;
    Value ExecuteUncached(const Operation &op, std::span<const Value> operands) const;
    Value ExecuteUncached(const Operation &op, std::initializer_list<Value> operands) const
    {
      return ExecuteUncached(op, std::span<const Value>{operands.begin(), operands.size()});
    }

    [[nodiscard]] const Binder &GetBinder() const noexcept { return m_binder; }
    [[nodiscard]] const EngineOptions &Options() const noexcept { return m_options; }

  private:
    Binder m_binder{};
    EngineOptions m_options{};
  };

  // Process-wide engine used by StaticSite.
  [[nodiscard]] NGIN_DISPATCH_API DispatchEngine &DefaultEngine();

  // One call site per Key type, created from the default engine on first use.
  // `op` is only read by the first call.
  //   struct ReadValue;
  //   auto v = StaticSite<ReadValue>(Operation::GetMember("Value")).Call(obj);
  template <class Key>
  [[nodiscard]] CallSite &StaticSite(const Operation &op)
  {
    static const std::unique_ptr<CallSite> site = DefaultEngine().CreateSite(op);
    return *site;
  }

} // namespace NGIN::Dispatch

#include <NGIN/Dispatch/Engine.hpp>
#include <NGIN/Dispatch/Envelope.hpp>

#include <stdexcept>
#include <string>

namespace NGIN::Dispatch
{

  DispatchEngine::DispatchEngine(EngineOptions options)
      : m_options(std::move(options))
  {
    if (auto ok = m_options.siteDefaults.Validate(); !ok)
      throw std::invalid_argument(std::string{ok.error()});
  }

  std::unique_ptr<CallSite> DispatchEngine::CreateSite(Operation op) const
  {
    return std::make_unique<CallSite>(std::move(op), m_binder, m_options.siteDefaults);
  }

  std::unique_ptr<CallSite> DispatchEngine::CreateSite(Operation op, CallSiteOptions options) const
  {
    return std::make_unique<CallSite>(std::move(op), m_binder, std::move(options));
  }

  std::expected<Value, BindingFailure> DispatchEngine::TryExecuteUncached(const Operation &op,
                                                                          std::span<const Value> operands) const
  {
    auto wrapped = WrapAll(operands);
    const std::span<const Envelope> envelopes{wrapped.envelopes.Size() ? &wrapped.envelopes[0] : nullptr,
                                              wrapped.envelopes.Size()};
    auto bound = m_binder.Bind(op, envelopes);
    if (!bound)
      return std::unexpected(std::move(bound.error()));
    return bound->Invoke(operands);
  }

  Value DispatchEngine::ExecuteUncached(const Operation &op, std::span<const Value> operands) const
  {
    auto result = TryExecuteUncached(op, operands);
    if (!result)
      throw DispatchError(std::move(result.error()));
    return std::move(*result);
  }

  DispatchEngine &DefaultEngine()
  {
    static DispatchEngine engine{};
    return engine;
  }

} // namespace NGIN::Dispatch

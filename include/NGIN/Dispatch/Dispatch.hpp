// Dispatch.hpp
// Umbrella header for NGIN.Dispatch
#pragma once

#include <string_view>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Value.hpp>
#include <NGIN/Dispatch/Convert.hpp>
#include <NGIN/Dispatch/TypeBuilder.hpp>
#include <NGIN/Dispatch/Operation.hpp>
#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/Binding.hpp>
#include <NGIN/Dispatch/MetaObject.hpp>
#include <NGIN/Dispatch/ReflectionBinder.hpp>
#include <NGIN/Dispatch/Binder.hpp>
#include <NGIN/Dispatch/Trace.hpp>
#include <NGIN/Dispatch/CallSite.hpp>
#include <NGIN/Dispatch/Engine.hpp>

namespace NGIN::Dispatch
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Dispatch"; }

} // namespace NGIN::Dispatch

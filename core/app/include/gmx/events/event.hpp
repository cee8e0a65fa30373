#pragma once

#include "gmx/events/pipeline_events.hpp"

#include <variant>

namespace gmx {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope type carried by the EventBus and the IPC telemetry
// queue. Adding an event type means adding it here; std::visit sites then
// fail to compile until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<PipelineStateEvent, AllowanceEvent>;

}  // namespace gmx

#pragma once

#include "orb/events/event.hpp"

#include <nlohmann/json.hpp>

namespace orb {

// -----------------------------------------------------------------------------
// Telemetry serialization
// -----------------------------------------------------------------------------
// Flat JSON objects published on the IPC telemetry socket. Every object
// carries "type" and "timestamp_ms"; the remaining keys depend on the kind.
// -----------------------------------------------------------------------------

nlohmann::json positionToJson(const domain::Position& position);

nlohmann::json eventToJson(const Event& event);

}  // namespace orb

#pragma once

#include <stdexcept>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// Error taxonomy of the decision core
// -----------------------------------------------------------------------------
//
// Two failure kinds are exceptions; the other two outcomes of the taxonomy
// are ordinary values and never thrown:
//
//   InsufficientDataError: the opening-range window closed with zero ticks.
//     The instrument is disabled for the session; the process and the other
//     instruments carry on.
//   PreconditionError: an operation was invoked on an entity in the wrong
//     lifecycle state (breakout level from an uncaptured candle, entry on an
//     open position). A sequencing bug upstream: the affected instrument
//     halts and reports it loudly.
//
//   Ambiguous dual breakout → EntrySignal::None (see EntryFilterEngine).
//   Governor limit breach   → RiskRejectEvent{RejectReason::LimitBreached}.
//
// ConfigError is raised only at startup by the configuration loader.
// -----------------------------------------------------------------------------

class InsufficientDataError : public std::runtime_error {
 public:
  explicit InsufficientDataError(const std::string& what)
      : std::runtime_error(what) {}
};

class PreconditionError : public std::logic_error {
 public:
  explicit PreconditionError(const std::string& what)
      : std::logic_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace orb

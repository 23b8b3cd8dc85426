#pragma once

#include "orb/domain/position.hpp"
#include "orb/events/event_types.hpp"

#include <cstdint>

namespace orb {

enum class LifecycleKind {
  Opened,
  PartiallyClosed,
  Closed,
};

inline const char* toString(LifecycleKind k) {
  switch (k) {
    case LifecycleKind::Opened:          return "OPENED";
    case LifecycleKind::PartiallyClosed: return "PARTIALLY_CLOSED";
    case LifecycleKind::Closed:          return "CLOSED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// TradeLifecycleEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a Position immediately after an entry, a partial exit
//         or the terminal close.
//
// @details
// position is a full copy so the event stays valid after the state machine
// moves on. quantity / price / pnl_delta describe the step that produced the
// event (entry size and price for Opened; exited size, exit price and the
// realized P&L of that slice otherwise).
// -----------------------------------------------------------------------------
struct TradeLifecycleEvent {
  LifecycleKind kind{LifecycleKind::Opened};
  domain::Position position;
  std::int64_t quantity{0};
  double price{0.0};
  double pnl_delta{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace orb

#pragma once

#include <cstdint>
#include <string>

namespace orb {
namespace domain {

// -----------------------------------------------------------------------------
// Candle: OHLCV over [start_ms, end_ms)
// -----------------------------------------------------------------------------
//
// @details
// Produced by OpeningRangeCapture (the session's single opening candle) and
// by CandleAggregator (the fixed-width candles feeding the ATR). `complete`
// is set once the window has closed; only complete candles may be turned
// into breakout levels or true-range samples.
// -----------------------------------------------------------------------------
struct Candle {
  std::string instrument;
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  std::uint64_t tick_count{0};
  bool complete{false};
};

}  // namespace domain
}  // namespace orb

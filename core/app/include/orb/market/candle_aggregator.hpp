#pragma once

#include "orb/domain/candle.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// CandleAggregator
// -----------------------------------------------------------------------------
// Cuts fixed-width candles from an instrument's tick stream after the opening
// range, to feed the VolatilityEstimator. Buckets are aligned to `anchor_ms`
// (the capture window end): bucket k covers [anchor + k*w, anchor + (k+1)*w).
//
// A candle is emitted when the first tick of a later bucket arrives, or when
// flush() is called with a time past the current bucket's end. Buckets with
// no ticks produce nothing. Ticks older than the current bucket are dropped.
// -----------------------------------------------------------------------------
class CandleAggregator {
 public:
  CandleAggregator(std::string instrument, std::int64_t width_ms,
                   std::int64_t anchor_ms);

  std::optional<domain::Candle> onTick(double price, double volume,
                                       std::int64_t timestamp_ms);

  std::optional<domain::Candle> flush(std::int64_t now_ms);

  bool hasOpenCandle() const { return open_; }

 private:
  std::int64_t bucketStart(std::int64_t timestamp_ms) const;
  domain::Candle takeCurrent();

  std::string instrument_;
  std::int64_t width_ms_;
  std::int64_t anchor_ms_;
  domain::Candle current_;
  bool open_{false};
};

}  // namespace orb

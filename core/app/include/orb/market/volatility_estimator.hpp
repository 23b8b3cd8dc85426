#pragma once

#include "orb/domain/candle.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace orb {

// -----------------------------------------------------------------------------
// VolatilityEstimator
// -----------------------------------------------------------------------------
//
// @brief  Rolling Average True Range over the last `period` candles.
//
// @details
// True range of a candle is
//     max(high - low, |high - prevClose|, |low - prevClose|)
// and simply high - low for the first candle, which has no previous close.
//
// Samples live in a fixed-size ring of `period` slots with a running sum, so
// addCandle() is O(1) and memory never grows. currentATR() returns the mean
// of the ring once it is full and the configured fallback before that; it
// never blocks and never throws.
//
// Thread model: single writer, the instrument's worker thread.
// -----------------------------------------------------------------------------
class VolatilityEstimator {
 public:
  VolatilityEstimator(std::size_t period, double fallback);

  void addCandle(const domain::Candle& candle);

  double currentATR() const;

  bool isWarm() const { return count_ == ring_.size(); }
  std::size_t sampleCount() const { return count_; }
  std::size_t period() const { return ring_.size(); }

 private:
  std::vector<double> ring_;
  std::size_t head_{0};
  std::size_t count_{0};
  double sum_{0.0};
  double fallback_;
  std::optional<double> prev_close_;
};

}  // namespace orb

#include "orb/market/volatility_estimator.hpp"

#include "orb/domain/errors.hpp"

#include <algorithm>
#include <cmath>

namespace orb {

VolatilityEstimator::VolatilityEstimator(std::size_t period, double fallback)
    : ring_(period, 0.0), fallback_(fallback) {
  if (period == 0) {
    throw PreconditionError("ATR period must be at least 1");
  }
}

void VolatilityEstimator::addCandle(const domain::Candle& candle) {
  double tr = candle.high - candle.low;
  if (prev_close_) {
    tr = std::max({tr, std::abs(candle.high - *prev_close_),
                   std::abs(candle.low - *prev_close_)});
  }
  prev_close_ = candle.close;

  if (count_ == ring_.size()) {
    sum_ -= ring_[head_];
  } else {
    ++count_;
  }
  ring_[head_] = tr;
  sum_ += tr;
  head_ = (head_ + 1) % ring_.size();
}

double VolatilityEstimator::currentATR() const {
  if (count_ < ring_.size()) {
    return fallback_;
  }
  return sum_ / static_cast<double>(ring_.size());
}

}  // namespace orb

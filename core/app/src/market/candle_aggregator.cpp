#include "orb/market/candle_aggregator.hpp"

#include "orb/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace orb {

CandleAggregator::CandleAggregator(std::string instrument,
                                   std::int64_t width_ms,
                                   std::int64_t anchor_ms)
    : instrument_(std::move(instrument)),
      width_ms_(width_ms),
      anchor_ms_(anchor_ms) {
  if (width_ms_ <= 0) {
    throw PreconditionError("candle width must be positive for " +
                            instrument_);
  }
}

std::int64_t CandleAggregator::bucketStart(std::int64_t timestamp_ms) const {
  std::int64_t offset = timestamp_ms - anchor_ms_;
  std::int64_t k = offset / width_ms_;
  if (offset < 0 && offset % width_ms_ != 0) {
    --k;
  }
  return anchor_ms_ + k * width_ms_;
}

domain::Candle CandleAggregator::takeCurrent() {
  domain::Candle done = current_;
  done.complete = true;
  open_ = false;
  current_ = domain::Candle{};
  return done;
}

std::optional<domain::Candle> CandleAggregator::onTick(
    double price, double volume, std::int64_t timestamp_ms) {
  if (timestamp_ms < anchor_ms_) {
    return std::nullopt;
  }

  const std::int64_t start = bucketStart(timestamp_ms);
  std::optional<domain::Candle> completed;

  if (open_) {
    if (start < current_.start_ms) {
      return std::nullopt;
    }
    if (start > current_.start_ms) {
      completed = takeCurrent();
    }
  }

  if (!open_) {
    current_.instrument = instrument_;
    current_.start_ms = start;
    current_.end_ms = start + width_ms_;
    current_.open = price;
    current_.high = price;
    current_.low = price;
    open_ = true;
  }

  current_.high = std::max(current_.high, price);
  current_.low = std::min(current_.low, price);
  current_.close = price;
  current_.volume += volume;
  ++current_.tick_count;

  return completed;
}

std::optional<domain::Candle> CandleAggregator::flush(std::int64_t now_ms) {
  if (!open_ || now_ms < current_.end_ms) {
    return std::nullopt;
  }
  return takeCurrent();
}

}  // namespace orb

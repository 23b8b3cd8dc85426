#include "orb/market/opening_range_capture.hpp"

#include "orb/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace orb {

OpeningRangeCapture::OpeningRangeCapture(std::string instrument,
                                         const ClockGate& gate)
    : gate_(gate) {
  candle_.instrument = std::move(instrument);
  candle_.start_ms = gate_.sessionOpenMs();
  candle_.end_ms = gate_.captureEndMs();
}

bool OpeningRangeCapture::onTick(double price, double volume,
                                 std::int64_t timestamp_ms) {
  if (state_ != State::Capturing) {
    return false;
  }
  if (timestamp_ms < gate_.sessionOpenMs()) {
    return false;
  }
  if (gate_.isCaptureWindowClosed(timestamp_ms)) {
    freeze(gate_.captureEndMs());
    return true;
  }

  if (candle_.tick_count == 0) {
    candle_.open = price;
    candle_.high = price;
    candle_.low = price;
  } else {
    candle_.high = std::max(candle_.high, price);
    candle_.low = std::min(candle_.low, price);
  }
  candle_.close = price;
  candle_.volume += volume;
  ++candle_.tick_count;
  return false;
}

bool OpeningRangeCapture::onClock(std::int64_t now_ms) {
  if (state_ != State::Capturing || !gate_.isCaptureWindowClosed(now_ms)) {
    return false;
  }
  freeze(gate_.captureEndMs());
  return true;
}

void OpeningRangeCapture::freezeNow(std::int64_t now_ms) {
  if (state_ != State::Capturing) {
    return;
  }
  freeze(std::min(now_ms, gate_.captureEndMs()));
}

const domain::Candle& OpeningRangeCapture::candle() const {
  if (state_ != State::Captured) {
    throw PreconditionError("opening candle for " + candle_.instrument +
                            " has not been captured");
  }
  return candle_;
}

void OpeningRangeCapture::freeze(std::int64_t end_ms) {
  if (candle_.tick_count == 0) {
    state_ = State::Failed;
    throw InsufficientDataError("no ticks received for " + candle_.instrument +
                                " during the opening-range window");
  }
  candle_.end_ms = end_ms;
  candle_.complete = true;
  state_ = State::Captured;
}

}  // namespace orb

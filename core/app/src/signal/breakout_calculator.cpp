#include "orb/signal/breakout_calculator.hpp"

#include "orb/domain/errors.hpp"

namespace orb {

domain::BreakoutLevel computeBreakoutLevel(const domain::Candle& candle,
                                           double buffer) {
  if (!candle.complete) {
    throw PreconditionError("breakout level requested for " +
                            candle.instrument +
                            " before its opening candle was captured");
  }

  domain::BreakoutLevel level;
  level.instrument = candle.instrument;
  level.upper = candle.high + buffer;
  level.lower = candle.low - buffer;
  level.buffer = buffer;
  level.source = candle;
  return level;
}

}  // namespace orb

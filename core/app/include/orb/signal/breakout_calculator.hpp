#pragma once

#include "orb/domain/breakout_level.hpp"
#include "orb/domain/candle.hpp"

namespace orb {

// upper = candle.high + buffer, lower = candle.low - buffer.
// @throws PreconditionError if the candle has not been captured.
domain::BreakoutLevel computeBreakoutLevel(const domain::Candle& candle,
                                           double buffer);

}  // namespace orb

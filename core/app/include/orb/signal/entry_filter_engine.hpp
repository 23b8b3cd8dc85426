#pragma once

#include "orb/domain/breakout_level.hpp"
#include "orb/domain/filter_config.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <variant>
#include <vector>

namespace orb {

enum class EntrySignal {
  None,
  Call,
  Put,
};

inline const char* toString(EntrySignal s) {
  switch (s) {
    case EntrySignal::None: return "NONE";
    case EntrySignal::Call: return "CALL";
    case EntrySignal::Put:  return "PUT";
  }
  return "UNKNOWN";
}

struct TickSample {
  double price{0.0};
  double volume{0.0};
  std::int64_t timestamp_ms{0};
};

// Everything a confirmation filter may look at. `history` holds the ticks
// seen before `current`, oldest first, and never includes `current`.
struct FilterContext {
  const TickSample& current;
  const std::deque<TickSample>& history;
  const domain::BreakoutLevel& level;
  EntrySignal direction;
};

// -----------------------------------------------------------------------------
// Confirmation filters
// -----------------------------------------------------------------------------
// Each filter carries its own enabled flag and parameters. A disabled filter,
// or one given an empty history, passes. A history shorter than the filter's
// window is judged on the ticks it does hold.
// -----------------------------------------------------------------------------

// Current volume >= multiple x mean volume of the last `window` ticks (or of
// every tick held, when fewer).
struct VolumeConfirmationFilter {
  domain::VolumeFilterConfig config;

  bool passes(const FilterContext& ctx) const;
  std::size_t requiredHistory() const { return config.window; }
  const char* name() const { return "volume_confirmation"; }
};

// Over the last `ticks` prices (current included) no step moves against the
// breakout by more than `tolerance`, and the net move is in its favour.
struct MomentumConfirmationFilter {
  domain::MomentumFilterConfig config;

  bool passes(const FilterContext& ctx) const;
  std::size_t requiredHistory() const {
    return config.ticks > 0 ? config.ticks - 1 : 0;
  }
  const char* name() const { return "momentum_confirmation"; }
};

// Price no further than max_percentage beyond the breached level.
struct EntryPremiumCapFilter {
  domain::PremiumCapFilterConfig config;

  bool passes(const FilterContext& ctx) const;
  std::size_t requiredHistory() const { return 0; }
  const char* name() const { return "entry_premium_cap"; }
};

using EntryFilter = std::variant<VolumeConfirmationFilter,
                                 MomentumConfirmationFilter,
                                 EntryPremiumCapFilter>;

struct EntryEvaluation {
  EntrySignal signal{EntrySignal::None};    // Final decision
  EntrySignal breakout{EntrySignal::None};  // Price breakout alone
  bool ambiguous{false};                    // Both levels breached
  const char* blocked_by{nullptr};          // First failing filter, if any
};

// -----------------------------------------------------------------------------
// EntryFilterEngine
// -----------------------------------------------------------------------------
//
// @brief  Decides whether the latest tick is a confirmed breakout and in
//         which direction.
//
// @details
// Price breakout first: price > upper is a call signal, price < lower a put
// signal. A tick satisfying both (only possible when lower > upper, i.e. a
// negative buffer wider than the range) is ambiguous and suppressed. Every
// enabled filter must then pass for the signal to survive.
//
// The engine is stateless; the caller owns the tick history and keeps at
// least requiredHistory() samples of it.
// -----------------------------------------------------------------------------
class EntryFilterEngine {
 public:
  explicit EntryFilterEngine(const domain::FilterConfig& config);
  explicit EntryFilterEngine(std::vector<EntryFilter> filters);

  static EntrySignal priceBreakout(const domain::BreakoutLevel& level,
                                   double price, bool* ambiguous = nullptr);

  EntryEvaluation evaluate(const domain::BreakoutLevel& level,
                           const TickSample& current,
                           const std::deque<TickSample>& history) const;

  std::size_t requiredHistory() const;

  const std::vector<EntryFilter>& filters() const { return filters_; }

 private:
  std::vector<EntryFilter> filters_;
};

}  // namespace orb

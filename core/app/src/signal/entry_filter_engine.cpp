#include "orb/signal/entry_filter_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace orb {

namespace {

double signOf(EntrySignal direction) {
  return direction == EntrySignal::Put ? -1.0 : 1.0;
}

}  // namespace

bool VolumeConfirmationFilter::passes(const FilterContext& ctx) const {
  if (!config.enabled || config.window == 0 || ctx.history.empty()) {
    return true;
  }

  const std::size_t n = std::min(config.window, ctx.history.size());
  double sum = 0.0;
  auto it = ctx.history.end() - static_cast<std::ptrdiff_t>(n);
  for (; it != ctx.history.end(); ++it) {
    sum += it->volume;
  }
  const double average = sum / static_cast<double>(n);
  return ctx.current.volume >= config.multiple * average;
}

bool MomentumConfirmationFilter::passes(const FilterContext& ctx) const {
  if (!config.enabled || config.ticks < 2 || ctx.history.empty()) {
    return true;
  }

  const double sign = signOf(ctx.direction);
  const std::size_t n = std::min(config.ticks - 1, ctx.history.size());
  std::vector<double> prices;
  prices.reserve(n + 1);
  auto it = ctx.history.end() - static_cast<std::ptrdiff_t>(n);
  for (; it != ctx.history.end(); ++it) {
    prices.push_back(it->price);
  }
  prices.push_back(ctx.current.price);

  for (std::size_t i = 1; i < prices.size(); ++i) {
    if (sign * (prices[i] - prices[i - 1]) < -config.tolerance) {
      return false;
    }
  }
  return sign * (prices.back() - prices.front()) > 0.0;
}

bool EntryPremiumCapFilter::passes(const FilterContext& ctx) const {
  if (!config.enabled) {
    return true;
  }
  const double level = ctx.direction == EntrySignal::Put ? ctx.level.lower
                                                         : ctx.level.upper;
  if (level == 0.0) {
    return true;
  }
  const double pct = std::abs(ctx.current.price - level) / std::abs(level) *
                     100.0;
  return pct <= config.max_percentage;
}

EntryFilterEngine::EntryFilterEngine(const domain::FilterConfig& config)
    : filters_{VolumeConfirmationFilter{config.volume},
               MomentumConfirmationFilter{config.momentum},
               EntryPremiumCapFilter{config.premium_cap}} {}

EntryFilterEngine::EntryFilterEngine(std::vector<EntryFilter> filters)
    : filters_(std::move(filters)) {}

EntrySignal EntryFilterEngine::priceBreakout(
    const domain::BreakoutLevel& level, double price, bool* ambiguous) {
  const bool above = price > level.upper;
  const bool below = price < level.lower;
  if (ambiguous != nullptr) {
    *ambiguous = above && below;
  }
  if (above && below) {
    return EntrySignal::None;
  }
  if (above) {
    return EntrySignal::Call;
  }
  if (below) {
    return EntrySignal::Put;
  }
  return EntrySignal::None;
}

EntryEvaluation EntryFilterEngine::evaluate(
    const domain::BreakoutLevel& level, const TickSample& current,
    const std::deque<TickSample>& history) const {
  EntryEvaluation result;
  result.breakout = priceBreakout(level, current.price, &result.ambiguous);

  if (result.ambiguous) {
    std::cerr << "[EntryFilterEngine] " << level.instrument
              << ": ambiguous breakout at " << current.price << " (upper "
              << level.upper << ", lower " << level.lower
              << "), signal suppressed\n";
    return result;
  }
  if (result.breakout == EntrySignal::None) {
    return result;
  }

  const FilterContext ctx{current, history, level, result.breakout};
  for (const auto& filter : filters_) {
    const bool ok = std::visit([&ctx](const auto& f) { return f.passes(ctx); },
                               filter);
    if (!ok) {
      result.blocked_by =
          std::visit([](const auto& f) { return f.name(); }, filter);
      return result;
    }
  }

  result.signal = result.breakout;
  return result;
}

std::size_t EntryFilterEngine::requiredHistory() const {
  std::size_t required = 0;
  for (const auto& filter : filters_) {
    required = std::max(
        required,
        std::visit([](const auto& f) { return f.requiredHistory(); }, filter));
  }
  return required;
}

}  // namespace orb

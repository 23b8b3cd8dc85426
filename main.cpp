// -----------------------------------------------------------------------------
// orb_engine: opening-range breakout engine entry point.
//
// Usage:
//   orb_engine [config.json] [--replay]
//
// Live mode:
//   LiveTimeProvider drives every gate; the session for today is opened at
//   startup (nothing is armed on weekends and holidays).
//
// Replay mode (--replay):
//   SimulationTimeProvider is advanced by each tick received on the market
//   data endpoint; the session is opened from the first tick's date and
//   rolled over when ticks of a later day arrive.
//
// Ctrl-C stops the engine: ingress stops, open positions are closed with
// SESSION_END, and every stage drains before its thread is joined.
// -----------------------------------------------------------------------------

#include "orb/config/config_loader.hpp"
#include "orb/domain/errors.hpp"
#include "orb/engine/trading_engine.hpp"
#include "orb/session/clock_gate.hpp"
#include "orb/time/live_time_provider.hpp"
#include "orb/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT/SIGTERM handler; polled by main().
volatile std::sig_atomic_t g_stop_requested = 0;

void stop_handler(int /*signum*/) { g_stop_requested = 1; }

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/orb_config.json";
  bool replay = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--replay") {
      replay = true;
    } else {
      config_path = arg;
    }
  }

  orb::EngineConfig config;
  try {
    config = orb::loadEngineConfig(config_path);
  } catch (const orb::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] loaded " << config_path << ": "
            << config.instruments.size() << " instrument(s), mode="
            << (replay ? "replay" : "live") << "\n";

  orb::LiveTimeProvider live_clock;
  orb::SimulationTimeProvider sim_clock;
  const orb::ITimeProvider& clock =
      replay ? static_cast<const orb::ITimeProvider&>(sim_clock)
             : static_cast<const orb::ITimeProvider&>(live_clock);

  orb::TradingEngine engine(config, clock, replay ? &sim_clock : nullptr);

  std::signal(SIGINT, stop_handler);
  std::signal(SIGTERM, stop_handler);

  engine.start();

  if (!replay) {
    engine.startSession(
        orb::ClockGate::sessionOpenFor(config.session, clock.now_ms()));
  }

  std::cout << "[main] running. Press Ctrl-C to shut down.\n";
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}

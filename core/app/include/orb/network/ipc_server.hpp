#pragma once

#include "orb/concurrent/thread_safe_queue.hpp"
#include "orb/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace orb {

// -----------------------------------------------------------------------------
// IpcServer
// -----------------------------------------------------------------------------
//
// @brief  Operator and monitoring surface over ZeroMQ.
//
// @details
//   REP socket (cmd_endpoint): one text command per request, answered with
//     the CommandHandler's JSON reply (PING, STATUS, FLATTEN, CLOSE_SESSION).
//     Commands are trimmed and upper-cased first, so "status\n" from a shell
//     client works. A handler that throws still gets an error reply; a REP
//     socket that never answers would wedge the client.
//   PUB socket (pub_endpoint): every audit event pushed via pushTelemetry()
//     is published as one JSON object (see event_json.hpp) with a
//     "publish_seq" counter so subscribers can detect gaps.
//
// One worker thread alternates between draining the telemetry queue and
// polling the REP socket with a short receive timeout; ZeroMQ sockets are
// never touched from any other thread.
//
// Thread model:
//   pushTelemetry() is safe from any thread (the audit loop calls it).
//   The CommandHandler runs on the IpcServer thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();

  void stop();

  void pushTelemetry(Event event);

  // Telemetry payload for an event; nullopt for kinds not published.
  static std::optional<std::string> formatTelemetry(const Event& event,
                                                    std::uint64_t publish_seq);

  // Strips surrounding whitespace and upper-cases the command word.
  static std::string normalizeCommand(const std::string& raw);

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t telemetryPublished() const { return published_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPendingTelemetry();
  void serveOneCommand();
  std::string handle(const std::string& cmd);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace orb

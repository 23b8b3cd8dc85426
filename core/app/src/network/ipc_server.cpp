#include "orb/network/ipc_server.hpp"

#include "orb/events/event_json.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <utility>

namespace orb {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] operator commands on " << cmd_endpoint_
            << ", telemetry on " << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  } else {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped after " << commands_served_.load()
            << " command(s), " << published_.load()
            << " telemetry message(s).\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    publishPendingTelemetry();
    serveOneCommand();
  }
  // Trades closed during shutdown still reach monitors.
  publishPendingTelemetry();
}

void IpcServer::publishPendingTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const auto payload = formatTelemetry(*event, published_.load() + 1);
    if (!payload) {
      continue;
    }
    zmq::message_t msg(payload->data(), payload->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      published_.fetch_add(1);
    }
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;
  }

  const std::string reply = handle(normalizeCommand(request.to_string()));
  zmq::message_t msg(reply.data(), reply.size());
  cmd_socket_->send(msg, zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

std::string IpcServer::handle(const std::string& cmd) {
  try {
    return command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    nlohmann::json error;
    error["status"] = "error";
    error["response"] = std::string("Command failed: ") + e.what();
    return error.dump();
  }
}

std::string IpcServer::normalizeCommand(const std::string& raw) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(raw.begin(), raw.end(), not_space);
  auto last = std::find_if(raw.rbegin(), raw.rend(), not_space).base();
  if (first >= last) {
    return {};
  }
  std::string cmd(first, last);
  std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return cmd;
}

std::optional<std::string> IpcServer::formatTelemetry(
    const Event& event, std::uint64_t publish_seq) {
  if (std::holds_alternative<MarketDataEvent>(event) ||
      std::holds_alternative<TimerEvent>(event)) {
    return std::nullopt;
  }
  nlohmann::json j = eventToJson(event);
  j["publish_seq"] = publish_seq;
  return j.dump();
}

}  // namespace orb

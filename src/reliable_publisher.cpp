// -----------------------------------------------------------------------------
// reliable_publisher.cpp: retry loop for reliable_publisher.hpp
//
// The loop is flat and bounded: at most cfg_.max_attempts calls into the
// connection, with one backoff between consecutive attempts. No recursion.
// -----------------------------------------------------------------------------
#include "endec/reliable_publisher.hpp"
#include "endec/payloads.hpp"

#include <thread>

#include <spdlog/spdlog.h>

namespace endec {

const char* to_string(PublishOutcome o) {
  switch (o) {
    case PublishOutcome::Delivered:      return "delivered";
    case PublishOutcome::Unroutable:     return "unroutable";
    case PublishOutcome::Nacked:         return "nacked";
    case PublishOutcome::ConnectionLost: return "connection_lost";
  }
  return "unknown";
}

ReliablePublisher::ReliablePublisher(std::unique_ptr<IBrokerConnection> conn,
                                     PublisherConfig cfg,
                                     const Shutdown* shutdown)
: conn_(std::move(conn)), cfg_(std::move(cfg)), shutdown_(shutdown) {
  if (cfg_.max_attempts < 1) cfg_.max_attempts = 1;
}

ReliablePublisher::~ReliablePublisher() {
  close();
}

bool ReliablePublisher::ensure_open() {
  if (conn_->is_open()) return true;

  std::string err;
  if (!conn_->open(err)) {
    spdlog::warn("[broker] {}: connect failed: {}", cfg_.exchange, err);
    conn_->close();
    return false;
  }
  if (!conn_->declare_exchange(cfg_.exchange, err)) {
    spdlog::warn("[broker] {}: exchange declare failed: {}", cfg_.exchange, err);
    conn_->close();
    return false;
  }
  spdlog::info("[broker] {}: connected", cfg_.exchange);
  return true;
}

void ReliablePublisher::close() {
  if (conn_) conn_->close();
}

// Linear backoff before the next attempt. false if shutdown cut it short.
bool ReliablePublisher::backoff(int attempt) {
  const auto wait = cfg_.backoff_step * attempt;
  if (wait.count() <= 0) return !(shutdown_ && shutdown_->requested());
  if (shutdown_) return shutdown_->sleep_for(wait);
  std::this_thread::sleep_for(wait);
  return true;
}

PublishAttempt ReliablePublisher::publish(const nlohmann::json& payload,
                                          const std::string& routing_key) {
  PublishAttempt a;
  a.routing_key = routing_key;
  a.payload = to_wire(payload);

  for (int attempt = 1; attempt <= cfg_.max_attempts; ++attempt) {
    a.attempts = attempt;

    a.outcome = ensure_open()
              ? conn_->publish(cfg_.exchange, routing_key, a.payload)
              : PublishOutcome::ConnectionLost;

    switch (a.outcome) {
      case PublishOutcome::Delivered:
        a.fault = FaultKind::None;
        spdlog::debug("[broker] {}/{}: delivered (attempt {})", cfg_.exchange, routing_key, attempt);
        return a;

      case PublishOutcome::Unroutable:
        // Topology problem; retrying the same key cannot help.
        a.fault = FaultKind::BrokerUnroutable;
        spdlog::error("[broker] {}/{}: {}: no queue bound for routing key",
                      cfg_.exchange, routing_key, to_string(a.fault));
        return a;

      case PublishOutcome::Nacked:
        a.fault = FaultKind::BrokerTransient;
        spdlog::warn("[broker] {}/{}: nacked (attempt {}/{})",
                     cfg_.exchange, routing_key, attempt, cfg_.max_attempts);
        break;

      case PublishOutcome::ConnectionLost:
        a.fault = FaultKind::BrokerTransient;
        spdlog::warn("[broker] {}/{}: connection lost (attempt {}/{})",
                     cfg_.exchange, routing_key, attempt, cfg_.max_attempts);
        conn_->close();                          // next ensure_open() reconnects
        break;
    }

    if (attempt < cfg_.max_attempts && !backoff(attempt)) {
      spdlog::warn("[broker] {}/{}: shutdown during backoff, giving up", cfg_.exchange, routing_key);
      return a;
    }
  }

  spdlog::error("[broker] {}/{}: {}: publish failed after {} attempts",
                cfg_.exchange, routing_key, to_string(a.fault), a.attempts);
  return a;
}

} // namespace endec

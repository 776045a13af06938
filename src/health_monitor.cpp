// -----------------------------------------------------------------------------
// health_monitor.cpp: heartbeat scheduling for health_monitor.hpp
// -----------------------------------------------------------------------------
#include "endec/health_monitor.hpp"

#include <spdlog/spdlog.h>

#include "endec/faults.hpp"

namespace endec {

HealthMonitor::HealthMonitor(ReliablePublisher& publisher, HealthConfig cfg)
: publisher_(publisher), cfg_(std::move(cfg)) {
  if (cfg_.failure_cap < 1) cfg_.failure_cap = 1;
}

bool HealthMonitor::due(TimePoint now) const {
  if (degraded()) return now - state_.last_retry >= cfg_.interval;
  return now - state_.last_success >= cfg_.interval;
}

bool HealthMonitor::tick(TimePoint now) {
  if (!due(now)) return false;

  const auto payload = health_payload(cfg_.info, Clock::to_time_t(now));
  const PublishAttempt a = publisher_.publish(payload, cfg_.routing_key);

  if (a.delivered()) on_success(now);
  else               on_failure(now, a);
  return true;
}

void HealthMonitor::on_success(TimePoint now) {
  if (degraded()) {
    spdlog::info("[health] heartbeat recovered after {} consecutive failures",
                 state_.consecutive_failures);
  } else {
    spdlog::debug("[health] heartbeat sent");
  }
  state_.consecutive_failures = 0;
  state_.last_success = now;
}

void HealthMonitor::on_failure(TimePoint now, const PublishAttempt& a) {
  const bool was_degraded = degraded();
  if (state_.consecutive_failures < cfg_.failure_cap) ++state_.consecutive_failures;
  if (degraded()) state_.last_retry = now;

  spdlog::warn("[health] {}: heartbeat failed ({}, {}/{})",
               to_string(FaultKind::HealthCheck), to_string(a.outcome),
               state_.consecutive_failures, cfg_.failure_cap);

  if (!was_degraded && degraded()) {
    spdlog::error("[health] degraded: retrying once every {} s",
                  cfg_.interval.count());
  }
}

} // namespace endec

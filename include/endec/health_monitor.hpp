/**
 * @file health_monitor.hpp
 * @brief Hourly liveness heartbeat with a degraded back-off state.
 *
 * @details
 * STATE MACHINE
 * -------------
 *  - **Healthy** (consecutive_failures < cap): a heartbeat is due when
 *    `now - last_success >= interval`. Failures below the cap do not move
 *    last_success, so the monitor keeps trying on every tick until the cap.
 *  - **Degraded** (consecutive_failures == cap): a heartbeat is due only
 *    when `now - last_retry >= interval`; exactly one attempt per interval.
 *
 * A success from either state zeroes the counter and stamps last_success.
 * A failure increments the counter (saturating at the cap) and, once at
 * the cap, stamps last_retry. Entering Degraded is logged as an error,
 * leaving it as info.
 *
 * last_success starts at the epoch: the first heartbeat goes out on the
 * first tick after startup.
 *
 * The monitor owns no clock; the relay passes `now` into due()/tick().
 */
#ifndef ENDEC_HEALTH_MONITOR_HPP
#define ENDEC_HEALTH_MONITOR_HPP

#include <chrono>
#include <string>

#include "endec/payloads.hpp"
#include "endec/reliable_publisher.hpp"

namespace endec {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct HealthConfig {
  std::string routing_key;
  std::chrono::seconds interval{3600};
  int failure_cap = 5;
  HealthInfo info;
};

struct HealthState {
  TimePoint last_success{};
  int consecutive_failures = 0;
  TimePoint last_retry{};
};

class HealthMonitor {
public:
  HealthMonitor(ReliablePublisher& publisher, HealthConfig cfg);

  bool degraded() const { return state_.consecutive_failures >= cfg_.failure_cap; }
  bool due(TimePoint now) const;

  /**
   * @brief Send a heartbeat if one is due.
   * @return true if an attempt was made (whatever its outcome).
   */
  bool tick(TimePoint now);

  const HealthState& state() const { return state_; }

private:
  void on_success(TimePoint now);
  void on_failure(TimePoint now, const PublishAttempt& a);

  ReliablePublisher& publisher_;
  HealthConfig cfg_;
  HealthState state_;
};

} // namespace endec

#endif // ENDEC_HEALTH_MONITOR_HPP

/**
 * @file relay.hpp
 * @brief The daemon's driver: serial lines in, dispatched alerts out.
 *
 * @details
 * PURPOSE
 * -------
 * Relay owns the pipeline state (FrameAssembler) and wires the stages:
 *
 *     ILineSource -> FrameAssembler -> resolve_block() -> Dispatcher
 *                                  \-> HealthMonitor (on every loop pass)
 *
 * It is the only place that reads the wall clock; every stage below it
 * receives `now` as an argument.
 *
 * STAGE API
 * ---------
 * on_line() / on_timeout() feed the assembler; drain() resolves and
 * dispatches whatever blocks it emitted. Dispatch for one block finishes
 * before the next is resolved, so alerts leave in arrival order.
 *
 * SESSION LOOP
 * ------------
 * run() is the outer retry loop around one serial session:
 *  - open the source; on failure log FaultKind::SerialIo, wait
 *    reconnect_delay, try again;
 *  - read with read_timeout. Line: feed. Timeout: force-emit any open
 *    block. Error: log, flush the open block, close, wait, reopen;
 *  - shutdown ends the loop at the next read boundary where no block is
 *    being collected (an open block is finished, by end marker or by
 *    timeout, first).
 */
#ifndef ENDEC_RELAY_HPP
#define ENDEC_RELAY_HPP

#include <stdint.h>
#include <chrono>
#include <string_view>

#include "endec/block_resolver.hpp"
#include "endec/dispatcher.hpp"
#include "endec/frame_assembler.hpp"
#include "endec/health_monitor.hpp"
#include "endec/line_source.hpp"
#include "endec/location_directory.hpp"
#include "endec/shutdown.hpp"
#include "endec/time_zone.hpp"

namespace endec {

struct RelayOptions {
  std::chrono::milliseconds read_timeout{5000};
  std::chrono::seconds reconnect_delay{5};
};

struct RelayStats {
  uint32_t sessions = 0;          ///< successful opens
  uint32_t serial_errors = 0;
  uint32_t alerts_dispatched = 0;
  uint32_t blocks_skipped = 0;    ///< resolved to nothing
};

class Relay {
public:
  /// @param health may be null (no broker configured).
  Relay(ILineSource& source,
        Dispatcher& dispatcher,
        const LocationDirectory& locations,
        const TimeZone& zone,
        HealthMonitor* health,
        const Shutdown& shutdown,
        RelayOptions opts = {});

  void on_line(std::string_view line, TimePoint now);
  void on_timeout(TimePoint now);

  /// Resolve and dispatch every emitted block. Returns alerts dispatched.
  size_t drain(TimePoint now);

  /// Outer loop; returns once shutdown is requested.
  void run();

  const FrameAssembler& assembler() const { return assembler_; }
  const RelayStats& stats() const { return stats_; }

private:
  /// One open..close cycle. false on serial error.
  bool run_session();
  void tick_health(TimePoint now);

  ILineSource& source_;
  Dispatcher& dispatcher_;
  const LocationDirectory& locations_;
  const TimeZone& zone_;
  HealthMonitor* health_;
  const Shutdown& shutdown_;
  RelayOptions opts_;

  FrameAssembler assembler_;
  RelayStats stats_;
};

/// Calendar year of @p now in UTC.
int utc_year(TimePoint now);

} // namespace endec

#endif // ENDEC_RELAY_HPP

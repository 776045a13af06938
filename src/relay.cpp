// -----------------------------------------------------------------------------
// relay.cpp: pipeline stages and serial session loop for relay.hpp
// -----------------------------------------------------------------------------
#include "endec/relay.hpp"

#include <ctime>
#include <string>

#include <spdlog/spdlog.h>

#include "endec/faults.hpp"

namespace endec {

int utc_year(TimePoint now) {
  const std::time_t t = Clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm.tm_year + 1900;
}

Relay::Relay(ILineSource& source,
             Dispatcher& dispatcher,
             const LocationDirectory& locations,
             const TimeZone& zone,
             HealthMonitor* health,
             const Shutdown& shutdown,
             RelayOptions opts)
: source_(source), dispatcher_(dispatcher), locations_(locations), zone_(zone),
  health_(health), shutdown_(shutdown), opts_(opts) {}

// ----------------------------------------------------------------------------
// Stages
// ----------------------------------------------------------------------------

void Relay::on_line(std::string_view line, TimePoint now) {
  assembler_.push_line(line);
  drain(now);
}

void Relay::on_timeout(TimePoint now) {
  if (assembler_.on_read_timeout()) {
    spdlog::warn("[relay] read timeout inside a block, emitting partial block");
  }
  drain(now);
}

size_t Relay::drain(TimePoint now) {
  size_t sent = 0;
  AlertBlock block;
  while (assembler_.get_block(block)) {
    const HeaderContext ctx{locations_, zone_, utc_year(now)};
    const ResolvedAlert alert = resolve_block(block, ctx);

    if (alert.empty()) {
      ++stats_.blocks_skipped;
      spdlog::debug("[relay] block of {} line(s) resolved to nothing, skipped", block.lines.size());
      continue;
    }

    if (alert.header) {
      spdlog::info("[relay] alert {} ({}) from {}, {} location(s)",
                   alert.header->event_name, alert.header->event_code,
                   alert.header->originator_code, alert.header->location_codes.size());
    } else {
      spdlog::info("[relay] plain text alert, {} chars", alert.body.size());
    }

    const DispatchReport rep = dispatcher_.dispatch(alert, Clock::to_time_t(now));
    if (rep.failed() > 0) {
      spdlog::warn("[relay] {}/{} sink(s) failed", rep.failed(), rep.attempted);
    }
    ++stats_.alerts_dispatched;
    ++sent;
  }
  return sent;
}

void Relay::tick_health(TimePoint now) {
  if (health_) health_->tick(now);
}

// ----------------------------------------------------------------------------
// Session loop
// ----------------------------------------------------------------------------

bool Relay::run_session() {
  std::string line;
  const int timeout_ms = static_cast<int>(opts_.read_timeout.count());

  for (;;) {
    if (shutdown_.requested() && !assembler_.is_collecting()) return true;

    line.clear();
    const ReadStatus st = source_.read_line(line, timeout_ms);
    const TimePoint now = Clock::now();

    switch (st) {
      case ReadStatus::Line:
        on_line(line, now);
        break;
      case ReadStatus::Timeout:
        on_timeout(now);
        break;
      case ReadStatus::Error:
        ++stats_.serial_errors;
        spdlog::error("[serial] {}: {}: read failed, closing", source_.name(),
                      to_string(FaultKind::SerialIo));
        on_timeout(now);                       // flush what was collected
        return false;
    }
    tick_health(now);
  }
}

void Relay::run() {
  spdlog::info("[relay] starting on {}", source_.name());

  while (!shutdown_.requested()) {
    if (!source_.open()) {
      spdlog::error("[serial] {}: {}: open failed, retrying in {} s", source_.name(),
                    to_string(FaultKind::SerialIo), opts_.reconnect_delay.count());
      tick_health(Clock::now());
      shutdown_.sleep_for(opts_.reconnect_delay);
      continue;
    }

    ++stats_.sessions;
    spdlog::info("[serial] {}: opened", source_.name());

    const bool clean = run_session();
    source_.close();

    if (!clean && !shutdown_.requested()) {
      spdlog::info("[serial] {}: reopening in {} s", source_.name(), opts_.reconnect_delay.count());
      shutdown_.sleep_for(opts_.reconnect_delay);
    }
  }

  spdlog::info("[relay] stopped: {} alert(s) dispatched, {} serial error(s)",
               stats_.alerts_dispatched, stats_.serial_errors);
}

} // namespace endec

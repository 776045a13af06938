// -----------------------------------------------------------------------------
// dispatcher.cpp: per-sink isolation for dispatcher.hpp
// -----------------------------------------------------------------------------
#include "endec/dispatcher.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "endec/faults.hpp"

namespace endec {

DispatchReport Dispatcher::dispatch(const ResolvedAlert& alert, std::time_t now) {
  DispatchReport rep;

  for (auto& sink : sinks_) {
    ++rep.attempted;
    SinkResult r;
    try {
      r = sink->send(alert, now);
    } catch (const std::exception& e) {
      r = SinkResult::failure(std::string("exception: ") + e.what());
    }

    if (r.ok) {
      ++rep.delivered;
      spdlog::info("[{}] delivered", sink->name());
    } else {
      spdlog::error("[{}] {}: {}", sink->name(), to_string(FaultKind::SinkDelivery), r.detail);
    }
  }
  return rep;
}

} // namespace endec

// -----------------------------------------------------------------------------
// shutdown.cpp: sliced, interruptible sleep for shutdown.hpp
// -----------------------------------------------------------------------------
#include "endec/shutdown.hpp"

#include <algorithm>
#include <thread>

namespace endec {

bool Shutdown::sleep_for(std::chrono::milliseconds d) const {
  auto remaining = d;
  while (remaining.count() > 0) {
    if (requested()) return false;               // stop raised mid-wait
    auto step = std::min(remaining, SLICE);
    std::this_thread::sleep_for(step);
    remaining -= step;
  }
  return !requested();
}

} // namespace endec

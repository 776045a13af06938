/**
 * @file shutdown.hpp
 * @brief Cooperative stop flag shared by the relay loop and every wait in it.
 *
 * @details
 * The flag is a lock-free atomic so a signal handler may set it. Waits
 * (reconnect delay, publish backoff) sleep in short slices and return as
 * soon as the flag is raised, so no wait can hold process exit hostage.
 */
#ifndef ENDEC_SHUTDOWN_HPP
#define ENDEC_SHUTDOWN_HPP

#include <atomic>
#include <chrono>

namespace endec {

class Shutdown {
public:
  /// Granularity of cancellable sleeps.
  static constexpr std::chrono::milliseconds SLICE{100};

  void request() { flag_.store(true, std::memory_order_relaxed); }
  bool requested() const { return flag_.load(std::memory_order_relaxed); }

  /**
   * @brief Sleep for @p d unless a stop is requested first.
   * @return true if the full duration elapsed, false if interrupted.
   */
  bool sleep_for(std::chrono::milliseconds d) const;

private:
  std::atomic<bool> flag_{false};
};

} // namespace endec

#endif // ENDEC_SHUTDOWN_HPP

/**
 * @file reliable_publisher.hpp
 * @brief Confirmed, bounded-retry publication of JSON payloads to one exchange.
 *
 * @details
 * PURPOSE
 * -------
 * Owns one broker connection and channel and guarantees that every alert
 * is at least *attempted* a bounded number of times, across broker restarts
 * and network blips, without ever blocking the serial loop for long.
 *
 * RETRY POLICY
 * ------------
 * | Outcome        | Classification     | Action                                  |
 * |----------------|--------------------|-----------------------------------------|
 * | Delivered      | success            | return                                  |
 * | Unroutable     | BrokerUnroutable   | log error, return failure, no retry     |
 * | Nacked         | BrokerTransient    | back off, retry on the same channel     |
 * | ConnectionLost | BrokerTransient    | back off, close, reconnect, retry       |
 *
 * Backoff is linear: attempt N waits N * backoff_step. Waits are cut short
 * by a shutdown request. Exhausting max_attempts returns failure; the
 * caller decides whether that matters.
 *
 * CONNECTION LIFECYCLE
 * --------------------
 * Lazy. The first publish (or any publish that finds the connection closed)
 * opens it and declares the exchange. close() is safe to call repeatedly
 * and runs from the destructor.
 *
 * Not thread-safe: one publisher per thread, as with the channel it owns.
 */
#ifndef ENDEC_RELIABLE_PUBLISHER_HPP
#define ENDEC_RELIABLE_PUBLISHER_HPP

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "endec/broker.hpp"
#include "endec/faults.hpp"
#include "endec/shutdown.hpp"

namespace endec {

struct PublisherConfig {
  std::string exchange;
  int max_attempts = 3;
  std::chrono::milliseconds backoff_step{1000};
};

/// Record of one publish() call. Not persisted.
struct PublishAttempt {
  std::string routing_key;
  std::string payload;                 ///< serialized JSON actually sent
  int attempts = 0;
  PublishOutcome outcome{PublishOutcome::ConnectionLost};
  FaultKind fault{FaultKind::None};

  bool delivered() const { return outcome == PublishOutcome::Delivered; }
};

class ReliablePublisher {
public:
  ReliablePublisher(std::unique_ptr<IBrokerConnection> conn,
                    PublisherConfig cfg,
                    const Shutdown* shutdown = nullptr);
  ~ReliablePublisher();

  ReliablePublisher(const ReliablePublisher&) = delete;
  ReliablePublisher& operator=(const ReliablePublisher&) = delete;

  PublishAttempt publish(const nlohmann::json& payload, const std::string& routing_key);

  /// Open connection + declare exchange if not already open.
  bool ensure_open();

  /// Release channel then connection. Best effort.
  void close();

  const PublisherConfig& config() const { return cfg_; }

private:
  bool backoff(int attempt);

  std::unique_ptr<IBrokerConnection> conn_;
  PublisherConfig cfg_;
  const Shutdown* shutdown_;
};

} // namespace endec

#endif // ENDEC_RELIABLE_PUBLISHER_HPP

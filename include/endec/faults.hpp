/**
 * @file faults.hpp
 * @brief Failure taxonomy shared by every stage of the relay.
 *
 * @details
 * Each recoverable failure the relay can hit belongs to exactly one class.
 * The class decides the recovery (treat as text, reopen, retry, give up)
 * and the log level. Nothing in this list is fatal to the process except
 * `Config`, which only occurs before the pipeline starts.
 *
 * | Kind             | Recovery                                   |
 * |------------------|--------------------------------------------|
 * | MalformedHeader  | header-shaped text kept as message body    |
 * | SerialIo         | close, wait, reopen the device             |
 * | SinkDelivery     | logged per sink, other sinks unaffected    |
 * | BrokerUnroutable | permanent for that message, no retry       |
 * | BrokerTransient  | bounded retry with backoff and reconnect   |
 * | HealthCheck      | counted toward the degraded state          |
 * | Config           | reported at startup, process exits         |
 */
#ifndef ENDEC_FAULTS_HPP
#define ENDEC_FAULTS_HPP

#include <stdint.h>

namespace endec {

enum class FaultKind : uint8_t {
  None = 0,
  MalformedHeader,
  SerialIo,
  SinkDelivery,
  BrokerUnroutable,
  BrokerTransient,
  HealthCheck,
  Config,
};

/// Stable lowercase name for log lines ("serial_io", "broker_unroutable", ...).
const char* to_string(FaultKind kind);

} // namespace endec

#endif // ENDEC_FAULTS_HPP

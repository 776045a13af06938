// -----------------------------------------------------------------------------
// faults.cpp: names for the failure taxonomy in faults.hpp
// -----------------------------------------------------------------------------
#include "endec/faults.hpp"

namespace endec {

const char* to_string(FaultKind kind) {
  switch (kind) {
    case FaultKind::None:             return "none";
    case FaultKind::MalformedHeader:  return "malformed_header";
    case FaultKind::SerialIo:         return "serial_io";
    case FaultKind::SinkDelivery:     return "sink_delivery";
    case FaultKind::BrokerUnroutable: return "broker_unroutable";
    case FaultKind::BrokerTransient:  return "broker_transient";
    case FaultKind::HealthCheck:      return "health_check";
    case FaultKind::Config:           return "config";
  }
  return "unknown";
}

} // namespace endec

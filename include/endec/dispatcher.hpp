/**
 * @file dispatcher.hpp
 * @brief Fan a resolved alert out to every configured sink, independently.
 *
 * @details
 * Sinks run in registration order, sequentially. A failure on one sink
 * (SinkResult::ok == false, or a std::exception escaping send()) is logged
 * as FaultKind::SinkDelivery and counted; it never stops the sinks after it.
 */
#ifndef ENDEC_DISPATCHER_HPP
#define ENDEC_DISPATCHER_HPP

#include <ctime>
#include <memory>
#include <vector>

#include "endec/sinks.hpp"

namespace endec {

struct DispatchReport {
  size_t attempted = 0;
  size_t delivered = 0;
  size_t failed() const { return attempted - delivered; }
};

class Dispatcher {
public:
  void add(std::unique_ptr<ISink> sink) { sinks_.push_back(std::move(sink)); }
  size_t size() const { return sinks_.size(); }

  DispatchReport dispatch(const ResolvedAlert& alert, std::time_t now);

private:
  std::vector<std::unique_ptr<ISink>> sinks_;
};

} // namespace endec

#endif // ENDEC_DISPATCHER_HPP

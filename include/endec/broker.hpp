/**
 * @file broker.hpp
 * @brief Seam between the reliable publisher and a concrete broker client.
 *
 * Contract:
 *  - open() brings up connection, channel and publisher confirms.
 *  - declare_exchange() is idempotent; called after every (re)open.
 *  - publish() sends one mandatory message and waits for the broker's
 *    confirm, translating the result into a PublishOutcome. It never throws.
 *  - close() releases channel then connection and ignores teardown errors.
 *
 * The production implementation is AmqpConnection (amqp_connection.hpp);
 * tests script outcomes through an in-memory fake.
 */
#ifndef ENDEC_BROKER_HPP
#define ENDEC_BROKER_HPP

#include <stdint.h>
#include <string>

namespace endec {

enum class PublishOutcome : uint8_t {
  Delivered = 0,   ///< confirmed and routed
  Unroutable,      ///< returned by the broker: no queue bound for the key
  Nacked,          ///< broker refused the message
  ConnectionLost,  ///< connection or channel failed before a confirm arrived
};

const char* to_string(PublishOutcome o);

class IBrokerConnection {
public:
  virtual ~IBrokerConnection() = default;
  virtual bool is_open() const = 0;
  virtual bool open(std::string& err) = 0;
  virtual bool declare_exchange(const std::string& exchange, std::string& err) = 0;
  virtual PublishOutcome publish(const std::string& exchange,
                                 const std::string& routing_key,
                                 const std::string& body) = 0;
  virtual void close() noexcept = 0;
};

} // namespace endec

#endif // ENDEC_BROKER_HPP

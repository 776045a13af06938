/**
 * @file sinks.hpp
 * @brief Destinations a resolved alert is fanned out to.
 *
 * @details
 * Every destination implements ISink. The dispatcher iterates a list of
 * them and never branches on the concrete type. A sink reports its own
 * failure in SinkResult; it does not retry (the broker sink's retries live
 * inside ReliablePublisher).
 *
 * | Sink         | Transport | Body                              |
 * |--------------|-----------|-----------------------------------|
 * | WebhookSink  | HTTP POST | webhook_payload()                 |
 * | DiscordSink  | HTTP POST | discord_payload()                 |
 * | GroupMeSink  | HTTP POST | groupme_text(), 500-byte segments |
 * | BrokerSink   | AMQP      | broker_alert_payload()            |
 */
#ifndef ENDEC_SINKS_HPP
#define ENDEC_SINKS_HPP

#include <chrono>
#include <ctime>
#include <string>
#include <vector>

#include "endec/block_resolver.hpp"
#include "endec/http.hpp"
#include "endec/reliable_publisher.hpp"

namespace endec {

static constexpr const char* GROUPME_POST_URL = "https://api.groupme.com/v3/bots/post";
static constexpr std::chrono::seconds HTTP_TIMEOUT{10};

struct SinkResult {
  bool ok = true;
  std::string detail;

  static SinkResult success() { return {}; }
  static SinkResult failure(std::string why) { return {false, std::move(why)}; }
};

class ISink {
public:
  virtual ~ISink() = default;

  /// Log label. Never contains credentials.
  virtual const std::string& name() const = 0;

  /// Deliver one alert. @p now stamps payloads that carry a processing time.
  virtual SinkResult send(const ResolvedAlert& alert, std::time_t now) = 0;
};

/// "https://host/path?token" -> "https://host". Keeps secrets out of logs.
std::string redact_url(const std::string& url);

class WebhookSink : public ISink {
public:
  WebhookSink(IHttpClient& http, std::string url);
  const std::string& name() const override { return name_; }
  SinkResult send(const ResolvedAlert& alert, std::time_t now) override;

private:
  IHttpClient& http_;
  std::string url_;
  std::string name_;
};

class DiscordSink : public ISink {
public:
  DiscordSink(IHttpClient& http, std::string url);
  const std::string& name() const override { return name_; }
  SinkResult send(const ResolvedAlert& alert, std::time_t now) override;

private:
  IHttpClient& http_;
  std::string url_;
  std::string name_;
};

class GroupMeSink : public ISink {
public:
  GroupMeSink(IHttpClient& http, std::vector<std::string> bot_ids, std::string footer,
              std::string endpoint = GROUPME_POST_URL);
  const std::string& name() const override { return name_; }

  /// Every segment goes to every bot; any failed post fails the sink.
  SinkResult send(const ResolvedAlert& alert, std::time_t now) override;

private:
  IHttpClient& http_;
  std::vector<std::string> bot_ids_;
  std::string footer_;
  std::string endpoint_;
  std::string name_{"groupme"};
};

class BrokerSink : public ISink {
public:
  BrokerSink(ReliablePublisher& publisher, std::string routing_key, std::string source);
  const std::string& name() const override { return name_; }
  SinkResult send(const ResolvedAlert& alert, std::time_t now) override;

private:
  ReliablePublisher& publisher_;
  std::string routing_key_;
  std::string source_;
  std::string name_;
};

} // namespace endec

#endif // ENDEC_SINKS_HPP

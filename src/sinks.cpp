// -----------------------------------------------------------------------------
// sinks.cpp: concrete destinations for sinks.hpp
//
// Each send() builds its body with payloads.hpp and hands it to the
// transport. Logging of the outcome is the dispatcher's job; sinks only
// log request-level detail at debug.
// -----------------------------------------------------------------------------
#include "endec/sinks.hpp"

#include <spdlog/spdlog.h>

#include "endec/payloads.hpp"

namespace endec {

namespace {

SinkResult from_response(const HttpResponse& r) {
  if (r.ok()) return SinkResult::success();
  if (!r.error.empty()) return SinkResult::failure(r.error);
  std::string why = "HTTP " + std::to_string(r.status);
  if (!r.body.empty()) why += ": " + r.body.substr(0, 200);
  return SinkResult::failure(why);
}

} // namespace

std::string redact_url(const std::string& url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos) return "<invalid url>";
  auto host_end = url.find_first_of("/?#", scheme + 3);
  std::string out = url.substr(0, host_end);
  // drop userinfo
  const auto at = out.find('@', scheme + 3);
  if (at != std::string::npos) out.erase(scheme + 3, at - scheme - 2);
  return out;
}

// ---------------------------- WebhookSink -----------------------------------

WebhookSink::WebhookSink(IHttpClient& http, std::string url)
: http_(http), url_(std::move(url)), name_("webhook " + redact_url(url_)) {}

SinkResult WebhookSink::send(const ResolvedAlert& alert, std::time_t) {
  const std::string body = to_wire(webhook_payload(alert));
  spdlog::debug("[{}] POST {}", name_, body);
  return from_response(http_.post_json(url_, body, HTTP_TIMEOUT));
}

// ---------------------------- DiscordSink -----------------------------------

DiscordSink::DiscordSink(IHttpClient& http, std::string url)
: http_(http), url_(std::move(url)), name_("discord " + redact_url(url_)) {}

SinkResult DiscordSink::send(const ResolvedAlert& alert, std::time_t) {
  const std::string body = to_wire(discord_payload(alert));
  spdlog::debug("[{}] POST {}", name_, body);
  return from_response(http_.post_json(url_, body, HTTP_TIMEOUT));
}

// ---------------------------- GroupMeSink -----------------------------------

GroupMeSink::GroupMeSink(IHttpClient& http, std::vector<std::string> bot_ids,
                         std::string footer, std::string endpoint)
: http_(http), bot_ids_(std::move(bot_ids)), footer_(std::move(footer)),
  endpoint_(std::move(endpoint)) {}

SinkResult GroupMeSink::send(const ResolvedAlert& alert, std::time_t) {
  const auto segments = split_segments(groupme_text(alert, footer_));

  int failed = 0;
  std::string last_error;
  for (const auto& seg : segments) {
    for (const auto& bot : bot_ids_) {
      const nlohmann::json body{{"bot_id", bot}, {"text", seg}};
      const SinkResult r = from_response(http_.post_json(endpoint_, to_wire(body), HTTP_TIMEOUT));
      if (!r.ok) {
        ++failed;
        last_error = r.detail;
      }
    }
  }
  spdlog::debug("[groupme] {} segment(s) x {} bot(s), {} failed",
                segments.size(), bot_ids_.size(), failed);

  if (failed == 0) return SinkResult::success();
  return SinkResult::failure(std::to_string(failed) + " post(s) failed, last: " + last_error);
}

// ---------------------------- BrokerSink ------------------------------------

BrokerSink::BrokerSink(ReliablePublisher& publisher, std::string routing_key, std::string source)
: publisher_(publisher), routing_key_(std::move(routing_key)), source_(std::move(source)),
  name_("broker " + publisher.config().exchange + "/" + routing_key_) {}

SinkResult BrokerSink::send(const ResolvedAlert& alert, std::time_t now) {
  const PublishAttempt a = publisher_.publish(broker_alert_payload(alert, source_, now), routing_key_);
  if (a.delivered()) return SinkResult::success();
  return SinkResult::failure(std::string(to_string(a.fault)) + " after " +
                             std::to_string(a.attempts) + " attempt(s)");
}

} // namespace endec

// -----------------------------------------------------------------------------
// payloads.cpp: body builders for payloads.hpp
// -----------------------------------------------------------------------------
#include "endec/payloads.hpp"

#include <algorithm>

#include "endec/time_zone.hpp"

namespace endec {

namespace {

// Discord embed side color: red for parsed alerts, grey for plain text.
constexpr int EMBED_ALERT = 0xE02B2B;
constexpr int EMBED_PLAIN = 0x95A5A6;

// Discord caps embed descriptions at 4096 and field values at 1024.
constexpr size_t EMBED_DESC_MAX  = 4096;
constexpr size_t EMBED_FIELD_MAX = 1024;

std::string join_locations(const EasHeader& h) {
  std::string out;
  for (const auto& n : h.location_names) {
    if (!out.empty()) out += "; ";
    out += n;
  }
  return out;
}

std::string clip(const std::string& s, size_t max) {
  if (s.size() <= max) return s;
  auto pieces = split_segments(s, max - 3);
  return pieces.front() + "...";
}

nlohmann::json field(const char* name, const std::string& value, bool inline_ = true) {
  return nlohmann::json{{"name", name},
                        {"value", value.empty() ? std::string(NOT_FOUND) : clip(value, EMBED_FIELD_MAX)},
                        {"inline", inline_}};
}

} // namespace

std::string to_wire(const nlohmann::json& body, int indent) {
  return body.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json alert_fields(const ResolvedAlert& a) {
  if (!a.header) {
    return nlohmann::json{
      {"event_name",       PLAIN_TEXT_EVENT},
      {"event_code",       NOT_FOUND},
      {"originator_name",  NOT_FOUND},
      {"originator_code",  NOT_FOUND},
      {"locations",        NOT_FOUND},
      {"duration_minutes", NOT_FOUND},
      {"start_time_utc",   NOT_FOUND},
      {"start_time_local", NOT_FOUND},
      {"sender",           NOT_FOUND},
      {"raw_header",       NOT_FOUND},
    };
  }
  const EasHeader& h = *a.header;
  return nlohmann::json{
    {"event_name",       h.event_name},
    {"event_code",       h.event_code},
    {"originator_name",  h.originator_name},
    {"originator_code",  h.originator_code},
    {"locations",        h.location_names},
    {"duration_minutes", h.duration_minutes},
    {"start_time_utc",   h.issued_utc},
    {"start_time_local", h.issued_local},
    {"sender",           h.sender},
    {"raw_header",       h.raw},
  };
}

nlohmann::json webhook_payload(const ResolvedAlert& a) {
  return nlohmann::json{{"message", a.body}, {"eas", alert_fields(a)}};
}

nlohmann::json broker_alert_payload(const ResolvedAlert& a,
                                    const std::string& source,
                                    std::time_t processed_at) {
  nlohmann::json eas = a.header
      ? to_json(*a.header)
      : nlohmann::json{{"event_name", PLAIN_TEXT_EVENT}, {"raw_header", NOT_FOUND}};

  return nlohmann::json{
    {"source",                  source},
    {"timestamp_processed_utc", format_utc_iso(processed_at)},
    {"message_text",            a.body},
    {"eas_data",                std::move(eas)},
  };
}

nlohmann::json health_payload(const HealthInfo& info, std::time_t now) {
  return nlohmann::json{
    {"source_application", info.source_application},
    {"event_type",         "health_check"},
    {"timestamp_utc",      format_utc_iso(now)},
    {"status",             "alive"},
    {"serial_port",        info.serial_port},
    {"system_info", {
      {"listening_port",   info.serial_port},
      {"application_name", info.application_name},
      {"version",          info.version},
    }},
  };
}

nlohmann::json discord_payload(const ResolvedAlert& a) {
  nlohmann::json embed;
  embed["description"] = clip(a.body, EMBED_DESC_MAX);

  if (!a.header) {
    embed["title"] = PLAIN_TEXT_EVENT;
    embed["color"] = EMBED_PLAIN;
    embed["fields"] = nlohmann::json::array({field("EAS Header", NOT_FOUND, false)});
    return nlohmann::json{{"embeds", nlohmann::json::array({std::move(embed)})}};
  }

  const EasHeader& h = *a.header;
  embed["title"] = h.event_name;
  embed["color"] = EMBED_ALERT;
  embed["fields"] = nlohmann::json::array({
    field("Event",      h.event_name + " (" + h.event_code + ")"),
    field("Originator", h.originator_name + " (" + h.originator_code + ")"),
    field("Duration",   std::to_string(h.duration_minutes) + " minutes"),
    field("Start (UTC)",   h.issued_utc),
    field("Start (Local)", h.issued_local),
    field("Sender",     h.sender),
    field("Locations",  join_locations(h), false),
    field("Raw Header", h.raw, false),
  });
  return nlohmann::json{{"embeds", nlohmann::json::array({std::move(embed)})}};
}

std::string groupme_text(const ResolvedAlert& a, std::string_view footer) {
  std::string out;
  if (a.header) {
    const EasHeader& h = *a.header;
    out += h.event_name + " (" + h.event_code + ") from " + h.originator_name + "\n";
    out += "Areas: " + join_locations(h) + "\n";
    out += "Duration: " + std::to_string(h.duration_minutes) + " minutes\n";
    out += "Starts: " + h.issued_local + "\n";
    out += "Sender: " + h.sender + "\n\n";
  }
  out += a.body;
  out += footer;
  return out;
}

std::vector<std::string> split_segments(std::string_view text, size_t max) {
  std::vector<std::string> out;
  if (max == 0) return out;

  size_t pos = 0;
  while (pos < text.size()) {
    size_t n = std::min(max, text.size() - pos);
    if (pos + n < text.size()) {
      // back off to the start of a UTF-8 sequence
      size_t cut = n;
      while (cut > 0 && (static_cast<unsigned char>(text[pos + cut]) & 0xC0) == 0x80) --cut;
      if (cut > 0) n = cut;
    }
    out.emplace_back(text.substr(pos, n));
    pos += n;
  }
  return out;
}

} // namespace endec

/**
 * @file payloads.hpp
 * @brief JSON / text bodies sent to each destination.
 *
 * @details
 * Pure builders: ResolvedAlert (+ a few scalars) in, body out. No I/O.
 * Every builder is header-optional: when no EAS header was parsed, fields
 * carry the NOT_FOUND placeholder and the event name reads
 * PLAIN_TEXT_EVENT, so receivers always get a complete schema.
 */
#ifndef ENDEC_PAYLOADS_HPP
#define ENDEC_PAYLOADS_HPP

#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "endec/block_resolver.hpp"

namespace endec {

static constexpr const char* NOT_FOUND        = "Not found";
static constexpr const char* PLAIN_TEXT_EVENT = "Plain Text Message";

/// GroupMe rejects longer messages.
static constexpr size_t GROUPME_SEGMENT = 500;

/// Identity block reported by heartbeats.
struct HealthInfo {
  std::string source_application;
  std::string serial_port;
  std::string application_name;
  std::string version;
};

/**
 * @brief Serialize a body for the wire.
 * Serial text is passed through byte for byte, so bodies may carry invalid
 * UTF-8; such bytes are written as U+FFFD instead of failing the dump.
 */
std::string to_wire(const nlohmann::json& body, int indent = -1);

/**
 * @brief Flat alert-field object (webhook "eas" block).
 * Keys: event_name, event_code, originator_name, originator_code, locations,
 * duration_minutes, start_time_utc, start_time_local, sender, raw_header.
 */
nlohmann::json alert_fields(const ResolvedAlert& a);

/// {"message": body, "eas": alert_fields(a)}
nlohmann::json webhook_payload(const ResolvedAlert& a);

/// Broker alert record: source, timestamp_processed_utc, message_text, eas_data.
nlohmann::json broker_alert_payload(const ResolvedAlert& a,
                                    const std::string& source,
                                    std::time_t processed_at);

/// Broker heartbeat record.
nlohmann::json health_payload(const HealthInfo& info, std::time_t now);

/// Discord webhook body: one embed, one field per header attribute.
nlohmann::json discord_payload(const ResolvedAlert& a);

/// Human-readable rendering plus footer, as posted to GroupMe.
std::string groupme_text(const ResolvedAlert& a, std::string_view footer);

/**
 * @brief Split @p text into pieces of at most @p max bytes.
 * Cuts never land inside a UTF-8 sequence. Empty input gives no pieces.
 */
std::vector<std::string> split_segments(std::string_view text, size_t max = GROUPME_SEGMENT);

} // namespace endec

#endif // ENDEC_PAYLOADS_HPP

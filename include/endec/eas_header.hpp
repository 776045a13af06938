/**
 * @file eas_header.hpp
 * @brief EAS `ZCZC` header grammar: strict matching, search, and field decoding.
 *
 * @details
 * PURPOSE
 * -------
 * Every alert the appliance prints may carry one fixed-width EAS header:
 *
 *     ZCZC-ORG-EEE-PSSCCC[-PSSCCC...]+TTTT-JJJHHMM-LLLLLLLL-
 *
 * | Field    | Width | Charset              | Meaning                          |
 * |----------|-------|----------------------|----------------------------------|
 * | ORG      | 3     | EAS, CIV, WXR, PEP   | originator                       |
 * | EEE      | 3     | A-Z                  | event code                       |
 * | PSSCCC   | 6     | 0-9, 1..31 of them   | location codes, '-' separated    |
 * | TTTT     | 4     | 0-9                  | duration, hhmm                   |
 * | JJJHHMM  | 7     | 0-9                  | issue day-of-year + UTC hhmm     |
 * | LLLLLLLL | 8     | A-Z a-z 0-9 '/' ' '  | sender id                        |
 *
 * The trailing dash is mandatory. Widths are exact: a string that looks
 * like a header but misses a width or charset rule is rejected
 * outright, never partially accepted. Callers then treat the text as
 * ordinary message body.
 *
 * THREE ENTRY POINTS
 * ------------------
 * - match_header_at(): does a valid header start exactly at @p pos? Returns
 *   its length (0 = no). This is the grammar; the other two build on it.
 * - find_header(): first valid header anywhere in a string (search, not
 *   anchored). Lowest offset wins.
 * - parse_header(): the whole input must be exactly one header; decodes the
 *   fields (names, minutes, UTC and local timestamps).
 *
 * TIMESTAMPS
 * ----------
 * JJJHHMM carries no year. It is read as UTC in the year supplied by the
 * caller (normally the current one): Jan 1 00:00 + (JJJ-1) days + HH:MM.
 * The sub-fields are not range checked; out-of-range hours or minutes
 * carry into the following day or hour.
 */
#ifndef ENDEC_EAS_HEADER_HPP
#define ENDEC_EAS_HEADER_HPP

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "endec/location_directory.hpp"
#include "endec/time_zone.hpp"

namespace endec {

static constexpr size_t MAX_LOCATIONS = 31;
static constexpr std::string_view HEADER_PREFIX = "ZCZC-";

/// Decoded header. `raw` is kept byte-for-byte for audit and display.
struct EasHeader {
  std::string raw;

  std::string originator_code;
  std::string originator_name;

  std::string event_code;
  std::string event_name;

  std::vector<std::string> location_codes;
  std::vector<std::string> location_names;   ///< parallel to location_codes

  std::string duration_raw;                  ///< "0130"
  int duration_minutes = 0;                  ///< 90

  std::string issued_raw;                    ///< "1251830"
  std::time_t issued_at = 0;                 ///< absolute UTC instant
  std::string issued_utc;                    ///< ISO-8601, +00:00
  std::string issued_local;                  ///< ISO-8601 in the configured zone

  std::string sender;                        ///< trailing spaces trimmed
};

/// Everything parse_header() needs besides the text itself.
struct HeaderContext {
  const LocationDirectory& locations;
  const TimeZone& zone;
  int year;
};

/// Character span of a header inside a larger string.
struct HeaderSpan {
  size_t offset = 0;
  size_t length = 0;
  size_t end() const { return offset + length; }
};

/// Length of the valid header starting exactly at @p pos, or 0.
size_t match_header_at(std::string_view text, size_t pos);

/// First valid header anywhere in @p text.
std::optional<HeaderSpan> find_header(std::string_view text);

/// Strict, fully anchored parse of one header.
std::optional<EasHeader> parse_header(std::string_view raw, const HeaderContext& ctx);

/// hhmm -> minutes: (v / 100) * 60 + v % 100.
int duration_to_minutes(int hhmm);

/// Jan 1 of @p year, UTC, plus (day-1) days, @p hour and @p minute.
std::time_t julian_to_utc(int year, int day_of_year, int hour, int minute);

/// Full field record used by the broker payload ("eas_data").
nlohmann::json to_json(const EasHeader& h);

} // namespace endec

#endif // ENDEC_EAS_HEADER_HPP

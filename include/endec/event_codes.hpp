/**
 * @file event_codes.hpp
 * @brief Static name tables for EAS originator and event codes.
 *
 * Unknown event codes are not an error: the header still parses and the
 * event name reads "Unknown". Originators are a closed set; the header
 * parser rejects anything outside it (see eas_header.hpp).
 */
#ifndef ENDEC_EVENT_CODES_HPP
#define ENDEC_EVENT_CODES_HPP

#include <string_view>

namespace endec {

static constexpr const char* UNKNOWN_EVENT_NAME = "Unknown";

/// Human-readable event name for a 3-letter code, or "Unknown".
const char* event_name(std::string_view code);

/// Name for EAS/CIV/WXR/PEP; nullptr for anything else.
const char* originator_name(std::string_view code);

/// State name for a 2-digit FIPS code ("48" -> "Texas"); nullptr if unknown.
const char* state_name(std::string_view fips);

} // namespace endec

#endif // ENDEC_EVENT_CODES_HPP

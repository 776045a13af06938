/**
 * @file time_zone.hpp
 * @brief Named IANA time zone used to render alert start times locally.
 *
 * @details
 * Alerts carry their issue time in UTC. Stations read them in local time,
 * so every parsed header is rendered twice: once as UTC and once in the
 * zone named in configuration (e.g. "America/New_York").
 *
 * Resolution rules:
 *  - "UTC" (and "Etc/UTC") always resolve.
 *  - Any other name must be a compiled zone file (TZif magic) under the
 *    zoneinfo directory ($TZDIR when set, /usr/share/zoneinfo otherwise).
 *
 * Conversion goes through the C library's TZ machinery. That machinery is
 * process-global, so conversions are serialized internally and the previous
 * TZ value is restored after each call.
 */
#ifndef ENDEC_TIME_ZONE_HPP
#define ENDEC_TIME_ZONE_HPP

#include <ctime>
#include <optional>
#include <string>

namespace endec {

class TimeZone {
public:
  /// UTC, always available.
  static TimeZone utc();

  /// Resolve a zone by name; std::nullopt if it cannot be found.
  static std::optional<TimeZone> load(const std::string& name);

  const std::string& name() const { return name_; }
  bool is_utc() const { return utc_; }

  /// ISO-8601 rendering with numeric offset, e.g. "2025-05-04T08:30:00-04:00".
  std::string format_iso(std::time_t t) const;

private:
  TimeZone(std::string name, bool utc) : name_(std::move(name)), utc_(utc) {}

  std::string name_;
  bool utc_;
};

/// ISO-8601 UTC rendering, e.g. "2025-05-04T12:30:00+00:00".
std::string format_utc_iso(std::time_t t);

} // namespace endec

#endif // ENDEC_TIME_ZONE_HPP

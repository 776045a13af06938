// -----------------------------------------------------------------------------
// eas_header.cpp: grammar matcher and field decoder for eas_header.hpp
//
// The matcher is a single left-to-right pass with no backtracking: every
// field has a fixed width, and the only repetition (location codes) is
// terminated by the '+' before the duration. Every rule parse_header()
// relies on is checked here, so find_header() never stops on a candidate
// that parse_header() would later reject.
// -----------------------------------------------------------------------------
#include "endec/eas_header.hpp"
#include "endec/event_codes.hpp"

#include <cctype>

namespace endec {

namespace {

// Small cursor over the candidate text. Every take_* either consumes its
// exact width and returns true, or leaves the cursor where it was.
struct Cursor {
  std::string_view s;
  size_t p;

  bool lit(char c) {
    if (p < s.size() && s[p] == c) { ++p; return true; }
    return false;
  }

  bool lit(std::string_view w) {
    if (s.substr(p, w.size()) == w) { p += w.size(); return true; }
    return false;
  }

  bool digits(size_t n) {
    if (p + n > s.size()) return false;
    for (size_t i = 0; i < n; ++i)
      if (!std::isdigit(static_cast<unsigned char>(s[p + i]))) return false;
    p += n;
    return true;
  }

  bool upper(size_t n) {
    if (p + n > s.size()) return false;
    for (size_t i = 0; i < n; ++i)
      if (s[p + i] < 'A' || s[p + i] > 'Z') return false;
    p += n;
    return true;
  }

  bool sender_chars(size_t n) {
    if (p + n > s.size()) return false;
    for (size_t i = 0; i < n; ++i) {
      const unsigned char c = static_cast<unsigned char>(s[p + i]);
      if (!(std::isalnum(c) || c == '/' || c == ' ')) return false;
    }
    p += n;
    return true;
  }
};

int to_int(std::string_view s) {
  int v = 0;
  for (char c : s) v = v * 10 + (c - '0');
  return v;
}

// Field offsets inside a header that already passed match_header_at().
constexpr size_t ORG_AT   = 5;
constexpr size_t EVENT_AT = 9;
constexpr size_t LOCS_AT  = 13;

} // namespace

size_t match_header_at(std::string_view text, size_t pos) {
  Cursor c{text, pos};

  if (!c.lit(HEADER_PREFIX)) return 0;

  const size_t org = c.p;
  if (!c.upper(3) || !originator_name(text.substr(org, 3))) return 0;
  if (!c.lit('-')) return 0;

  if (!c.upper(3) || !c.lit('-')) return 0;      // event code

  // PSSCCC(-PSSCCC)* '+'; a dash directly before '+' is tolerated
  size_t count = 0;
  while (true) {
    if (!c.digits(6)) return 0;
    ++count;
    if (c.lit('+')) break;
    if (!c.lit('-')) return 0;
    if (c.lit('+')) break;
    if (count == MAX_LOCATIONS) return 0;
  }

  if (!c.digits(4) || !c.lit('-')) return 0;      // duration

  // JJJHHMM is width-checked only; values add up arithmetically, so an
  // hour of 45 rolls into the next days.
  if (!c.digits(7) || !c.lit('-')) return 0;

  if (!c.sender_chars(8) || !c.lit('-')) return 0;

  return c.p - pos;
}

std::optional<HeaderSpan> find_header(std::string_view text) {
  size_t at = text.find(HEADER_PREFIX);
  while (at != std::string_view::npos) {
    if (size_t len = match_header_at(text, at); len > 0) return HeaderSpan{at, len};
    at = text.find(HEADER_PREFIX, at + 1);
  }
  return std::nullopt;
}

int duration_to_minutes(int hhmm) {
  return (hhmm / 100) * 60 + (hhmm % 100);
}

std::time_t julian_to_utc(int year, int day_of_year, int hour, int minute) {
  std::tm jan1{};
  jan1.tm_year = year - 1900;
  jan1.tm_mon  = 0;
  jan1.tm_mday = 1;
  const std::time_t base = timegm(&jan1);
  return base + static_cast<std::time_t>(day_of_year - 1) * 86400
              + static_cast<std::time_t>(hour) * 3600
              + static_cast<std::time_t>(minute) * 60;
}

std::optional<EasHeader> parse_header(std::string_view raw, const HeaderContext& ctx) {
  if (raw.empty() || match_header_at(raw, 0) != raw.size()) return std::nullopt;

  EasHeader h;
  h.raw = std::string(raw);

  h.originator_code = std::string(raw.substr(ORG_AT, 3));
  h.originator_name = originator_name(h.originator_code);

  h.event_code = std::string(raw.substr(EVENT_AT, 3));
  h.event_name = event_name(h.event_code);

  // Locations run until '+'; each is 6 digits, optionally followed by '-'.
  size_t p = LOCS_AT;
  while (raw[p] != '+') {
    h.location_codes.emplace_back(raw.substr(p, 6));
    h.location_names.push_back(ctx.locations.resolve(h.location_codes.back()));
    p += 6;
    if (raw[p] == '-') ++p;
  }
  ++p;                                            // '+'

  h.duration_raw = std::string(raw.substr(p, 4));
  h.duration_minutes = duration_to_minutes(to_int(h.duration_raw));
  p += 5;                                         // TTTT-

  h.issued_raw = std::string(raw.substr(p, 7));
  h.issued_at = julian_to_utc(ctx.year,
                              to_int(h.issued_raw.substr(0, 3)),
                              to_int(h.issued_raw.substr(3, 2)),
                              to_int(h.issued_raw.substr(5, 2)));
  h.issued_utc   = format_utc_iso(h.issued_at);
  h.issued_local = ctx.zone.format_iso(h.issued_at);
  p += 8;                                         // JJJHHMM-

  h.sender = std::string(raw.substr(p, 8));
  while (!h.sender.empty() && h.sender.back() == ' ') h.sender.pop_back();

  return h;
}

nlohmann::json to_json(const EasHeader& h) {
  return nlohmann::json{
    {"raw_header",       h.raw},
    {"originator_code",  h.originator_code},
    {"originator_name",  h.originator_name},
    {"event_code",       h.event_code},
    {"event_name",       h.event_name},
    {"location_codes",   h.location_codes},
    {"locations",        h.location_names},
    {"duration_raw",     h.duration_raw},
    {"duration_minutes", h.duration_minutes},
    {"timestamp_raw",    h.issued_raw},
    {"start_time_utc",   h.issued_utc},
    {"start_time_local", h.issued_local},
    {"sender",           h.sender},
  };
}

} // namespace endec

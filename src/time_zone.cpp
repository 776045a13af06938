// -----------------------------------------------------------------------------
// time_zone.cpp: zone lookup and ISO rendering for time_zone.hpp
//
// Local rendering swaps TZ around localtime_r(). The swap is guarded by one
// mutex for the whole process; callers never see TZ changed.
// -----------------------------------------------------------------------------
#include "endec/time_zone.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <time.h>

namespace fs = std::filesystem;

namespace endec {

static std::mutex g_tz_mutex;

static fs::path zoneinfo_dir() {
  if (const char* d = std::getenv("TZDIR"); d && *d) return fs::path(d);
  return fs::path("/usr/share/zoneinfo");
}

// Compiled zone files open with "TZif". Anything else in the zoneinfo tree
// (zone.tab, tzdata.zi, leapseconds) would make glibc fall back to UTC.
static bool is_tzif(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  char magic[4] = {};
  if (!in.read(magic, sizeof(magic))) return false;
  return magic[0] == 'T' && magic[1] == 'Z' && magic[2] == 'i' && magic[3] == 'f';
}

// "-0400" from strftime("%z") -> "-04:00"
static std::string iso_offset(long gmtoff) {
  char sign = gmtoff < 0 ? '-' : '+';
  if (gmtoff < 0) gmtoff = -gmtoff;
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld", sign, gmtoff / 3600, (gmtoff % 3600) / 60);
  return buf;
}

static std::string format_tm(const std::tm& tm, long gmtoff) {
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return std::string(buf) + iso_offset(gmtoff);
}

std::string format_utc_iso(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  return format_tm(tm, 0);
}

TimeZone TimeZone::utc() { return TimeZone("UTC", true); }

std::optional<TimeZone> TimeZone::load(const std::string& name) {
  if (name == "UTC" || name == "Etc/UTC") return utc();
  if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos)
    return std::nullopt;                        // names only, never paths

  std::error_code ec;
  const fs::path file = zoneinfo_dir() / name;
  if (!fs::is_regular_file(file, ec) || ec) return std::nullopt;
  if (!is_tzif(file)) return std::nullopt;
  return TimeZone(name, false);
}

std::string TimeZone::format_iso(std::time_t t) const {
  if (utc_) return format_utc_iso(t);

  std::lock_guard<std::mutex> lock(g_tz_mutex);

  const char* prev = std::getenv("TZ");
  const std::string saved = prev ? prev : "";
  const bool had_prev = prev != nullptr;

  ::setenv("TZ", name_.c_str(), 1);
  ::tzset();
  std::tm tm{};
  localtime_r(&t, &tm);
  const long off = tm.tm_gmtoff;

  if (had_prev) ::setenv("TZ", saved.c_str(), 1);
  else          ::unsetenv("TZ");
  ::tzset();

  return format_tm(tm, off);
}

} // namespace endec

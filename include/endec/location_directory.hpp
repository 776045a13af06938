/**
 * @file location_directory.hpp
 * @brief Immutable 6-digit location code -> county/state name mapping.
 *
 * @details
 * EAS location codes are `PSSCCC`:
 *  - `P`   subdivision of the county (0 = whole county), ignored for naming,
 *  - `SS`  state FIPS code,
 *  - `CCC` county FIPS code, `000` meaning the entire state.
 *
 * State names come from a built-in FIPS table. County names come from a JSON
 * file loaded once at startup:
 * @code
 *   { "counties": { "48113": "Dallas County, TX", "23005": "Cumberland County, ME" } }
 * @endcode
 *
 * Lookups never throw. Codes that cannot be named resolve to the explicit
 * placeholders below, so downstream payloads always carry a string.
 */
#ifndef ENDEC_LOCATION_DIRECTORY_HPP
#define ENDEC_LOCATION_DIRECTORY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace endec {

static constexpr const char* UNKNOWN_COUNTY = "Unknown County/Area";
static constexpr const char* UNKNOWN_STATE  = "Unknown State";

class LocationDirectory {
public:
  /// Empty directory: states still resolve, every county is the placeholder.
  LocationDirectory() = default;

  /**
   * @brief Build from a parsed JSON document.
   * @param err Receives a short reason on failure.
   * @return std::nullopt if the document does not have the expected shape.
   */
  static std::optional<LocationDirectory> from_json(const nlohmann::json& doc, std::string& err);

  /// Read and parse @p path; same failure contract as from_json().
  static std::optional<LocationDirectory> load_file(const std::string& path, std::string& err);

  /// Name for a 6-digit code. Codes ending in 000 name the state only.
  std::string resolve(std::string_view code) const;

  size_t county_count() const { return counties_.size(); }

private:
  std::unordered_map<std::string, std::string> counties_;   // "SSCCC" -> name
};

} // namespace endec

#endif // ENDEC_LOCATION_DIRECTORY_HPP

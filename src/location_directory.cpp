// -----------------------------------------------------------------------------
// location_directory.cpp: implementation for location_directory.hpp
// -----------------------------------------------------------------------------
#include "endec/location_directory.hpp"
#include "endec/event_codes.hpp"

#include <cctype>
#include <fstream>

namespace endec {

static bool all_digits(std::string_view s) {
  for (char c : s)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

std::optional<LocationDirectory> LocationDirectory::from_json(const nlohmann::json& doc,
                                                              std::string& err) {
  if (!doc.is_object()) { err = "locations: top level must be an object"; return std::nullopt; }

  LocationDirectory dir;
  auto it = doc.find("counties");
  if (it == doc.end()) return dir;              // states-only directory is fine
  if (!it->is_object()) { err = "locations: \"counties\" must be an object"; return std::nullopt; }

  for (const auto& [key, value] : it->items()) {
    if (key.size() != 5 || !all_digits(key)) {
      err = "locations: bad county key \"" + key + "\" (want 5 digits SSCCC)";
      return std::nullopt;
    }
    if (!value.is_string()) {
      err = "locations: name for " + key + " is not a string";
      return std::nullopt;
    }
    dir.counties_.emplace(key, value.get<std::string>());
  }
  return dir;
}

std::optional<LocationDirectory> LocationDirectory::load_file(const std::string& path,
                                                              std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "locations: cannot open " + path; return std::nullopt; }

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded()) { err = "locations: " + path + " is not valid JSON"; return std::nullopt; }
  return from_json(doc, err);
}

std::string LocationDirectory::resolve(std::string_view code) const {
  if (code.size() != 6 || !all_digits(code)) return UNKNOWN_COUNTY;

  const std::string_view state  = code.substr(1, 2);
  const std::string_view county = code.substr(3, 3);

  if (county == "000") {
    const char* s = state_name(state);
    return s ? s : UNKNOWN_STATE;
  }

  auto it = counties_.find(std::string(code.substr(1)));
  return it != counties_.end() ? it->second : UNKNOWN_COUNTY;
}

} // namespace endec

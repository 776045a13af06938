// -----------------------------------------------------------------------------
// event_codes.cpp: lookup tables for event_codes.hpp
//
// Tables are small and fixed, so lookups are linear scans over constexpr
// arrays. No allocation, no static-init order concerns.
// -----------------------------------------------------------------------------
#include "endec/event_codes.hpp"

namespace endec {

namespace {

struct CodeName {
  const char* code;
  const char* name;
};

constexpr CodeName EVENTS[] = {
  // national / administrative
  {"EAN", "Emergency Action Notification"},
  {"EAT", "Emergency Action Termination"},
  {"NIC", "National Information Center"},
  {"NPT", "National Periodic Test"},
  {"NAT", "National Audible Test"},
  {"NST", "National Silent Test"},
  {"RMT", "Required Monthly Test"},
  {"RWT", "Required Weekly Test"},
  {"DMO", "Practice/Demo Warning"},
  {"ADR", "Administrative Message"},
  {"NMN", "Network Message Notification"},
  // civil
  {"BLU", "Blue Alert"},
  {"CAE", "Child Abduction Emergency"},
  {"CDW", "Civil Danger Warning"},
  {"CEM", "Civil Emergency Message"},
  {"EVA", "Evacuation Watch"},
  {"EVI", "Evacuation Immediate"},
  {"FRW", "Fire Warning"},
  {"HMW", "Hazardous Materials Warning"},
  {"LAE", "Local Area Emergency"},
  {"LEW", "Law Enforcement Warning"},
  {"NUW", "Nuclear Power Plant Warning"},
  {"RHW", "Radiological Hazard Warning"},
  {"SPW", "Shelter in Place Warning"},
  {"TOE", "911 Telephone Outage Emergency"},
  {"BHW", "Biological Hazard Warning"},
  {"BWW", "Boil Water Warning"},
  {"CHW", "Chemical Hazard Warning"},
  {"CWW", "Contaminated Water Warning"},
  {"DEW", "Contagious Disease Warning"},
  {"FCW", "Food Contamination Warning"},
  {"IFW", "Industrial Fire Warning"},
  {"POS", "Power Outage Statement"},
  {"LSW", "Land Slide Warning"},
  // weather and natural hazards
  {"AVA", "Avalanche Watch"},
  {"AVW", "Avalanche Warning"},
  {"BZW", "Blizzard Warning"},
  {"CFA", "Coastal Flood Watch"},
  {"CFW", "Coastal Flood Warning"},
  {"DBA", "Dam Watch"},
  {"DBW", "Dam Break Warning"},
  {"DSW", "Dust Storm Warning"},
  {"EQW", "Earthquake Warning"},
  {"EWW", "Extreme Wind Warning"},
  {"FFA", "Flash Flood Watch"},
  {"FFS", "Flash Flood Statement"},
  {"FFW", "Flash Flood Warning"},
  {"FLA", "Flood Watch"},
  {"FLS", "Flood Statement"},
  {"FLW", "Flood Warning"},
  {"FSW", "Flash Freeze Warning"},
  {"FZW", "Freeze Warning"},
  {"HLS", "Hurricane Local Statement"},
  {"HUA", "Hurricane Watch"},
  {"HUW", "Hurricane Warning"},
  {"HWA", "High Wind Watch"},
  {"HWW", "High Wind Warning"},
  {"IBW", "Iceberg Warning"},
  {"SMW", "Special Marine Warning"},
  {"SPS", "Special Weather Statement"},
  {"SQW", "Snow Squall Warning"},
  {"SSA", "Storm Surge Watch"},
  {"SSW", "Storm Surge Warning"},
  {"SVA", "Severe Thunderstorm Watch"},
  {"SVR", "Severe Thunderstorm Warning"},
  {"SVS", "Severe Weather Statement"},
  {"TOA", "Tornado Watch"},
  {"TOR", "Tornado Warning"},
  {"TRA", "Tropical Storm Watch"},
  {"TRW", "Tropical Storm Warning"},
  {"TSA", "Tsunami Watch"},
  {"TSW", "Tsunami Warning"},
  {"VOW", "Volcano Warning"},
  {"WFA", "Wild Fire Watch"},
  {"WFW", "Wild Fire Warning"},
  {"WSA", "Winter Storm Watch"},
  {"WSW", "Winter Storm Warning"},
  // legacy and transmitter codes still seen on older ENDEC firmware
  {"TXB", "Transmitter Backup On"},
  {"TXF", "Transmitter Carrier Off"},
  {"TXO", "Transmitter Carrier On"},
  {"TXP", "Transmitter Primary On"},
  {"HWS", "High Wind Statement"},
  {"WSS", "Winter Storm Statement"},
  {"ESS", "Earthquake Statement"},
  {"EVW", "Evacuation Warning"},
  {"TSS", "Tsunami Statement"},
  {"VOS", "Volcano Statement"},
  {"FWW", "Fire Weather Warning"},
  {"TOS", "Tornado Statement"},
  {"HUS", "Hurricane Statement"},
};

constexpr CodeName ORIGINATORS[] = {
  {"EAS", "EAS Participant"},
  {"CIV", "Civil Authorities"},
  {"WXR", "National Weather Service"},
  {"PEP", "Primary Entry Point System"},
};

constexpr CodeName STATES[] = {
  {"01", "Alabama"},        {"02", "Alaska"},         {"04", "Arizona"},
  {"05", "Arkansas"},       {"06", "California"},     {"08", "Colorado"},
  {"09", "Connecticut"},    {"10", "Delaware"},       {"11", "District of Columbia"},
  {"12", "Florida"},        {"13", "Georgia"},        {"15", "Hawaii"},
  {"16", "Idaho"},          {"17", "Illinois"},       {"18", "Indiana"},
  {"19", "Iowa"},           {"20", "Kansas"},         {"21", "Kentucky"},
  {"22", "Louisiana"},      {"23", "Maine"},          {"24", "Maryland"},
  {"25", "Massachusetts"},  {"26", "Michigan"},       {"27", "Minnesota"},
  {"28", "Mississippi"},    {"29", "Missouri"},       {"30", "Montana"},
  {"31", "Nebraska"},       {"32", "Nevada"},         {"33", "New Hampshire"},
  {"34", "New Jersey"},     {"35", "New Mexico"},     {"36", "New York"},
  {"37", "North Carolina"}, {"38", "North Dakota"},   {"39", "Ohio"},
  {"40", "Oklahoma"},       {"41", "Oregon"},         {"42", "Pennsylvania"},
  {"44", "Rhode Island"},   {"45", "South Carolina"}, {"46", "South Dakota"},
  {"47", "Tennessee"},      {"48", "Texas"},          {"49", "Utah"},
  {"50", "Vermont"},        {"51", "Virginia"},       {"53", "Washington"},
  {"54", "West Virginia"},  {"55", "Wisconsin"},      {"56", "Wyoming"},
  {"60", "American Samoa"}, {"66", "Guam"},           {"69", "Northern Mariana Islands"},
  {"72", "Puerto Rico"},    {"78", "U.S. Virgin Islands"},
};

template <size_t N>
const char* lookup(const CodeName (&table)[N], std::string_view code) {
  for (const auto& e : table) {
    if (code == e.code) return e.name;
  }
  return nullptr;
}

} // namespace

const char* event_name(std::string_view code) {
  const char* n = lookup(EVENTS, code);
  return n ? n : UNKNOWN_EVENT_NAME;
}

const char* originator_name(std::string_view code) {
  return lookup(ORIGINATORS, code);
}

const char* state_name(std::string_view fips) {
  return lookup(STATES, fips);
}

} // namespace endec

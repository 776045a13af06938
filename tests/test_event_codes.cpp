#include <doctest/doctest.h>
#include "endec/event_codes.hpp"
#include "endec/faults.hpp"

#include <string>

using namespace endec;

TEST_CASE("Event table lookups") {
    CHECK(std::string(event_name("TOR")) == "Tornado Warning");
    CHECK(std::string(event_name("SVR")) == "Severe Thunderstorm Warning");
    CHECK(std::string(event_name("EAN")) == "Emergency Action Notification");
    CHECK(std::string(event_name("RMT")) == "Required Monthly Test");
    CHECK(std::string(event_name("ZZZ")) == "Unknown");
    CHECK(std::string(event_name("")) == "Unknown");
}

TEST_CASE("Originator set is closed") {
    CHECK(std::string(originator_name("EAS")) == "EAS Participant");
    CHECK(std::string(originator_name("CIV")) == "Civil Authorities");
    CHECK(std::string(originator_name("WXR")) == "National Weather Service");
    CHECK(std::string(originator_name("PEP")) == "Primary Entry Point System");
    CHECK(originator_name("XYZ") == nullptr);
    CHECK(originator_name("wxr") == nullptr);
}

TEST_CASE("State FIPS table") {
    CHECK(std::string(state_name("23")) == "Maine");
    CHECK(std::string(state_name("48")) == "Texas");
    CHECK(std::string(state_name("11")) == "District of Columbia");
    CHECK(state_name("99") == nullptr);
}

TEST_CASE("Fault names are stable") {
    CHECK(std::string(to_string(FaultKind::SerialIo)) == "serial_io");
    CHECK(std::string(to_string(FaultKind::BrokerUnroutable)) == "broker_unroutable");
    CHECK(std::string(to_string(FaultKind::MalformedHeader)) == "malformed_header");
}

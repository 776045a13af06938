#include <doctest/doctest.h>
#include "endec/payloads.hpp"

#include <string>

using namespace endec;
using nlohmann::json;

namespace {

ResolvedAlert plain(const char* body) {
    ResolvedAlert a;
    a.body = body;
    return a;
}

ResolvedAlert tornado() {
    static const LocationDirectory dir;
    static const TimeZone utc = TimeZone::utc();
    ResolvedAlert a;
    a.body = "Take shelter now";
    a.header = parse_header("ZCZC-WXR-TOR-048113+0030-1234567-KXYZ1234-", HeaderContext{dir, utc, 2025});
    a.source = HeaderSource::Line;
    REQUIRE(a.header.has_value());
    return a;
}

} // namespace

TEST_CASE("Alert fields fall back to placeholders without a header") {
    const json f = alert_fields(plain("hello"));
    CHECK(f.at("event_name") == PLAIN_TEXT_EVENT);
    CHECK(f.at("event_code") == NOT_FOUND);
    CHECK(f.at("locations") == NOT_FOUND);
    CHECK(f.at("duration_minutes") == NOT_FOUND);
    CHECK(f.at("start_time_local") == NOT_FOUND);
    CHECK(f.at("sender") == NOT_FOUND);
    CHECK(f.at("raw_header") == NOT_FOUND);
}

TEST_CASE("Alert fields from a parsed header") {
    const json f = alert_fields(tornado());
    CHECK(f.at("event_name") == "Tornado Warning");
    CHECK(f.at("originator_code") == "WXR");
    CHECK(f.at("duration_minutes") == 30);
    CHECK(f.at("locations").is_array());
    CHECK(f.at("sender") == "KXYZ1234");

    const json w = webhook_payload(tornado());
    CHECK(w.at("message") == "Take shelter now");
    CHECK(w.at("eas").at("event_code") == "TOR");
}

TEST_CASE("Broker alert payload") {
    const json p = broker_alert_payload(tornado(), "endec", 1735689600);
    CHECK(p.at("source") == "endec");
    CHECK(p.at("timestamp_processed_utc") == "2025-01-01T00:00:00+00:00");
    CHECK(p.at("message_text") == "Take shelter now");
    CHECK(p.at("eas_data").at("event_code") == "TOR");
    CHECK(p.at("eas_data").at("raw_header") == "ZCZC-WXR-TOR-048113+0030-1234567-KXYZ1234-");

    const json fb = broker_alert_payload(plain("just text"), "endec", 0);
    CHECK(fb.at("message_text") == "just text");
    CHECK(fb.at("eas_data") == json{{"event_name", "Plain Text Message"}, {"raw_header", "Not found"}});
}

TEST_CASE("Discord embed") {
    const json d = discord_payload(tornado());
    REQUIRE(d.at("embeds").size() == 1);
    const json& e = d.at("embeds").at(0);
    CHECK(e.at("title") == "Tornado Warning");
    CHECK(e.at("description") == "Take shelter now");
    CHECK(e.at("fields").size() == 8);

    const json p = discord_payload(plain("hi"));
    CHECK(p.at("embeds").at(0).at("title") == PLAIN_TEXT_EVENT);
    CHECK(p.at("embeds").at(0).at("description") == "hi");
}

TEST_CASE("Discord description is clipped to the embed limit") {
    const std::string big(5000, 'x');
    const json d = discord_payload(plain(big.c_str()));
    const std::string desc = d.at("embeds").at(0).at("description");
    CHECK(desc.size() == 4096);
    CHECK(desc.substr(desc.size() - 3) == "...");
}

TEST_CASE("GroupMe text carries the summary, body and footer") {
    const std::string t = groupme_text(tornado(), "\n--footer");
    CHECK(t.find("Tornado Warning (TOR) from National Weather Service") == 0);
    CHECK(t.find("Duration: 30 minutes") != std::string::npos);
    CHECK(t.find("Sender: KXYZ1234") != std::string::npos);
    CHECK(t.find("Take shelter now\n--footer") != std::string::npos);

    CHECK(groupme_text(plain("hello"), "|f") == "hello|f");
}

TEST_CASE("Segments are at most 500 bytes") {
    const std::string s(1200, 'a');
    const auto parts = split_segments(s);
    REQUIRE(parts.size() == 3);
    CHECK(parts[0].size() == 500);
    CHECK(parts[1].size() == 500);
    CHECK(parts[2].size() == 200);
    CHECK(parts[0] + parts[1] + parts[2] == s);

    CHECK(split_segments("").empty());
    CHECK(split_segments("short").size() == 1);
}

TEST_CASE("Segments never split a UTF-8 sequence") {
    std::string s(499, 'a');
    s += "\xC3\xA9";                                  // e-acute, 2 bytes
    s += "b";
    const auto parts = split_segments(s, 500);
    REQUIRE(parts.size() == 2);
    CHECK(parts[0].size() == 499);
    CHECK(parts[1] == "\xC3\xA9" "b");
}

TEST_CASE("Wire bodies replace invalid UTF-8 instead of throwing") {
    const json body = webhook_payload(plain("Take shelter \xff\xfe now"));
    std::string wire;
    CHECK_NOTHROW(wire = to_wire(body));
    const json back = json::parse(wire);
    CHECK(back.at("message") == "Take shelter \xEF\xBF\xBD\xEF\xBF\xBD now");

    CHECK(to_wire(json{{"k", "ok"}}) == R"({"k":"ok"})");
    CHECK(to_wire(json{{"k", 1}}, 2) == "{\n  \"k\": 1\n}");
}

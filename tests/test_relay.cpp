#include <doctest/doctest.h>
#include "endec/relay.hpp"
#include "fakes.hpp"

using namespace endec;
using namespace endec::test;

namespace {

const char* TOR = "ZCZC-WXR-TOR-048113+0030-1234567-KXYZ1234-";
const TimePoint T0 = Clock::from_time_t(1735689600);   // 2025-01-01T00:00:00Z

struct Rig {
    Shutdown stop;
    ScriptedSource source{stop};
    Dispatcher dispatcher;
    RecordingSink* sink = nullptr;
    LocationDirectory dir;
    TimeZone zone = TimeZone::utc();

    Rig() {
        auto s = std::make_unique<RecordingSink>("recording");
        sink = s.get();
        dispatcher.add(std::move(s));
    }

    RelayOptions fast() const {
        RelayOptions o;
        o.read_timeout = std::chrono::milliseconds(10);
        o.reconnect_delay = std::chrono::seconds(0);
        return o;
    }
};

} // namespace

TEST_CASE("Stage API: one framed alert is resolved and dispatched") {
    Rig r;
    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());

    relay.on_line("<ENDECSTART>", T0);
    relay.on_line(TOR, T0);
    relay.on_line("Take shelter now", T0);
    CHECK(r.sink->alerts.empty());
    relay.on_line("<ENDECEND>", T0);

    REQUIRE(r.sink->alerts.size() == 1);
    const ResolvedAlert& a = r.sink->alerts[0];
    REQUIRE(a.has_header());
    CHECK(a.header->event_code == "TOR");
    CHECK(a.header->duration_minutes == 30);
    CHECK(a.header->sender == "KXYZ1234");
    CHECK(a.header->issued_utc == "2025-05-04T22:07:00+00:00");   // year taken from now
    CHECK(a.body == "Take shelter now");
    CHECK(r.sink->stamps[0] == 1735689600);
    CHECK(relay.stats().alerts_dispatched == 1);
}

TEST_CASE("Stage API: read timeout dispatches the partial block") {
    Rig r;
    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());

    relay.on_line("<ENDECSTART>", T0);
    relay.on_line("cut off mid", T0);
    relay.on_timeout(T0);
    REQUIRE(r.sink->alerts.size() == 1);
    CHECK(r.sink->alerts[0].body == "cut off mid");
    CHECK_FALSE(r.sink->alerts[0].has_header());

    relay.on_timeout(T0);                           // nothing open: no-op
    CHECK(r.sink->alerts.size() == 1);
}

TEST_CASE("Alerts leave in arrival order") {
    Rig r;
    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());
    relay.on_line("<ENDECSTART>one<ENDECEND><ENDECSTART>two<ENDECEND>", T0);
    REQUIRE(r.sink->alerts.size() == 2);
    CHECK(r.sink->alerts[0].body == "one");
    CHECK(r.sink->alerts[1].body == "two");
}

TEST_CASE("Session loop: open failure, serial error, reopen, shutdown") {
    Rig r;
    r.source.open_results = {false, true, true};
    r.source.line("<ENDECSTART>");
    r.source.line("first");
    r.source.error();                               // session 1 dies mid-block
    r.source.line("<ENDECSTART>");
    r.source.line(TOR);
    r.source.line("<ENDECEND>");
    // script exhausted -> shutdown requested

    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());
    relay.run();

    CHECK(r.stop.requested());
    CHECK(r.source.opens == 3);
    CHECK(r.source.closes == 2);
    CHECK_FALSE(r.source.is_open());
    CHECK(relay.stats().sessions == 2);
    CHECK(relay.stats().serial_errors == 1);

    REQUIRE(r.sink->alerts.size() == 2);
    CHECK(r.sink->alerts[0].body == "first");       // flushed on teardown
    REQUIRE(r.sink->alerts[1].has_header());
    CHECK(r.sink->alerts[1].header->event_code == "TOR");
}

TEST_CASE("Shutdown while collecting finishes the block first") {
    Rig r;
    r.source.line("<ENDECSTART>");
    r.source.line("almost done");

    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());
    relay.run();

    REQUIRE(r.sink->alerts.size() == 1);
    CHECK(r.sink->alerts[0].body == "almost done");
    CHECK_FALSE(relay.assembler().is_collecting());
}

TEST_CASE("Shutdown requested before start: the loop never opens the port") {
    Rig r;
    r.stop.request();
    Relay relay(r.source, r.dispatcher, r.dir, r.zone, nullptr, r.stop, r.fast());
    relay.run();
    CHECK(r.source.opens == 0);
}

TEST_CASE("Heartbeat goes out from the read loop") {
    Rig r;
    BrokerScript s;
    PublisherConfig pc;
    pc.exchange = "healthcheck";
    pc.backoff_step = std::chrono::milliseconds(0);
    ReliablePublisher pub(make_broker(s), pc);

    HealthConfig hc;
    hc.routing_key = "health.endec";
    hc.info = HealthInfo{"endec", "scripted", "endec-relay", "1.0.0"};
    HealthMonitor hm(pub, hc);

    r.source.timeout();
    r.source.timeout();

    Relay relay(r.source, r.dispatcher, r.dir, r.zone, &hm, r.stop, r.fast());
    relay.run();

    CHECK(s.publishes == 1);                        // due at startup, then hourly
    CHECK(s.last_routing_key == "health.endec");
    CHECK(r.sink->alerts.empty());
}

TEST_CASE("utc_year") {
    CHECK(utc_year(T0) == 2025);
    CHECK(utc_year(T0 - std::chrono::seconds(1)) == 2024);
}

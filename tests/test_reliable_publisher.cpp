#include <doctest/doctest.h>
#include "endec/reliable_publisher.hpp"
#include "fakes.hpp"

using namespace endec;
using endec::test::BrokerScript;
using endec::test::make_broker;
using nlohmann::json;

namespace {

PublisherConfig fast(int attempts = 3) {
    PublisherConfig c;
    c.exchange = "endec";
    c.max_attempts = attempts;
    c.backoff_step = std::chrono::milliseconds(0);
    return c;
}

const json PAYLOAD = json{{"hello", "world"}};

} // namespace

TEST_CASE("First publish opens lazily, declares the exchange and delivers") {
    BrokerScript s;
    ReliablePublisher pub(make_broker(s), fast());

    const PublishAttempt a = pub.publish(PAYLOAD, "notification.endec");
    CHECK(a.delivered());
    CHECK(a.attempts == 1);
    CHECK(a.fault == FaultKind::None);
    CHECK(a.routing_key == "notification.endec");
    CHECK(a.payload == PAYLOAD.dump());

    CHECK(s.opens == 1);
    REQUIRE(s.declared.size() == 1);
    CHECK(s.declared[0] == "endec");
    CHECK(s.last_exchange == "endec");
    CHECK(s.last_body == PAYLOAD.dump());

    // connection is reused
    CHECK(pub.publish(PAYLOAD, "k").delivered());
    CHECK(s.opens == 1);
}

TEST_CASE("Unroutable fails after exactly one attempt") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::Unroutable, PublishOutcome::Delivered};
    ReliablePublisher pub(make_broker(s), fast());

    const PublishAttempt a = pub.publish(PAYLOAD, "nowhere");
    CHECK_FALSE(a.delivered());
    CHECK(a.outcome == PublishOutcome::Unroutable);
    CHECK(a.fault == FaultKind::BrokerUnroutable);
    CHECK(a.attempts == 1);
    CHECK(s.publishes == 1);
}

TEST_CASE("Connection loss is retried up to the budget, reconnecting each time") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::ConnectionLost, PublishOutcome::ConnectionLost,
                  PublishOutcome::ConnectionLost, PublishOutcome::Delivered};
    ReliablePublisher pub(make_broker(s), fast(3));

    const PublishAttempt a = pub.publish(PAYLOAD, "k");
    CHECK_FALSE(a.delivered());
    CHECK(a.outcome == PublishOutcome::ConnectionLost);
    CHECK(a.fault == FaultKind::BrokerTransient);
    CHECK(a.attempts == 3);
    CHECK(s.publishes == 3);
    CHECK(s.opens == 3);
}

TEST_CASE("Transient failure then success") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::ConnectionLost, PublishOutcome::Delivered};
    ReliablePublisher pub(make_broker(s), fast());

    const PublishAttempt a = pub.publish(PAYLOAD, "k");
    CHECK(a.delivered());
    CHECK(a.attempts == 2);
    CHECK(s.opens == 2);
}

TEST_CASE("Nack is retried on the same connection") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::Nacked, PublishOutcome::Delivered};
    ReliablePublisher pub(make_broker(s), fast());

    const PublishAttempt a = pub.publish(PAYLOAD, "k");
    CHECK(a.delivered());
    CHECK(a.attempts == 2);
    CHECK(s.opens == 1);
}

TEST_CASE("Broker down: every attempt fails to connect") {
    BrokerScript s;
    s.open_fails = true;
    ReliablePublisher pub(make_broker(s), fast(3));

    const PublishAttempt a = pub.publish(PAYLOAD, "k");
    CHECK_FALSE(a.delivered());
    CHECK(a.attempts == 3);
    CHECK(s.opens == 3);
    CHECK(s.publishes == 0);
}

TEST_CASE("Exchange declare failure counts as a failed connect") {
    BrokerScript s;
    s.declare_fails = true;
    ReliablePublisher pub(make_broker(s), fast(2));

    CHECK_FALSE(pub.publish(PAYLOAD, "k").delivered());
    CHECK(s.publishes == 0);
    CHECK(s.opens == 2);
}

TEST_CASE("Shutdown cuts the backoff short") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::ConnectionLost, PublishOutcome::ConnectionLost, PublishOutcome::ConnectionLost};
    Shutdown stop;
    stop.request();

    PublisherConfig c = fast(3);
    c.backoff_step = std::chrono::milliseconds(60000);
    ReliablePublisher pub(make_broker(s), c, &stop);

    const PublishAttempt a = pub.publish(PAYLOAD, "k");
    CHECK_FALSE(a.delivered());
    CHECK(a.attempts == 1);
}

TEST_CASE("Budget below one is treated as one attempt") {
    BrokerScript s;
    s.outcomes = {PublishOutcome::Nacked};
    ReliablePublisher pub(make_broker(s), fast(0));
    CHECK(pub.publish(PAYLOAD, "k").attempts == 1);
}

TEST_CASE("close() and the destructor release the connection") {
    BrokerScript s;
    {
        ReliablePublisher pub(make_broker(s), fast());
        CHECK(pub.ensure_open());
        pub.close();
        CHECK(s.closes == 1);
        pub.close();                                // repeated close is harmless
    }
    CHECK(s.closes >= 2);
}

TEST_CASE("Outcome names") {
    CHECK(std::string(to_string(PublishOutcome::Delivered)) == "delivered");
    CHECK(std::string(to_string(PublishOutcome::Unroutable)) == "unroutable");
}

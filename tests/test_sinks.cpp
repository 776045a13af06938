#include <doctest/doctest.h>
#include "endec/block_resolver.hpp"
#include "endec/dispatcher.hpp"
#include "endec/frame_assembler.hpp"
#include "endec/sinks.hpp"
#include "fakes.hpp"

#include <string>

using namespace endec;
using namespace endec::test;
using nlohmann::json;

namespace {

ResolvedAlert plain(const std::string& body) {
    ResolvedAlert a;
    a.body = body;
    return a;
}

} // namespace

TEST_CASE("redact_url keeps scheme and host only") {
    CHECK(redact_url("https://discord.com/api/webhooks/123/secret") == "https://discord.com");
    CHECK(redact_url("amqp://user:pw@broker:5672/vhost") == "amqp://broker:5672");
    CHECK(redact_url("http://host?token=x") == "http://host");
    CHECK(redact_url("not a url") == "<invalid url>");
}

TEST_CASE("Webhook posts the message and field block") {
    RecordingHttp http;
    WebhookSink sink(http, "https://hooks.example.org/abc?key=secret");
    CHECK(sink.name() == "webhook https://hooks.example.org");

    const SinkResult r = sink.send(plain("hello"), 0);
    CHECK(r.ok);
    REQUIRE(http.requests.size() == 1);
    CHECK(http.requests[0].url == "https://hooks.example.org/abc?key=secret");
    const json body = json::parse(http.requests[0].body);
    CHECK(body.at("message") == "hello");
    CHECK(body.at("eas").at("event_name") == "Plain Text Message");
}

TEST_CASE("Non-2xx and transport errors fail the sink") {
    RecordingHttp http;
    http.responses.push_back(HttpResponse{500, "internal error", ""});
    http.responses.push_back(HttpResponse{0, "", "Connection timed out"});
    WebhookSink sink(http, "https://h/x");

    SinkResult r = sink.send(plain("a"), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.detail.find("HTTP 500") == 0);

    r = sink.send(plain("a"), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.detail == "Connection timed out");
}

TEST_CASE("Discord posts an embed") {
    RecordingHttp http;
    DiscordSink sink(http, "https://discord.com/api/webhooks/1/t");
    CHECK(sink.send(plain("hi"), 0).ok);
    REQUIRE(http.requests.size() == 1);
    const json body = json::parse(http.requests[0].body);
    CHECK(body.at("embeds").at(0).at("title") == "Plain Text Message");
}

TEST_CASE("GroupMe posts every segment to every bot") {
    RecordingHttp http;
    GroupMeSink sink(http, {"bot-a", "bot-b"}, "", "https://groupme.test/post");

    CHECK(sink.send(plain(std::string(1200, 'x')), 0).ok);
    REQUIRE(http.requests.size() == 6);
    CHECK(http.requests[0].url == "https://groupme.test/post");

    const json first = json::parse(http.requests[0].body);
    const json second = json::parse(http.requests[1].body);
    CHECK(first.at("bot_id") == "bot-a");
    CHECK(second.at("bot_id") == "bot-b");
    CHECK(first.at("text").get<std::string>().size() == 500);
    CHECK(json::parse(http.requests[5].body).at("text").get<std::string>().size() == 200);
}

TEST_CASE("GroupMe fails if any post fails") {
    RecordingHttp http;
    http.responses.push_back(HttpResponse{200, "", ""});
    http.responses.push_back(HttpResponse{400, "bad bot", ""});
    GroupMeSink sink(http, {"good", "bad"}, "");

    const SinkResult r = sink.send(plain("short"), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.detail.find("1 post(s) failed") == 0);
    CHECK(http.requests[0].url == GROUPME_POST_URL);
}

TEST_CASE("Broker sink wraps the alert and reports publisher failure") {
    BrokerScript s;
    PublisherConfig c;
    c.exchange = "endec";
    c.backoff_step = std::chrono::milliseconds(0);
    ReliablePublisher pub(make_broker(s), c);
    BrokerSink sink(pub, "notification.endec", "studio-a");
    CHECK(sink.name() == "broker endec/notification.endec");

    CHECK(sink.send(plain("hello"), 1735689600).ok);
    const json body = json::parse(s.last_body);
    CHECK(body.at("source") == "studio-a");
    CHECK(body.at("timestamp_processed_utc") == "2025-01-01T00:00:00+00:00");
    CHECK(body.at("message_text") == "hello");
    CHECK(s.last_routing_key == "notification.endec");

    s.outcomes.push_back(PublishOutcome::Unroutable);
    const SinkResult r = sink.send(plain("x"), 0);
    CHECK_FALSE(r.ok);
    CHECK(r.detail == "broker_unroutable after 1 attempt(s)");
}

TEST_CASE("Line noise bytes do not stop delivery to any JSON sink") {
    FrameAssembler fa;
    fa.push_line("<ENDECSTART>");
    fa.push_line("ZCZC-WXR-TOR-048113+0030-1234567-KXYZ1234-");
    fa.push_line("Take shelter now \xff\xfe line noise");
    fa.push_line("<ENDECEND>");
    AlertBlock block;
    REQUIRE(fa.get_block(block));

    const LocationDirectory dir;
    const TimeZone utc = TimeZone::utc();
    const ResolvedAlert alert = resolve_block(block, HeaderContext{dir, utc, 2025});
    REQUIRE(alert.header.has_value());

    RecordingHttp http;
    BrokerScript s;
    PublisherConfig c;
    c.backoff_step = std::chrono::milliseconds(0);
    ReliablePublisher pub(make_broker(s), c);

    Dispatcher d;
    d.add(std::make_unique<WebhookSink>(http, "https://h/x"));
    d.add(std::make_unique<DiscordSink>(http, "https://discord.com/api/webhooks/1/t"));
    d.add(std::make_unique<GroupMeSink>(http, std::vector<std::string>{"bot"}, "footer"));
    d.add(std::make_unique<BrokerSink>(pub, "notification.endec", "studio-a"));

    const DispatchReport rep = d.dispatch(alert, 0);
    CHECK(rep.attempted == 4);
    CHECK(rep.delivered == 4);
    REQUIRE(http.requests.size() == 3);
    CHECK(json::parse(http.requests[0].body).at("message") ==
          "Take shelter now \xEF\xBF\xBD\xEF\xBF\xBD line noise");
    CHECK(json::parse(s.last_body).at("message_text") ==
          "Take shelter now \xEF\xBF\xBD\xEF\xBF\xBD line noise");
}

TEST_CASE("Dispatcher isolates sink failures") {
    Dispatcher d;
    auto* first = new RecordingSink("first");
    auto* failing = new RecordingSink("failing", false);
    auto* last = new RecordingSink("last");
    d.add(std::unique_ptr<ISink>(first));
    d.add(std::make_unique<ThrowingSink>());
    d.add(std::unique_ptr<ISink>(failing));
    d.add(std::unique_ptr<ISink>(last));
    CHECK(d.size() == 4);

    const DispatchReport rep = d.dispatch(plain("alert"), 42);
    CHECK(rep.attempted == 4);
    CHECK(rep.delivered == 2);
    CHECK(rep.failed() == 2);

    REQUIRE(first->alerts.size() == 1);
    REQUIRE(last->alerts.size() == 1);
    CHECK(last->alerts[0].body == "alert");
    CHECK(last->stamps[0] == 42);
    CHECK(failing->alerts.size() == 1);
}

TEST_CASE("Empty dispatcher") {
    Dispatcher d;
    const DispatchReport rep = d.dispatch(plain("x"), 0);
    CHECK(rep.attempted == 0);
    CHECK(rep.failed() == 0);
}

/**
 * @file main.cpp
 * @brief endec-relay: serial EAS decoder that republishes every alert.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and layer them over the JSON config/secrets.
 *  - Validate everything before touching the serial port; exit 2 on bad config.
 *  - Wire SerialPort -> Relay -> Dispatcher -> {webhook, Discord, GroupMe, broker}
 *    plus the health-check publisher.
 *  - Stop cleanly on SIGINT/SIGTERM.
 *
 * Exit codes: 0 clean shutdown, 1 unexpected failure, 2 configuration error.
 */

#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "endec/config.hpp"
#include "endec/dispatcher.hpp"
#include "endec/faults.hpp"
#include "endec/health_monitor.hpp"
#include "endec/location_directory.hpp"
#include "endec/logging.hpp"
#include "endec/payloads.hpp"
#include "endec/relay.hpp"
#include "endec/reliable_publisher.hpp"
#include "endec/shutdown.hpp"
#include "endec/sinks.hpp"
#include "endec/time_zone.hpp"
#include "endec/version.hpp"

#include "amqp_connection.hpp"
#include "http_client.hpp"
#include "serial_io.hpp"

using json = nlohmann::json;
using namespace endec;

static Shutdown g_shutdown;

extern "C" void on_signal(int) { g_shutdown.request(); }

// No SA_RESTART: a pending poll() returns EINTR and the loop sees the flag.
static void install_signal_handlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

static std::string groupme_footer() {
  return std::string("\n\nThis message was sent using ") + APP_NAME + " " + APP_VERSION + "\n----------";
}

static int run(const Config& cfg) {
  const auto zone = TimeZone::load(cfg.timezone);
  if (!zone) {
    spdlog::critical("[config] unknown timezone '{}'", cfg.timezone);
    return 2;
  }

  LocationDirectory locations;
  if (!cfg.locations_file.empty()) {
    std::string err;
    auto loaded = LocationDirectory::load_file(cfg.locations_file, err);
    if (!loaded) {
      spdlog::critical("[config] {}: {}", cfg.locations_file, err);
      return 2;
    }
    locations = std::move(*loaded);
    spdlog::info("[config] {} county name(s) from {}", locations.county_count(), cfg.locations_file);
  }

  CurlGlobal curl;
  if (!curl.ok()) {
    spdlog::critical("curl_global_init failed");
    return 1;
  }
  CurlHttpClient http(std::string(APP_NAME) + "/" + APP_VERSION);

  Dispatcher dispatcher;
  for (const auto& u : cfg.webhooks)         dispatcher.add(std::make_unique<WebhookSink>(http, u));
  for (const auto& u : cfg.discord_webhooks) dispatcher.add(std::make_unique<DiscordSink>(http, u));
  if (!cfg.groupme_bot_ids.empty()) {
    dispatcher.add(std::make_unique<GroupMeSink>(http, cfg.groupme_bot_ids, groupme_footer()));
  }

  // Alerts and heartbeats use separate connections so a heartbeat stuck in
  // backoff never shares a channel with an alert publish.
  std::unique_ptr<ReliablePublisher> alert_pub;
  std::unique_ptr<ReliablePublisher> health_pub;
  std::unique_ptr<HealthMonitor> health;

  if (cfg.has_broker()) {
    alert_pub = std::make_unique<ReliablePublisher>(
        std::make_unique<AmqpConnection>(cfg.amqp_url),
        PublisherConfig{cfg.alert_exchange}, &g_shutdown);
    dispatcher.add(std::make_unique<BrokerSink>(*alert_pub, cfg.alert_routing_key, cfg.source_name));

    health_pub = std::make_unique<ReliablePublisher>(
        std::make_unique<AmqpConnection>(cfg.amqp_url),
        PublisherConfig{cfg.health_exchange}, &g_shutdown);

    HealthConfig hc;
    hc.routing_key = cfg.health_routing_key;
    hc.info = HealthInfo{cfg.source_name, cfg.serial_port, APP_NAME, APP_VERSION};
    health = std::make_unique<HealthMonitor>(*health_pub, hc);
  }

  spdlog::info("[relay] {} sink(s), timezone {}, health checks {}",
               dispatcher.size(), zone->name(), health ? "on" : "off");

  SerialPort port(cfg.serial_port, cfg.baud);

  RelayOptions opts;
  opts.read_timeout = std::chrono::milliseconds(cfg.read_timeout_ms);
  opts.reconnect_delay = std::chrono::seconds(cfg.reconnect_delay_s);

  Relay relay(port, dispatcher, locations, *zone, health.get(), g_shutdown, opts);
  relay.run();
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"endec-relay: decode EAS alerts from a serial ENDEC and republish them"};

  std::string config_path, secrets_path;
  std::string serial_port, amqp_url, timezone, locations_file, log_file, source_name;
  std::vector<std::string> webhooks, discord, groupme;
  int baud = 0;
  bool debug = false, version = false;

  app.add_option("-c,--config", config_path, "JSON configuration file")->check(CLI::ExistingFile);
  app.add_option("--secrets", secrets_path, "JSON secrets file merged over --config")->check(CLI::ExistingFile);
  auto* o_port     = app.add_option("-p,--port", serial_port, "Serial device (e.g. /dev/serial/by-id/...)");
  auto* o_baud     = app.add_option("-b,--baud", baud, "Serial baud rate (default 9600)");
  auto* o_webhook  = app.add_option("--webhook", webhooks, "Generic webhook URL (repeatable)");
  auto* o_discord  = app.add_option("--discord", discord, "Discord webhook URL (repeatable)");
  auto* o_groupme  = app.add_option("--groupme", groupme, "GroupMe bot id (repeatable)");
  auto* o_amqp     = app.add_option("--amqp-url", amqp_url, "Broker URL, amqp:// or amqps://");
  auto* o_tz       = app.add_option("--timezone", timezone, "IANA zone for local timestamps");
  auto* o_loc      = app.add_option("--locations", locations_file, "County names JSON");
  auto* o_log      = app.add_option("--log-file", log_file, "Rotating log file");
  auto* o_source   = app.add_option("--source-name", source_name, "Source label in broker payloads");
  auto* o_debug    = app.add_flag("-d,--debug", debug, "Debug logging");
  app.add_flag("--version", version, "Print version and exit");

  CLI11_PARSE(app, argc, argv);

  if (version) {
    std::printf("%s %s\n", APP_NAME, APP_VERSION);
    return 0;
  }

  init_logging(false);

  // ---- layer: defaults < config < secrets < command line ----
  Config cfg;
  std::vector<std::string> errors;
  if (!config_path.empty())  merge_file(cfg, config_path, errors);
  if (!secrets_path.empty()) merge_file(cfg, secrets_path, errors);

  json cli = json::object();
  if (o_port->count())    cli["serial_port"] = serial_port;
  if (o_baud->count())    cli["baud"] = baud;
  if (o_webhook->count()) cli["webhooks"] = webhooks;
  if (o_discord->count()) cli["discord_webhooks"] = discord;
  if (o_groupme->count()) cli["groupme_bot_ids"] = groupme;
  if (o_amqp->count())    cli["amqp_url"] = amqp_url;
  if (o_tz->count())      cli["timezone"] = timezone;
  if (o_loc->count())     cli["locations_file"] = locations_file;
  if (o_log->count())     cli["log_file"] = log_file;
  if (o_source->count())  cli["source_name"] = source_name;
  if (o_debug->count())   cli["debug"] = debug;
  merge_json(cfg, cli, errors);

  init_logging(cfg.debug, cfg.log_file);

  if (errors.empty()) errors = validate(cfg);
  if (!errors.empty()) {
    for (const auto& e : errors) spdlog::critical("[config] {}: {}", to_string(FaultKind::Config), e);
    return 2;
  }

  spdlog::info("{} {} starting", APP_NAME, APP_VERSION);
  spdlog::debug("[config] {}", to_wire(redacted(cfg)));

  install_signal_handlers();

  try {
    const int rc = run(cfg);
    spdlog::info("{} stopped", APP_NAME);
    spdlog::shutdown();
    return rc;
  } catch (const std::exception& e) {
    spdlog::critical("unexpected failure: {}", e.what());
    spdlog::shutdown();
    return 1;
  }
}

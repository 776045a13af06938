// -----------------------------------------------------------------------------
// config.cpp: layering and validation for config.hpp
// -----------------------------------------------------------------------------
#include "endec/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iterator>

#include <sys/stat.h>

#include <spdlog/spdlog.h>

#include "endec/location_directory.hpp"
#include "endec/sinks.hpp"
#include "endec/time_zone.hpp"

namespace endec {

namespace {

using json = nlohmann::json;

bool read_value(const json& v, std::string& out) {
  if (!v.is_string()) return false;
  out = v.get<std::string>();
  return true;
}

bool read_value(const json& v, int& out) {
  if (!v.is_number_integer()) return false;
  out = v.get<int>();
  return true;
}

bool read_value(const json& v, bool& out) {
  if (!v.is_boolean()) return false;
  out = v.get<bool>();
  return true;
}

// A single string is accepted as a one-element list.
bool read_value(const json& v, std::vector<std::string>& out) {
  if (v.is_string()) {
    out.assign(1, v.get<std::string>());
    return true;
  }
  if (!v.is_array()) return false;
  std::vector<std::string> tmp;
  for (const auto& e : v) {
    if (!e.is_string()) return false;
    tmp.push_back(e.get<std::string>());
  }
  out = std::move(tmp);
  return true;
}

const char* type_name(const std::string&)              { return "a string"; }
const char* type_name(int)                             { return "an integer"; }
const char* type_name(bool)                            { return "a boolean"; }
const char* type_name(const std::vector<std::string>&) { return "a list of strings"; }

std::string mask_url(const std::string& url) {
  return url.empty() ? url : redact_url(url) + "/***";
}

} // namespace

bool merge_json(Config& cfg, const json& doc, std::vector<std::string>& errors) {
  if (!doc.is_object()) {
    errors.push_back("configuration must be a JSON object");
    return false;
  }

  bool ok = true;
  auto take = [&](const char* key, auto& field) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return;
    if (!read_value(*it, field)) {
      errors.push_back(std::string("'") + key + "' must be " + type_name(field));
      ok = false;
    }
  };

  take("serial_port",        cfg.serial_port);
  take("baud",               cfg.baud);
  take("read_timeout_ms",    cfg.read_timeout_ms);
  take("reconnect_delay_s",  cfg.reconnect_delay_s);
  take("webhooks",           cfg.webhooks);
  take("discord_webhooks",   cfg.discord_webhooks);
  take("groupme_bot_ids",    cfg.groupme_bot_ids);
  take("amqp_url",           cfg.amqp_url);
  take("alert_exchange",     cfg.alert_exchange);
  take("alert_routing_key",  cfg.alert_routing_key);
  take("health_exchange",    cfg.health_exchange);
  take("health_routing_key", cfg.health_routing_key);
  take("timezone",           cfg.timezone);
  take("locations_file",     cfg.locations_file);
  take("source_name",        cfg.source_name);
  take("log_file",           cfg.log_file);
  take("debug",              cfg.debug);

  static const char* const KNOWN[] = {
    "serial_port", "baud", "read_timeout_ms", "reconnect_delay_s", "webhooks",
    "discord_webhooks", "groupme_bot_ids", "amqp_url", "alert_exchange",
    "alert_routing_key", "health_exchange", "health_routing_key", "timezone",
    "locations_file", "source_name", "log_file", "debug",
  };
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    bool known = false;
    for (const char* k : KNOWN) known = known || it.key() == k;
    if (!known) spdlog::warn("[config] ignoring unknown key '{}'", it.key());
  }
  return ok;
}

bool merge_file(Config& cfg, const std::string& path, std::vector<std::string>& errors) {
  std::ifstream in(path);
  if (!in) {
    errors.push_back("cannot open " + path);
    return false;
  }
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    errors.push_back(path + ": not valid JSON");
    return false;
  }
  std::vector<std::string> local;
  const bool ok = merge_json(cfg, doc, local);
  for (auto& e : local) errors.push_back(path + ": " + e);
  return ok;
}

bool url_has_scheme(const std::string& url, std::initializer_list<const char*> allowed) {
  const auto sep = url.find("://");
  if (sep == std::string::npos || sep + 3 >= url.size()) return false;
  const std::string scheme = url.substr(0, sep);
  for (const char* s : allowed) {
    if (scheme == s) return true;
  }
  return false;
}

bool check_serial_device(const std::string& path, std::string& err) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    err = path + ": " + std::strerror(errno);
    return false;
  }
  if (!S_ISCHR(st.st_mode)) {
    err = path + ": not a character device";
    return false;
  }
  return true;
}

bool is_supported_baud(int baud) {
  static constexpr int RATES[] = {1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200, 230400};
  return std::find(std::begin(RATES), std::end(RATES), baud) != std::end(RATES);
}

std::vector<std::string> validate(const Config& cfg) {
  std::vector<std::string> errors;

  if (!cfg.has_destination()) {
    errors.push_back("no destination configured (webhooks, discord_webhooks, groupme_bot_ids or amqp_url)");
  }

  std::string err;
  if (!check_serial_device(cfg.serial_port, err)) errors.push_back("serial_port " + err);

  if (!is_supported_baud(cfg.baud)) errors.push_back("unsupported baud " + std::to_string(cfg.baud));
  if (cfg.read_timeout_ms <= 0) errors.push_back("read_timeout_ms must be positive");
  if (cfg.reconnect_delay_s < 0) errors.push_back("reconnect_delay_s must not be negative");

  for (const auto& u : cfg.webhooks) {
    if (!url_has_scheme(u, {"http", "https"})) errors.push_back("webhook URL must be http(s): " + mask_url(u));
  }
  for (const auto& u : cfg.discord_webhooks) {
    if (!url_has_scheme(u, {"http", "https"})) errors.push_back("discord URL must be http(s): " + mask_url(u));
  }
  for (const auto& id : cfg.groupme_bot_ids) {
    if (id.empty()) errors.push_back("groupme bot id must not be empty");
  }
  if (cfg.has_broker()) {
    if (!url_has_scheme(cfg.amqp_url, {"amqp", "amqps"})) errors.push_back("amqp_url must be amqp(s)");
    if (cfg.alert_exchange.empty() || cfg.health_exchange.empty()) errors.push_back("exchange names must not be empty");
  }

  if (!TimeZone::load(cfg.timezone)) errors.push_back("unknown timezone '" + cfg.timezone + "'");

  if (!cfg.locations_file.empty()) {
    if (!LocationDirectory::load_file(cfg.locations_file, err)) {
      errors.push_back("locations_file " + cfg.locations_file + ": " + err);
    }
  }
  return errors;
}

json redacted(const Config& cfg) {
  json hooks = json::array(), discord = json::array();
  for (const auto& u : cfg.webhooks) hooks.push_back(mask_url(u));
  for (const auto& u : cfg.discord_webhooks) discord.push_back(mask_url(u));

  return json{
    {"serial_port",        cfg.serial_port},
    {"baud",               cfg.baud},
    {"read_timeout_ms",    cfg.read_timeout_ms},
    {"reconnect_delay_s",  cfg.reconnect_delay_s},
    {"webhooks",           hooks},
    {"discord_webhooks",   discord},
    {"groupme_bot_ids",    cfg.groupme_bot_ids.size()},
    {"amqp_url",           mask_url(cfg.amqp_url)},
    {"alert_exchange",     cfg.alert_exchange},
    {"alert_routing_key",  cfg.alert_routing_key},
    {"health_exchange",    cfg.health_exchange},
    {"health_routing_key", cfg.health_routing_key},
    {"timezone",           cfg.timezone},
    {"locations_file",     cfg.locations_file},
    {"source_name",        cfg.source_name},
    {"log_file",           cfg.log_file},
    {"debug",              cfg.debug},
  };
}

} // namespace endec

/**
 * @file config.hpp
 * @brief Runtime configuration: JSON file + secrets file + command line.
 *
 * @details
 * Layers, later wins:
 *   1. built-in defaults (the member initializers below),
 *   2. `--config` JSON file,
 *   3. `--secrets` JSON file (same keys; URLs carrying tokens live here),
 *   4. command-line options, handed in as one more JSON object.
 *
 * Every layer goes through merge_json(), so a key means the same thing
 * wherever it comes from. Type errors are collected, not thrown.
 *
 * validate() runs once before the pipeline starts. It returns every
 * problem it finds; a non-empty list is a FaultKind::Config exit.
 */
#ifndef ENDEC_CONFIG_HPP
#define ENDEC_CONFIG_HPP

#include <initializer_list>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace endec {

struct Config {
  // serial
  std::string serial_port = "/dev/ttyUSB0";
  int baud = 9600;
  int read_timeout_ms = 5000;
  int reconnect_delay_s = 5;

  // destinations
  std::vector<std::string> webhooks;
  std::vector<std::string> discord_webhooks;
  std::vector<std::string> groupme_bot_ids;
  std::string amqp_url;

  // broker topology
  std::string alert_exchange = "endec";
  std::string alert_routing_key = "notification.endec";
  std::string health_exchange = "healthcheck";
  std::string health_routing_key = "health.endec";

  // presentation
  std::string timezone = "America/New_York";
  std::string locations_file;
  std::string source_name = "endec";

  // logging
  std::string log_file;
  bool debug = false;

  bool has_broker() const { return !amqp_url.empty(); }
  bool has_destination() const {
    return !webhooks.empty() || !discord_webhooks.empty() ||
           !groupme_bot_ids.empty() || has_broker();
  }
};

/**
 * @brief Overlay the keys present in @p doc onto @p cfg.
 * @param errors Appended with one line per bad key.
 * @return false if any key had the wrong type (other keys still applied).
 */
bool merge_json(Config& cfg, const nlohmann::json& doc, std::vector<std::string>& errors);

/// Read @p path as JSON and merge_json() it.
bool merge_file(Config& cfg, const std::string& path, std::vector<std::string>& errors);

/// All startup checks. Empty result means the pipeline may start.
std::vector<std::string> validate(const Config& cfg);

/// "scheme://host..." with scheme in @p allowed and a non-empty host.
bool url_has_scheme(const std::string& url, std::initializer_list<const char*> allowed);

/// Rates SerialPort can program (see baud_to_speed() in serial_io.hpp).
bool is_supported_baud(int baud);

/// Path exists and is a character device.
bool check_serial_device(const std::string& path, std::string& err);

/// Config as JSON with URLs and bot ids masked, for the startup log.
nlohmann::json redacted(const Config& cfg);

} // namespace endec

#endif // ENDEC_CONFIG_HPP

// -----------------------------------------------------------------------------
// logging.cpp: spdlog sinks for logging.hpp
// -----------------------------------------------------------------------------
#include "endec/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace endec {

bool init_logging(bool debug, const std::string& log_file, bool to_stderr) {
  std::vector<spdlog::sink_ptr> sinks;
  if (to_stderr) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  else           sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string file_error;
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, LOG_FILE_BYTES, LOG_FILE_COUNT));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("endec", sinks.begin(), sinks.end());
  logger->set_pattern(LOG_PATTERN);
  logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  if (!file_error.empty()) {
    spdlog::error("[log] cannot open {}: {}", log_file, file_error);
    return false;
  }
  return true;
}

} // namespace endec

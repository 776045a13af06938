/**
 * @file logging.hpp
 * @brief spdlog default-logger setup for endec executables.
 *
 * One colored console sink (stdout, or stderr when @p to_stderr is set so
 * stdout stays machine-readable), plus a rotating file sink when @p log_file is
 * non-empty (5 MiB per file, 3 files kept). Level is info, or debug when
 * @p debug is set. Safe to call more than once; the last call wins.
 *
 * @return false if the file sink could not be created (stdout logging is
 *         still installed and the reason is logged).
 */
#ifndef ENDEC_LOGGING_HPP
#define ENDEC_LOGGING_HPP

#include <string>

namespace endec {

static constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";
static constexpr size_t LOG_FILE_BYTES = 5 * 1024 * 1024;
static constexpr size_t LOG_FILE_COUNT = 3;

bool init_logging(bool debug, const std::string& log_file = {}, bool to_stderr = false);

} // namespace endec

#endif // ENDEC_LOGGING_HPP

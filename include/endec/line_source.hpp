/**
 * @file line_source.hpp
 * @brief Minimal line-oriented input interface the relay reads alerts from.
 *
 * Contract:
 *  - open() acquires the device; false means "try again later".
 *  - read_line() waits at most timeout_ms for one complete line. Line
 *    terminators and surrounding whitespace are already stripped.
 *  - close() is idempotent.
 *  - name() is a short identifier for logs (usually the device path).
 */
#ifndef ENDEC_LINE_SOURCE_HPP
#define ENDEC_LINE_SOURCE_HPP

#include <stdint.h>
#include <string>

namespace endec {

enum class ReadStatus : uint8_t { Line = 0, Timeout = 1, Error = 2 };

class ILineSource {
public:
  virtual ~ILineSource() = default;
  virtual bool        open() = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual ReadStatus  read_line(std::string& out, int timeout_ms) = 0;
  virtual const std::string& name() const = 0;
};

} // namespace endec

#endif // ENDEC_LINE_SOURCE_HPP

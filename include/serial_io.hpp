/**
 * @file serial_io.hpp
 * @brief Linux TTY line source: raw 8N1 termios, poll-based reads, one line at a time.
 *
 * @details
 * PURPOSE
 * -------
 * The alerting appliance prints alerts as plain text lines over RS-232.
 * SerialPort turns that device into an endec::ILineSource so the relay can
 * read it line by line with a timeout, and reopen it after a failure.
 *
 * BEHAVIOR
 * --------
 * - open(): O_RDWR | O_NOCTTY | O_NONBLOCK, raw 8N1, no flow control, the
 *   configured baud. Pending input is kept: the assembler discards noise.
 * - read_line(): poll() until one '\n'-terminated line arrives or the
 *   timeout expires. CR, LF and surrounding whitespace are stripped; other
 *   bytes pass through untouched.
 *     - Line:    @p out holds the line (possibly empty).
 *     - Timeout: no complete line within the timeout, or a signal arrived.
 *                Bytes of an unfinished line are kept for the next call.
 *     - Error:   poll/read failure, hang-up, or EOF (device unplugged).
 * - A line longer than LINE_CAP bytes is returned in LINE_CAP pieces, so a
 *   missing newline cannot grow memory.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; they survive re-enumeration.
 * - The runtime user needs the dialout group (or an equivalent udev rule).
 * - Not thread-safe. One reader per port.
 */
#pragma once
#include <string>

#include "etl/string.h"

#include "endec/line_source.hpp"

namespace endec {

class SerialPort : public ILineSource {
public:
    static constexpr size_t LINE_CAP = 1024;

    SerialPort(std::string dev, int baud);
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool open() override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }
    ReadStatus read_line(std::string& out, int timeout_ms) override;
    const std::string& name() const override { return dev_; }

private:
    void take_line(std::string& out);

    std::string dev_;
    int baud_;
    int fd_ = -1;
    etl::string<LINE_CAP> line_;
};

/// Map a numeric baud to its termios constant; false if unsupported.
bool baud_to_speed(int baud, unsigned& speed);

} // namespace endec

// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// For behavior see the matching .hpp.
// ============================================================================

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags
#include <unistd.h>        // ::read, ::close
#include <termios.h>       // termios raw mode
#include <poll.h>          // poll(2) for timeout-based reads
#include <cerrno>
#include <chrono>
#include <cstring>         // strerror

#include <spdlog/spdlog.h>

#include "endec/text_util.hpp"

namespace endec {

// ---------------------------------------------------------------------------
// set_raw()
// Raw 8N1, receiver on, modem lines and flow control off. VMIN/VTIME zero:
// poll() does the waiting.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CRTSCTS | CSTOPB | PARENB);
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    return tcsetattr(fd, TCSANOW, &tio) == 0;
}

bool baud_to_speed(int baud, unsigned& speed) {
    switch (baud) {
        case 1200:   speed = B1200;   return true;
        case 2400:   speed = B2400;   return true;
        case 4800:   speed = B4800;   return true;
        case 9600:   speed = B9600;   return true;
        case 19200:  speed = B19200;  return true;
        case 38400:  speed = B38400;  return true;
        case 57600:  speed = B57600;  return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default:     return false;
    }
}

SerialPort::SerialPort(std::string dev, int baud)
    : dev_(std::move(dev)), baud_(baud) {}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::open() {
    close();

    unsigned speed = 0;
    if (!baud_to_speed(baud_, speed)) {
        spdlog::error("[serial] {}: unsupported baud {}", dev_, baud_);
        return false;
    }

    int fd = ::open(dev_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        spdlog::error("[serial] {}: open: {}", dev_, std::strerror(errno));
        return false;
    }
    if (!set_raw(fd, static_cast<speed_t>(speed))) {
        spdlog::error("[serial] {}: termios: {}", dev_, std::strerror(errno));
        ::close(fd);
        return false;
    }

    fd_ = fd;
    line_.clear();
    return true;
}

void SerialPort::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

void SerialPort::take_line(std::string& out) {
    out.assign(trim(std::string_view(line_.data(), line_.size())));
    line_.clear();
}

// ---------------------------------------------------------------------------
// read_line()
// Byte at a time: at 9600 baud throughput is not a concern and no bytes
// past the newline are ever consumed.
// ---------------------------------------------------------------------------
ReadStatus SerialPort::read_line(std::string& out, int timeout_ms) {
    if (fd_ < 0) return ReadStatus::Error;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{fd_, POLLIN, 0};

    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (left <= 0) return ReadStatus::Timeout;

        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) return ReadStatus::Timeout;
        if (pr < 0) {
            if (errno == EINTR) return ReadStatus::Timeout;    // let the caller see shutdown
            spdlog::error("[serial] {}: poll: {}", dev_, std::strerror(errno));
            return ReadStatus::Error;
        }
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            spdlog::error("[serial] {}: device error", dev_);
            return ReadStatus::Error;
        }

        char byte = 0;
        ssize_t n = ::read(fd_, &byte, 1);
        if (n == 0 || (pfd.revents & POLLHUP && n <= 0)) {
            spdlog::error("[serial] {}: hang-up", dev_);
            return ReadStatus::Error;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            spdlog::error("[serial] {}: read: {}", dev_, std::strerror(errno));
            return ReadStatus::Error;
        }

        if (byte == '\n') {
            take_line(out);
            return ReadStatus::Line;
        }
        line_.push_back(byte);
        if (line_.full()) {
            take_line(out);
            return ReadStatus::Line;
        }
    }
}

} // namespace endec

#include "io/line_channel.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace evsim {

bool LineChannel::read_line(std::string& line) {
    while (!take_line(line)) {
        if (eof_ || !fill()) {
            // Last line without a trailing newline
            if (buffer_.empty()) return false;
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }
    }
    return true;
}

bool LineChannel::poll_line(std::string& line, int timeout_ms) {
    if (take_line(line)) return true;
    if (eof_) return false;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return false;
        throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
    }
    if (ret == 0) return false;

    if (pfd.revents & (POLLIN | POLLHUP)) {
        fill();
        return take_line(line);
    }
    return false;
}

bool LineChannel::take_line(std::string& line) {
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) return false;

    line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool LineChannel::fill() {
    char chunk[4096];
    for (;;) {
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            return true;
        }
        if (n == 0) {
            eof_ = true;
            return false;
        }
        if (errno != EINTR) {
            throw std::runtime_error(std::string("read failed: ") + std::strerror(errno));
        }
    }
}

} // namespace evsim

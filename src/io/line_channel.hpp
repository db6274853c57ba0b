#ifndef EVSIM_IO_LINE_CHANNEL_HPP
#define EVSIM_IO_LINE_CHANNEL_HPP

#include <string>

namespace evsim {

/**
 * Newline-delimited message reader over a file descriptor (stdin in
 * worker mode). Reads straight from the descriptor so that poll() sees
 * exactly what has not been consumed yet; complete lines are handed out
 * one at a time, partial lines stay buffered.
 */
class LineChannel {
public:
    explicit LineChannel(int fd = 0) : fd_(fd) {}

    // Owns a buffer tied to the descriptor position (no copy)
    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    /// Block until a full line is available. Returns false at end of input.
    bool read_line(std::string& line);

    /**
     * Return a buffered line, or wait up to timeout_ms for one.
     * Returns false when no complete line arrived in time.
     */
    bool poll_line(std::string& line, int timeout_ms);

    bool eof() const { return eof_ && buffer_.empty(); }

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;

    bool take_line(std::string& line);

    /// One read() into the buffer; false on end of input.
    bool fill();
};

} // namespace evsim

#endif // EVSIM_IO_LINE_CHANNEL_HPP

/**
 * Job-level error kinds.
 *
 * All derive from std::runtime_error so callers that only care about the
 * message can catch the base class. Cancellation is not an error and has
 * no exception type.
 */

#ifndef EVSIM_CORE_ERRORS_HPP
#define EVSIM_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evsim {

/// Missing or invalid request / grid configuration, unknown species.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Failure raised by the damage calculator or stat resolution.
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Wall-clock deadline exceeded during grid evaluation.
class TimeoutError : public std::runtime_error {
public:
    TimeoutError(const std::string& msg, int processed, int total)
        : std::runtime_error(msg), processed_(processed), total_(total) {}

    int processed() const { return processed_; }
    int total() const { return total_; }

private:
    int processed_;
    int total_;
};

} // namespace evsim

#endif // EVSIM_CORE_ERRORS_HPP

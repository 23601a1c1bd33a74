#pragma once

#include <stdexcept>
#include <string>

namespace intraday {

/**
 * Broker call failed in a way that may succeed when retried
 * (timeout, throttling, 5xx).
 */
class TransientApiFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A transient failure whose retry budget has been spent.
 */
class RetryExhausted : public TransientApiFailure {
public:
    RetryExhausted(const std::string& operation, int attempts, const std::string& last_error)
        : TransientApiFailure(operation + " failed after " + std::to_string(attempts) +
                              " attempts: " + last_error),
          operation_(operation), attempts_(attempts) {}

    const std::string& operation() const { return operation_; }
    int attempts() const { return attempts_; }

private:
    std::string operation_;
    int attempts_;
};

/**
 * Broker refused the request; retrying cannot help.
 */
class PermanentRejection : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Ledger invariant would be violated. Fatal for the session.
 */
class StateCorruptionRisk : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Invalid configuration detected at startup.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Another engine already holds the account lock.
 */
class InstanceConflict : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace intraday

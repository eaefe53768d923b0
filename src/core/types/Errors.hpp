/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by discovery and polling.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fleetwatch::core {

/**
 * @brief Invalid input that prevents an operation from starting.
 *
 * Raised for unusable subnet or port lists, unknown device kinds and
 * missing write credentials. Never retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Subnet expansion would exceed the configured host cap.
 */
class SubnetLimitExceeded : public ConfigurationError {
public:
    SubnetLimitExceeded(size_t hostCount, size_t limit)
        : ConfigurationError("Too many hosts to scan (" + std::to_string(hostCount) +
                             "). Limit is " + std::to_string(limit) +
                             "; split subnet ranges."),
          hostCount_(hostCount), limit_(limit) {}

    size_t hostCount() const { return hostCount_; }
    size_t limit() const { return limit_; }

private:
    size_t hostCount_;
    size_t limit_;
};

/**
 * @brief A discovery scan of the same kind is already running.
 */
class LockConflict : public std::runtime_error {
public:
    explicit LockConflict(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Failure while probing a single target (timeout, refusal, protocol error).
 */
class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The TTL key-value store could not be read or written.
 */
class StateStoreError : public std::runtime_error {
public:
    explicit StateStoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace fleetwatch::core

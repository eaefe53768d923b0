/**
 * @file IShellTransport.hpp
 * @brief Interactive remote shell channel and its connector.
 */

#pragma once

#include "core/types/PollTypes.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Authentication methods an SSH server may advertise.
 */
enum class ShellAuthMethod {
    Password,
    KeyboardInteractive
};

/**
 * @brief An open interactive shell with a pseudo terminal.
 */
class IShellChannel {
public:
    virtual ~IShellChannel() = default;

    /**
     * @brief Writes raw bytes to the shell.
     * @throws ProbeError if the channel is closed or the write fails.
     */
    virtual void write(const std::string& data) = 0;

    /**
     * @brief Returns whatever arrived within @p wait; empty if nothing did.
     * @throws ProbeError if the channel failed.
     */
    virtual std::string readAvailable(std::chrono::milliseconds wait) = 0;

    virtual bool isOpen() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens authenticated shell channels to a device.
 */
class IShellConnector {
public:
    virtual ~IShellConnector() = default;

    /**
     * @brief Asks the server which methods it accepts for @p username.
     *
     * An empty result means the server did not say; callers then try all methods.
     */
    virtual std::vector<ShellAuthMethod> queryAuthMethods(const std::string& address,
                                                          const ShellCredentials& creds) = 0;

    /**
     * @brief Connects, authenticates with @p method and opens a PTY shell.
     * @throws ProbeError on connection, authentication or channel failure.
     */
    virtual std::unique_ptr<IShellChannel> open(const std::string& address,
                                                const ShellCredentials& creds,
                                                ShellAuthMethod method) = 0;
};

inline std::string shellAuthMethodToString(ShellAuthMethod method) {
    switch (method) {
        case ShellAuthMethod::Password: return "password";
        case ShellAuthMethod::KeyboardInteractive: return "keyboard-interactive";
    }
    return "unknown";
}

} // namespace fleetwatch::core

#pragma once

#include "core/services/IShellTransport.hpp"
#include "core/types/CiscoOutput.hpp"
#include "infrastructure/shell/ShellSession.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Cisco IOS operations over an interactive shell.
 *
 * Each call opens its own session and closes it before returning.
 */
class CiscoShellClient {
public:
    explicit CiscoShellClient(std::shared_ptr<core::IShellConnector> connector,
                              ShellSession::Timing timing = ShellSession::Timing{},
                              std::chrono::milliseconds poeCycleDelay = std::chrono::seconds(3));

    /**
     * @brief Runs `show version`.
     * @throws core::ProbeError if the session cannot be opened.
     */
    core::cisco::VersionInfo showVersion(const std::string& address,
                                         const core::ShellCredentials& credentials);

    /**
     * @brief Port rows from `show interfaces status`.
     */
    std::vector<core::PortState> interfacesStatus(const std::string& address,
                                                  const core::ShellCredentials& credentials);

    /**
     * @brief Access points seen over CDP, enriched with MAC, PoE and IP for @p vlan.
     */
    std::vector<core::AccessPointInfo> accessPoints(const std::string& address,
                                                    const core::ShellCredentials& credentials,
                                                    int vlan);

    /**
     * @brief Runs @p commands inside `configure terminal` ... `end`.
     */
    void configure(const std::string& address, const core::ShellCredentials& credentials,
                   const std::vector<std::string>& commands);

    /**
     * @brief Translates a port change into interface configuration and applies it.
     *
     * A PoE cycle powers the port off, waits, then re-enables automatic power.
     */
    void applyPortChange(const std::string& address, const core::ShellCredentials& credentials,
                         const core::PortConfigChange& change);

    /**
     * @brief Interface configuration lines for one change, without the mode commands.
     */
    static std::vector<std::string> interfaceCommands(const core::PortConfigChange& change);

private:
    std::unique_ptr<ShellSession> openSession(const std::string& address,
                                              const core::ShellCredentials& credentials);

    std::shared_ptr<core::IShellConnector> connector_;
    ShellSession::Timing timing_;
    std::chrono::milliseconds poeCycleDelay_;
};

} // namespace fleetwatch::infra

#pragma once

#include "core/services/IShellTransport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief Prompt-driven command session on a network device shell.
 *
 * connect() negotiates authentication (password first, then
 * keyboard-interactive, limited to what the server advertises), waits for
 * the first prompt, enters privileged mode and disables paging. Output is
 * collected until it ends in a prompt character ('#' or '>') or the command
 * timeout passes. One session serves one device and is not thread-safe.
 */
class ShellSession {
public:
    struct Timing {
        std::chrono::milliseconds commandTimeout{30000};
        std::chrono::milliseconds pollInterval{500};
    };

    ShellSession(std::shared_ptr<core::IShellConnector> connector, std::string address,
                 core::ShellCredentials credentials, Timing timing);
    ~ShellSession();

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    /**
     * @throws core::ProbeError if no authentication method yields a usable shell.
     */
    void connect();

    /**
     * @brief Sends one command line and returns everything up to the next prompt.
     * @throws core::ProbeError if the session is not connected or the channel fails.
     */
    std::string execute(const std::string& command);

    void close();
    bool isConnected() const;

    /**
     * @brief Whether @p output ends in a prompt, ignoring trailing whitespace.
     */
    static bool endsWithPrompt(const std::string& output);

private:
    void send(const std::string& line);
    std::string readUntilPrompt();
    void enterPrivilegedMode();

    std::shared_ptr<core::IShellConnector> connector_;
    std::string address_;
    core::ShellCredentials credentials_;
    Timing timing_;
    std::unique_ptr<core::IShellChannel> channel_;
};

} // namespace fleetwatch::infra

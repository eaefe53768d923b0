#include "infrastructure/shell/ShellSession.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fleetwatch::infra {

ShellSession::ShellSession(std::shared_ptr<core::IShellConnector> connector, std::string address,
                           core::ShellCredentials credentials, Timing timing)
    : connector_(std::move(connector)),
      address_(std::move(address)),
      credentials_(std::move(credentials)),
      timing_(timing) {}

ShellSession::~ShellSession() {
    close();
}

void ShellSession::connect() {
    std::vector<core::ShellAuthMethod> advertised;
    try {
        advertised = connector_->queryAuthMethods(address_, credentials_);
    } catch (const core::ProbeError& e) {
        spdlog::debug("Shell auth query to {} failed: {}", address_, e.what());
    }

    std::vector<core::ShellAuthMethod> order;
    for (auto method : {core::ShellAuthMethod::Password, core::ShellAuthMethod::KeyboardInteractive}) {
        if (advertised.empty() ||
            std::find(advertised.begin(), advertised.end(), method) != advertised.end()) {
            order.push_back(method);
        }
    }

    for (auto method : order) {
        const auto name = core::shellAuthMethodToString(method);
        spdlog::debug("Shell to {}: trying {} auth", address_, name);
        try {
            channel_ = connector_->open(address_, credentials_, method);
            readUntilPrompt();
            enterPrivilegedMode();
            send("terminal length 0");
            readUntilPrompt();
            spdlog::debug("Shell to {}: {} auth succeeded", address_, name);
            return;
        } catch (const core::ProbeError& e) {
            spdlog::warn("Shell to {}: {} auth failed: {}", address_, name, e.what());
            close();
        }
    }

    throw core::ProbeError("Shell connection to " + address_ + " failed");
}

void ShellSession::enterPrivilegedMode() {
    send("enable");
    auto reply = readUntilPrompt();
    if (reply.find("assword") != std::string::npos) {
        send(credentials_.effectiveEnableSecret());
        readUntilPrompt();
    }
}

std::string ShellSession::execute(const std::string& command) {
    if (!isConnected()) {
        throw core::ProbeError("Shell session to " + address_ + " is not connected");
    }
    send(command);
    return readUntilPrompt();
}

void ShellSession::send(const std::string& line) {
    if (!channel_) {
        throw core::ProbeError("Shell session to " + address_ + " is not connected");
    }
    channel_->write(line + "\n");
}

std::string ShellSession::readUntilPrompt() {
    std::string output;
    const auto deadline = std::chrono::steady_clock::now() + timing_.commandTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
        output += channel_->readAvailable(timing_.pollInterval);
        if (endsWithPrompt(output)) {
            break;
        }
        if (!channel_->isOpen()) {
            spdlog::debug("Shell channel to {} closed while waiting for a prompt", address_);
            break;
        }
    }
    return output;
}

bool ShellSession::endsWithPrompt(const std::string& output) {
    auto end = output.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) {
        return false;
    }
    return output[end] == '#' || output[end] == '>';
}

void ShellSession::close() {
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

bool ShellSession::isConnected() const {
    return channel_ && channel_->isOpen();
}

} // namespace fleetwatch::infra

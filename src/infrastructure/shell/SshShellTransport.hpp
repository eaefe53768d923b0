#pragma once

#include "core/services/IShellTransport.hpp"

#include <chrono>

namespace fleetwatch::infra {

/**
 * @brief IShellConnector over libssh.
 *
 * Host keys are accepted without verification; devices are identified by
 * address and credentials only. Every connect, banner and authentication
 * step is bounded by the connect timeout.
 */
class SshShellTransport : public core::IShellConnector {
public:
    explicit SshShellTransport(std::chrono::seconds connectTimeout = std::chrono::seconds(15));

    std::vector<core::ShellAuthMethod> queryAuthMethods(const std::string& address,
                                                        const core::ShellCredentials& creds) override;

    std::unique_ptr<core::IShellChannel> open(const std::string& address,
                                              const core::ShellCredentials& creds,
                                              core::ShellAuthMethod method) override;

private:
    std::chrono::seconds connectTimeout_;
};

} // namespace fleetwatch::infra

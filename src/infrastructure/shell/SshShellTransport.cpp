#include "infrastructure/shell/SshShellTransport.hpp"

#include "core/types/Errors.hpp"

#include <libssh/libssh.h>
#include <spdlog/spdlog.h>

#include <array>

namespace fleetwatch::infra {

namespace {

constexpr size_t READ_CHUNK = 65535;

/**
 * @brief Owns a connected ssh_session; disconnects and frees it on destruction.
 */
class SshConnection {
public:
    SshConnection(const std::string& address, const core::ShellCredentials& creds,
                  std::chrono::seconds timeout)
        : address_(address) {
        session_ = ssh_new();
        if (!session_) {
            throw core::ProbeError("Cannot allocate SSH session");
        }

        long timeoutSeconds = static_cast<long>(timeout.count());
        int port = creds.port;
        ssh_options_set(session_, SSH_OPTIONS_HOST, address.c_str());
        ssh_options_set(session_, SSH_OPTIONS_PORT, &port);
        ssh_options_set(session_, SSH_OPTIONS_USER, creds.username.c_str());
        ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeoutSeconds);

        if (ssh_connect(session_) != SSH_OK) {
            std::string error = ssh_get_error(session_);
            ssh_free(session_);
            session_ = nullptr;
            throw core::ProbeError("SSH connect to " + address + " failed: " + error);
        }
    }

    ~SshConnection() {
        if (session_) {
            ssh_disconnect(session_);
            ssh_free(session_);
        }
    }

    SshConnection(const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    ssh_session get() const { return session_; }
    const std::string& address() const { return address_; }

    std::string lastError() const { return ssh_get_error(session_); }

private:
    std::string address_;
    ssh_session session_{nullptr};
};

class SshChannel : public core::IShellChannel {
public:
    SshChannel(std::unique_ptr<SshConnection> connection, ssh_channel channel)
        : connection_(std::move(connection)), channel_(channel) {}

    ~SshChannel() override { close(); }

    void write(const std::string& data) override {
        if (!isOpen()) {
            throw core::ProbeError("SSH channel to " + connection_->address() + " is closed");
        }
        int written = ssh_channel_write(channel_, data.data(), static_cast<uint32_t>(data.size()));
        if (written == SSH_ERROR) {
            throw core::ProbeError("SSH write failed: " + connection_->lastError());
        }
    }

    std::string readAvailable(std::chrono::milliseconds wait) override {
        if (!channel_) {
            throw core::ProbeError("SSH channel to " + connection_->address() + " is closed");
        }
        std::string output;
        std::array<char, READ_CHUNK> buffer{};

        int n = ssh_channel_read_timeout(channel_, buffer.data(), buffer.size(), 0,
                                         static_cast<int>(wait.count()));
        while (n > 0) {
            output.append(buffer.data(), static_cast<size_t>(n));
            if (ssh_channel_poll(channel_, 0) <= 0) {
                break;
            }
            n = ssh_channel_read_nonblocking(channel_, buffer.data(), buffer.size(), 0);
        }
        if (n == SSH_ERROR) {
            throw core::ProbeError("SSH read failed: " + connection_->lastError());
        }
        return output;
    }

    bool isOpen() const override {
        return channel_ && ssh_channel_is_open(channel_) && !ssh_channel_is_eof(channel_);
    }

    void close() override {
        if (!channel_) {
            return;
        }
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_send_eof(channel_);
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
        channel_ = nullptr;
        connection_.reset();
    }

private:
    std::unique_ptr<SshConnection> connection_;
    ssh_channel channel_{nullptr};
};

bool authenticatePassword(SshConnection& connection, const core::ShellCredentials& creds) {
    return ssh_userauth_password(connection.get(), nullptr, creds.password.c_str()) ==
           SSH_AUTH_SUCCESS;
}

bool authenticateKeyboardInteractive(SshConnection& connection,
                                     const core::ShellCredentials& creds) {
    int rc = ssh_userauth_kbdint(connection.get(), nullptr, nullptr);
    while (rc == SSH_AUTH_INFO) {
        int prompts = ssh_userauth_kbdint_getnprompts(connection.get());
        spdlog::debug("Keyboard-interactive prompts from {}: {}", connection.address(), prompts);
        for (int i = 0; i < prompts; ++i) {
            if (ssh_userauth_kbdint_setanswer(connection.get(), static_cast<unsigned>(i),
                                              creds.password.c_str()) < 0) {
                return false;
            }
        }
        rc = ssh_userauth_kbdint(connection.get(), nullptr, nullptr);
    }
    return rc == SSH_AUTH_SUCCESS;
}

} // namespace

SshShellTransport::SshShellTransport(std::chrono::seconds connectTimeout)
    : connectTimeout_(connectTimeout) {}

std::vector<core::ShellAuthMethod> SshShellTransport::queryAuthMethods(
    const std::string& address, const core::ShellCredentials& creds) {
    SshConnection connection(address, creds, connectTimeout_);

    std::vector<core::ShellAuthMethod> methods;
    if (ssh_userauth_none(connection.get(), nullptr) == SSH_AUTH_ERROR) {
        spdlog::debug("SSH none auth to {} failed: {}", address, connection.lastError());
        return methods;
    }

    int advertised = ssh_userauth_list(connection.get(), nullptr);
    if (advertised & SSH_AUTH_METHOD_PASSWORD) {
        methods.push_back(core::ShellAuthMethod::Password);
    }
    if (advertised & SSH_AUTH_METHOD_INTERACTIVE) {
        methods.push_back(core::ShellAuthMethod::KeyboardInteractive);
    }
    spdlog::info("SSH to {}: server allows {} of the supported auth methods", address,
                 methods.size());
    return methods;
}

std::unique_ptr<core::IShellChannel> SshShellTransport::open(const std::string& address,
                                                             const core::ShellCredentials& creds,
                                                             core::ShellAuthMethod method) {
    auto connection = std::make_unique<SshConnection>(address, creds, connectTimeout_);

    bool authenticated = method == core::ShellAuthMethod::Password
                             ? authenticatePassword(*connection, creds)
                             : authenticateKeyboardInteractive(*connection, creds);
    if (!authenticated) {
        throw core::ProbeError("SSH " + core::shellAuthMethodToString(method) + " auth to " +
                               address + " rejected: " + connection->lastError());
    }

    ssh_channel channel = ssh_channel_new(connection->get());
    if (!channel) {
        throw core::ProbeError("Cannot allocate SSH channel: " + connection->lastError());
    }
    if (ssh_channel_open_session(channel) != SSH_OK ||
        ssh_channel_request_pty(channel) != SSH_OK ||
        ssh_channel_request_shell(channel) != SSH_OK) {
        std::string error = connection->lastError();
        ssh_channel_free(channel);
        throw core::ProbeError("Cannot open shell on " + address + ": " + error);
    }

    return std::make_unique<SshChannel>(std::move(connection), channel);
}

} // namespace fleetwatch::infra

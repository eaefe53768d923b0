#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/services/INetworkLookup.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/IShellTransport.hpp"
#include "core/services/ISnmpService.hpp"
#include "core/types/Errors.hpp"

#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fleetwatch::testing {

template <typename T>
std::future<T> ready(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

inline core::SnmpVarBind textBind(const std::string& oid, const std::string& value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::OctetString;
    vb.value = value;
    return vb;
}

inline core::SnmpVarBind intBind(const std::string& oid, int64_t value,
                                 core::SnmpDataType type = core::SnmpDataType::Integer) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = type;
    vb.value = std::to_string(value);
    vb.intValue = value;
    return vb;
}

/**
 * @brief SNMP agent table keyed by address; unknown addresses time out.
 */
class FakeSnmpService : public core::ISnmpService {
public:
    struct SetCall {
        std::string address;
        std::string oid;
        core::SnmpValue value;
        std::string community;
    };

    void addValue(const std::string& address, const core::SnmpVarBind& vb) {
        agents_[address][vb.oid] = vb;
    }

    void addWalk(const std::string& address, const std::string& root,
                 std::vector<core::SnmpVarBind> rows) {
        agents_[address];
        walks_[address][root] = std::move(rows);
    }

    void failSets(bool fail) { failSets_ = fail; }

    std::future<core::SnmpResult> getAsync(const std::string& address,
                                           const std::vector<std::string>& oids,
                                           const core::SnmpDeviceConfig& config) override {
        std::lock_guard lock(mutex_);
        lastConfig = config;
        ++getCount;
        core::SnmpResult result;
        auto agent = agents_.find(address);
        if (agent == agents_.end()) {
            result.errorMessage = "Request timed out";
            return ready(result);
        }
        result.success = true;
        for (const auto& oid : oids) {
            auto it = agent->second.find(oid);
            if (it != agent->second.end()) {
                result.varbinds.push_back(it->second);
            } else {
                core::SnmpVarBind missing;
                missing.oid = oid;
                missing.type = core::SnmpDataType::NoSuchObject;
                result.varbinds.push_back(missing);
            }
        }
        return ready(result);
    }

    std::future<core::SnmpResult> getNextAsync(const std::string& address,
                                               const std::vector<std::string>& oids,
                                               const core::SnmpDeviceConfig& config) override {
        return getAsync(address, oids, config);
    }

    std::future<std::vector<core::SnmpVarBind>> walkAsync(const std::string& address,
                                                          const std::string& rootOid,
                                                          const core::SnmpDeviceConfig&) override {
        std::lock_guard lock(mutex_);
        std::vector<core::SnmpVarBind> rows;
        auto agent = walks_.find(address);
        if (agent != walks_.end()) {
            auto it = agent->second.find(rootOid);
            if (it != agent->second.end()) {
                rows = it->second;
            }
        }
        return ready(rows);
    }

    std::future<core::SnmpResult> setAsync(const std::string& address, const std::string& oid,
                                           const core::SnmpValue& value,
                                           const core::SnmpDeviceConfig& config) override {
        std::lock_guard lock(mutex_);
        sets.push_back({address, oid, value, config.community});
        core::SnmpResult result;
        result.success = !failSets_;
        if (failSets_) {
            result.errorMessage = "notWritable";
        }
        return ready(result);
    }

    std::vector<SetCall> sets;
    core::SnmpDeviceConfig lastConfig;
    int getCount{0};

private:
    std::mutex mutex_;
    std::map<std::string, std::map<std::string, core::SnmpVarBind>> agents_;
    std::map<std::string, std::map<std::string, std::vector<core::SnmpVarBind>>> walks_;
    bool failSets_{false};
};

/**
 * @brief Hosts with fixed open ports; everything else is closed.
 */
class FakePortScanner : public core::IPortScanner {
public:
    void open(const std::string& address, std::vector<uint16_t> ports) {
        openPorts_[address] = std::move(ports);
    }

    std::vector<core::HostScanResult> scanHosts(const std::vector<std::string>& hosts,
                                                const std::vector<uint16_t>& ports,
                                                const core::ScanOptions& options,
                                                BatchCallback onBatch) override {
        lastOptions = options;
        std::vector<core::HostScanResult> results;
        core::BatchProgress progress;
        progress.total = hosts.size();
        for (const auto& host : hosts) {
            core::HostScanResult result{host, {}};
            for (auto port : ports) {
                if (isOpen(host, port)) {
                    result.openPorts.push_back(port);
                }
            }
            ++progress.scanned;
            if (result.found()) {
                ++progress.found;
                results.push_back(result);
            }
            if (onBatch) {
                onBatch(progress);
            }
        }
        return results;
    }

    std::future<std::vector<uint16_t>> checkPorts(const std::string& address,
                                                  const std::vector<uint16_t>& ports,
                                                  std::chrono::milliseconds) override {
        std::vector<uint16_t> open;
        for (auto port : ports) {
            if (isOpen(address, port)) {
                open.push_back(port);
            }
        }
        return ready(open);
    }

    std::future<bool> isPortOpen(const std::string& address, uint16_t port,
                                 std::chrono::milliseconds) override {
        if (throwOn.count(address)) {
            throw core::ProbeError("connect failed for " + address);
        }
        return ready(isOpen(address, port));
    }

    core::ScanOptions lastOptions;
    std::set<std::string> throwOn;

private:
    bool isOpen(const std::string& address, uint16_t port) const {
        auto it = openPorts_.find(address);
        if (it == openPorts_.end()) {
            return false;
        }
        for (auto p : it->second) {
            if (p == port) {
                return true;
            }
        }
        return false;
    }

    std::map<std::string, std::vector<uint16_t>> openPorts_;
};

/**
 * @brief Answers requests from a table keyed by "host:port target".
 */
class FakeHttpClient : public core::IHttpClient {
public:
    void respond(const std::string& host, const std::string& target, int status,
                 std::string body = "") {
        core::HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        routes_[host + " " + target] = response;
    }

    core::HttpResponse send(const core::HttpRequest& request) override {
        std::lock_guard lock(mutex_);
        requests.push_back(request);
        auto it = routes_.find(request.host + " " + request.target);
        if (it == routes_.end()) {
            core::HttpResponse failed;
            failed.error = "Connection refused";
            return failed;
        }
        return it->second;
    }

    size_t countFor(const std::string& target) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.target == target) {
                ++n;
            }
        }
        return n;
    }

    std::vector<core::HttpRequest> requests;

private:
    std::mutex mutex_;
    std::map<std::string, core::HttpResponse> routes_;
};

class FakeNeighborSource : public core::INeighborTableSource {
public:
    core::NeighborTable read() override {
        ++reads;
        return table;
    }

    core::NeighborTable table;
    int reads{0};
};

class FakeNameResolver : public core::INameResolver {
public:
    std::optional<std::string> reverseLookup(const std::string& address) override {
        auto it = dns.find(address);
        return it == dns.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::optional<std::string> netbiosName(const std::string& address) override {
        auto it = netbios.find(address);
        return it == netbios.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::map<std::string, std::string> dns;
    std::map<std::string, std::string> netbios;
};

/**
 * @brief Shell that answers each written line from a command table, prompt included.
 */
class ScriptedChannel : public core::IShellChannel {
public:
    explicit ScriptedChannel(std::map<std::string, std::string> replies, std::string prompt = "sw1#")
        : replies_(std::move(replies)), prompt_(std::move(prompt)) {
        pending_.push_back("\r\nWelcome\r\n" + prompt_ + " ");
    }

    void write(const std::string& data) override {
        if (!open_) {
            throw core::ProbeError("channel closed");
        }
        auto line = data;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        written->push_back(line);
        if (line == hangupCommand) {
            pending_.push_back(line + "\r\nConnection closed by foreign host.\r\n");
            open_ = false;
            return;
        }
        auto it = replies_.find(line);
        std::string body = it != replies_.end() ? it->second : "";
        pending_.push_back(line + "\r\n" + body + "\r\n" + prompt_ + " ");
    }

    std::string readAvailable(std::chrono::milliseconds) override {
        if (pending_.empty()) {
            return "";
        }
        auto chunk = pending_.front();
        pending_.pop_front();
        return chunk;
    }

    bool isOpen() const override { return open_; }

    void close() override { open_ = false; }

    std::shared_ptr<std::vector<std::string>> written = std::make_shared<std::vector<std::string>>();
    std::string hangupCommand; ///< Closes the channel without printing a prompt

private:
    std::map<std::string, std::string> replies_;
    std::string prompt_;
    std::deque<std::string> pending_;
    bool open_{true};
};

/**
 * @brief Connector that hands out scripted channels and can reject auth methods.
 */
class ScriptedConnector : public core::IShellConnector {
public:
    explicit ScriptedConnector(std::map<std::string, std::string> replies)
        : replies_(std::move(replies)) {}

    std::vector<core::ShellAuthMethod> queryAuthMethods(const std::string&,
                                                        const core::ShellCredentials&) override {
        return advertised;
    }

    std::unique_ptr<core::IShellChannel> open(const std::string& address,
                                              const core::ShellCredentials&,
                                              core::ShellAuthMethod method) override {
        attempts.push_back(method);
        if (rejected.count(method) || unreachable) {
            throw core::ProbeError("auth rejected by " + address);
        }
        auto channel = std::make_unique<ScriptedChannel>(replies_);
        channel->written = transcript;
        channel->hangupCommand = hangupCommand;
        return channel;
    }

    std::vector<core::ShellAuthMethod> advertised;
    std::set<core::ShellAuthMethod> rejected;
    bool unreachable{false};
    std::string hangupCommand;
    std::vector<core::ShellAuthMethod> attempts;
    std::shared_ptr<std::vector<std::string>> transcript = std::make_shared<std::vector<std::string>>();

private:
    std::map<std::string, std::string> replies_;
};

} // namespace fleetwatch::testing

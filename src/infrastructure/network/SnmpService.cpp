#include "infrastructure/network/SnmpService.hpp"

#include "infrastructure/network/UdpExchange.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace fleetwatch::infra {

namespace {

core::SnmpResult failedResult(const core::SnmpDeviceConfig& config, std::string message) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.version = config.version;
    result.success = false;
    result.errorMessage = std::move(message);
    return result;
}

} // namespace

SnmpService::SnmpService() {
    std::random_device rd;
    requestIdCounter_ = static_cast<int32_t>(rd() & 0x3FFFFFFF);
    executor_.start();
    spdlog::debug("SnmpService initialized");
}

SnmpService::~SnmpService() {
    executor_.stop();
}

std::future<core::SnmpResult> SnmpService::getAsync(const std::string& address,
                                                    const std::vector<std::string>& oids,
                                                    const core::SnmpDeviceConfig& config) {
    std::vector<RequestBinding> bindings;
    for (const auto& oid : oids) {
        bindings.push_back({oid, std::nullopt});
    }
    return submit(address, PduType::GetRequest, std::move(bindings), config);
}

std::future<core::SnmpResult> SnmpService::getNextAsync(const std::string& address,
                                                        const std::vector<std::string>& oids,
                                                        const core::SnmpDeviceConfig& config) {
    std::vector<RequestBinding> bindings;
    for (const auto& oid : oids) {
        bindings.push_back({oid, std::nullopt});
    }
    return submit(address, PduType::GetNextRequest, std::move(bindings), config);
}

std::future<core::SnmpResult> SnmpService::setAsync(const std::string& address,
                                                    const std::string& oid,
                                                    const core::SnmpValue& value,
                                                    const core::SnmpDeviceConfig& config) {
    return submit(address, PduType::SetRequest, {{oid, value}}, config);
}

std::future<std::vector<core::SnmpVarBind>> SnmpService::walkAsync(
    const std::string& address, const std::string& rootOid, const core::SnmpDeviceConfig& config) {

    auto promise = std::make_shared<std::promise<std::vector<core::SnmpVarBind>>>();
    auto future = promise->get_future();

    executor_.post([this, promise, address, rootOid, config]() {
        std::vector<core::SnmpVarBind> results;
        std::string currentOid = rootOid;

        for (int step = 0; step < kMaxWalkSteps; ++step) {
            auto result = exchange(address, PduType::GetNextRequest, {{currentOid, std::nullopt}},
                                   config);
            if (!result.success || result.varbinds.empty()) {
                if (!result.success && results.empty()) {
                    spdlog::debug("SNMP walk {} on {} failed: {}", rootOid, address,
                                  result.errorMessage);
                }
                break;
            }

            const auto& vb = result.varbinds.front();
            if (!SnmpCodec::isOidPrefix(rootOid, vb.oid) || vb.oid == currentOid) {
                break;
            }
            if (vb.type == core::SnmpDataType::EndOfMibView ||
                vb.type == core::SnmpDataType::NoSuchObject ||
                vb.type == core::SnmpDataType::NoSuchInstance) {
                break;
            }

            results.push_back(vb);
            currentOid = vb.oid;
        }

        promise->set_value(std::move(results));
    });

    return future;
}

std::future<core::SnmpResult> SnmpService::submit(const std::string& address, PduType pduType,
                                                  std::vector<RequestBinding> bindings,
                                                  const core::SnmpDeviceConfig& config) {
    auto promise = std::make_shared<std::promise<core::SnmpResult>>();
    auto future = promise->get_future();

    executor_.post([this, promise, address, pduType, bindings = std::move(bindings), config]() {
        promise->set_value(exchange(address, pduType, bindings, config));
    });

    return future;
}

core::SnmpResult SnmpService::exchange(const std::string& address, PduType pduType,
                                       const std::vector<RequestBinding>& bindings,
                                       const core::SnmpDeviceConfig& config) {
    std::lock_guard<std::mutex> lock(exchangeMutex_);

    const int attempts = std::max(config.retries, 0) + 1;
    core::SnmpResult result;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        result = exchangeOnce(address, pduType, bindings, config);
        if (result.success || result.errorMessage != "Request timed out") {
            break;
        }
    }
    return result;
}

core::SnmpResult SnmpService::exchangeOnce(const std::string& address, PduType pduType,
                                           const std::vector<RequestBinding>& bindings,
                                           const core::SnmpDeviceConfig& config) {
    auto startTime = std::chrono::steady_clock::now();

    try {
        asio::io_context resolverContext;
        asio::ip::udp::resolver resolver(resolverContext);
        asio::error_code ec;
        auto endpoints =
            resolver.resolve(asio::ip::udp::v4(), address, std::to_string(config.port), ec);
        if (ec || endpoints.empty()) {
            return failedResult(config, "Failed to resolve address: " + address);
        }
        auto endpoint = endpoints.begin()->endpoint();

        int32_t requestId = requestIdCounter_++ & 0x7FFFFFFF;
        auto packet =
            SnmpCodec::encodeRequest(pduType, config.version, config.community, requestId, bindings);

        auto reply = exchangeDatagram(endpoint, packet,
                                      std::chrono::milliseconds(std::max(config.timeoutMs, 1)));
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);

        if (reply.timedOut) {
            return failedResult(config, "Request timed out");
        }
        if (!reply.error.empty()) {
            return failedResult(config, "Network error: " + reply.error);
        }

        auto result = SnmpCodec::decodeResponse(reply.data, requestId);
        result.responseTime = elapsed;
        result.version = config.version;
        return result;
    } catch (const std::exception& e) {
        return failedResult(config, std::string("SNMP error: ") + e.what());
    }
}

} // namespace fleetwatch::infra

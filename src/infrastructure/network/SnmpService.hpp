#pragma once

#include "core/services/ISnmpService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/SnmpCodec.hpp"

#include <atomic>
#include <mutex>

namespace fleetwatch::infra {

/**
 * @brief SNMPv1/v2c client over UDP request/response exchanges.
 *
 * Each attempt waits at most SnmpDeviceConfig::timeoutMs for its answer and
 * is repeated SnmpDeviceConfig::retries times after a timeout.
 *
 * Exchanges are serialized: every request runs on a private single-thread
 * executor and additionally holds @c exchangeMutex_ for the duration of one
 * send/receive. Callers may issue requests from any thread; they are queued,
 * never interleaved.
 *
 * @note This class is non-copyable.
 */
class SnmpService : public core::ISnmpService {
public:
    SnmpService();

    /**
     * @brief Stops the executor. Requests still queued are abandoned.
     */
    ~SnmpService() override;

    SnmpService(const SnmpService&) = delete;
    SnmpService& operator=(const SnmpService&) = delete;

    std::future<core::SnmpResult> getAsync(const std::string& address,
                                           const std::vector<std::string>& oids,
                                           const core::SnmpDeviceConfig& config) override;

    std::future<core::SnmpResult> getNextAsync(const std::string& address,
                                               const std::vector<std::string>& oids,
                                               const core::SnmpDeviceConfig& config) override;

    /**
     * @brief GET-NEXT loop bounded by the subtree and by kMaxWalkSteps.
     */
    std::future<std::vector<core::SnmpVarBind>> walkAsync(const std::string& address,
                                                          const std::string& rootOid,
                                                          const core::SnmpDeviceConfig& config) override;

    std::future<core::SnmpResult> setAsync(const std::string& address, const std::string& oid,
                                           const core::SnmpValue& value,
                                           const core::SnmpDeviceConfig& config) override;

    static constexpr int kMaxWalkSteps = 1000;

private:
    core::SnmpResult exchange(const std::string& address, PduType pduType,
                              const std::vector<RequestBinding>& bindings,
                              const core::SnmpDeviceConfig& config);

    core::SnmpResult exchangeOnce(const std::string& address, PduType pduType,
                                  const std::vector<RequestBinding>& bindings,
                                  const core::SnmpDeviceConfig& config);

    std::future<core::SnmpResult> submit(const std::string& address, PduType pduType,
                                         std::vector<RequestBinding> bindings,
                                         const core::SnmpDeviceConfig& config);

    AsioContext executor_{1};
    std::mutex exchangeMutex_;
    std::atomic<int32_t> requestIdCounter_{0};
};

} // namespace fleetwatch::infra

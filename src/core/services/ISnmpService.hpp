/**
 * @file ISnmpService.hpp
 * @brief Interface for SNMP queries.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <future>
#include <string>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief SNMP GET, GET-NEXT, WALK and SET against community-based agents.
 *
 * Implementations must run at most one exchange at a time. Concurrent
 * callers are queued, never interleaved.
 */
class ISnmpService {
public:
    virtual ~ISnmpService() = default;

    /**
     * @brief Performs an asynchronous SNMP GET request.
     * @param address IP address or hostname of the SNMP agent.
     * @param oids Vector of OIDs to retrieve.
     * @param config Community, port, timeout and retries.
     * @return Future that will contain the SNMP result.
     */
    virtual std::future<SnmpResult> getAsync(const std::string& address,
                                             const std::vector<std::string>& oids,
                                             const SnmpDeviceConfig& config) = 0;

    /**
     * @brief Performs an asynchronous SNMP GET-NEXT request.
     */
    virtual std::future<SnmpResult> getNextAsync(const std::string& address,
                                                 const std::vector<std::string>& oids,
                                                 const SnmpDeviceConfig& config) = 0;

    /**
     * @brief Walks the subtree under @p rootOid with repeated GET-NEXT.
     * @return Future with every binding under the root, empty on error.
     */
    virtual std::future<std::vector<SnmpVarBind>> walkAsync(const std::string& address,
                                                            const std::string& rootOid,
                                                            const SnmpDeviceConfig& config) = 0;

    /**
     * @brief Performs an asynchronous SNMP SET of a single OID.
     */
    virtual std::future<SnmpResult> setAsync(const std::string& address, const std::string& oid,
                                             const SnmpValue& value,
                                             const SnmpDeviceConfig& config) = 0;
};

} // namespace fleetwatch::core

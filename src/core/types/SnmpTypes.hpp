/**
 * @file SnmpTypes.hpp
 * @brief SNMP request configuration, results and the OIDs the probes read.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fleetwatch::core {

/**
 * @brief Community-based SNMP protocol versions.
 */
enum class SnmpVersion : int {
    V1 = 1,  ///< SNMP version 1
    V2c = 2  ///< SNMP version 2c
};

/**
 * @brief SNMP data types as defined in RFC 2578.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Gauge32 = 5,          ///< 32-bit gauge (can increase or decrease)
    TimeTicks = 6,        ///< Hundredths of a second since epoch
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Unknown = 99          ///< Unknown data type
};

/**
 * @brief SNMP variable binding (OID + value pair).
 *
 * OctetString values keep their raw bytes in @c value, so binary values such
 * as ifPhysAddress can be read byte by byte.
 */
struct SnmpVarBind {
    std::string oid;                          ///< Object identifier
    SnmpDataType type{SnmpDataType::Unknown}; ///< Data type of the value
    std::string value;                        ///< String representation of the value
    std::optional<int64_t> intValue;          ///< Integer value (if applicable)
    std::optional<uint64_t> counterValue;     ///< Counter value (if applicable)

    /**
     * @brief True for the exception markers and Null, which carry no value.
     */
    [[nodiscard]] bool isException() const {
        return type == SnmpDataType::NoSuchObject || type == SnmpDataType::NoSuchInstance ||
               type == SnmpDataType::EndOfMibView || type == SnmpDataType::Null;
    }

    /**
     * @brief Numeric value regardless of whether it arrived as integer or counter.
     */
    [[nodiscard]] std::optional<int64_t> numeric() const {
        if (intValue) {
            return intValue;
        }
        if (counterValue) {
            return static_cast<int64_t>(*counterValue);
        }
        return std::nullopt;
    }

    bool operator==(const SnmpVarBind& other) const = default;
};

/**
 * @brief Result of an SNMP GET, GET-NEXT or SET exchange.
 */
struct SnmpResult {
    std::chrono::system_clock::time_point timestamp; ///< When the query was performed
    SnmpVersion version{SnmpVersion::V2c};           ///< SNMP version used
    std::vector<SnmpVarBind> varbinds;               ///< Variable bindings in the response
    std::chrono::microseconds responseTime{0};       ///< Time taken for the query
    bool success{false};                             ///< Whether the query succeeded
    std::string errorMessage;                        ///< Error message if query failed
    int errorStatus{0};                              ///< SNMP error status (0 = noError)
    int errorIndex{0};                               ///< Index of varbind that caused error

    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    /**
     * @brief Gets a specific variable binding by OID.
     * @param oid The OID to search for.
     * @return The variable binding if found, std::nullopt otherwise.
     */
    [[nodiscard]] std::optional<SnmpVarBind> getVarBind(const std::string& oid) const {
        for (const auto& vb : varbinds) {
            if (vb.oid == oid) {
                return vb;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Text value of a binding that carries data, std::nullopt otherwise.
     */
    [[nodiscard]] std::optional<std::string> textOf(const std::string& oid) const {
        auto vb = getVarBind(oid);
        if (!vb || vb->isException()) {
            return std::nullopt;
        }
        return vb->value;
    }

    bool operator==(const SnmpResult& other) const = default;
};

/**
 * @brief Value written by an SNMP SET.
 */
using SnmpValue = std::variant<int64_t, std::string>;

/**
 * @brief How to reach one SNMP agent.
 */
struct SnmpDeviceConfig {
    std::string community{"public"};       ///< Community string
    SnmpVersion version{SnmpVersion::V2c}; ///< SNMP version to use
    uint16_t port{161};                    ///< SNMP port
    int timeoutMs{2000};                   ///< Per-exchange timeout in milliseconds
    int retries{0};                        ///< Extra attempts after a timeout

    bool operator==(const SnmpDeviceConfig& other) const = default;
};

/**
 * @brief OIDs read and written by the identifier and the probes.
 */
namespace SnmpOids {
    /** @name System MIB (SNMPv2-MIB)
     *  @{ */
    constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";
    constexpr const char* SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0";
    constexpr const char* SYS_UPTIME = "1.3.6.1.2.1.1.3.0";
    constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";
    /** @} */

    /** @name Interface MIB (IF-MIB)
     *  @{ */
    constexpr const char* IF_DESCR = "1.3.6.1.2.1.2.2.1.2";
    constexpr const char* IF_SPEED = "1.3.6.1.2.1.2.2.1.5";
    constexpr const char* IF_PHYS_ADDRESS = "1.3.6.1.2.1.2.2.1.6";
    constexpr const char* IF_ADMIN_STATUS = "1.3.6.1.2.1.2.2.1.7";
    constexpr const char* IF_OPER_STATUS = "1.3.6.1.2.1.2.2.1.8";
    constexpr const char* IF_ALIAS = "1.3.6.1.2.1.31.1.1.1.18";
    /** @} */

    /** @name Bridge and PoE MIBs
     *  @{ */
    constexpr const char* DOT1Q_PVID = "1.3.6.1.2.1.17.7.1.4.5.1.1";
    constexpr const char* PETH_PSE_PORT_ADMIN_ENABLE = "1.3.6.1.2.1.105.1.1.1.3.1";
    constexpr const char* PETH_PSE_PORT_POWER = "1.3.6.1.2.1.105.1.1.1.6.1";
    /** @} */

    /** @name Printer and Host Resources MIBs
     *  @{ */
    constexpr const char* HR_PRINTER_STATUS = "1.3.6.1.2.1.25.3.5.1.1.1";
    constexpr const char* PRT_MARKER_SUPPLIES_DESCR = "1.3.6.1.2.1.43.11.1.1.6.1";
    constexpr const char* PRT_MARKER_SUPPLIES_MAX = "1.3.6.1.2.1.43.11.1.1.8.1";
    constexpr const char* PRT_MARKER_SUPPLIES_LEVEL = "1.3.6.1.2.1.43.11.1.1.9.1";
    /** @} */
}

inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "v1";
        case SnmpVersion::V2c: return "v2c";
    }
    return "unknown";
}

/**
 * @brief Parses "v1"/"1" as V1; everything else is V2c.
 */
inline SnmpVersion snmpVersionFromString(const std::string& str) {
    if (str == "v1" || str == "1") return SnmpVersion::V1;
    return SnmpVersion::V2c;
}

inline std::string snmpDataTypeToString(SnmpDataType type) {
    switch (type) {
        case SnmpDataType::Integer: return "INTEGER";
        case SnmpDataType::OctetString: return "OCTET STRING";
        case SnmpDataType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpDataType::IpAddress: return "IpAddress";
        case SnmpDataType::Counter32: return "Counter32";
        case SnmpDataType::Gauge32: return "Gauge32";
        case SnmpDataType::TimeTicks: return "TimeTicks";
        case SnmpDataType::Counter64: return "Counter64";
        case SnmpDataType::Null: return "Null";
        case SnmpDataType::NoSuchObject: return "noSuchObject";
        case SnmpDataType::NoSuchInstance: return "noSuchInstance";
        case SnmpDataType::EndOfMibView: return "endOfMibView";
        case SnmpDataType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace fleetwatch::core

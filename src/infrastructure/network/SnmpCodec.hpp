#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief PDU tags for the community-based SNMP operations.
 */
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2,
    SetRequest = 0xA3
};

/**
 * @brief One binding of an outgoing request: GET/GET-NEXT send Null, SET sends a value.
 */
struct RequestBinding {
    std::string oid;
    std::optional<core::SnmpValue> value;
};

/**
 * @brief BER encoder and decoder for SNMPv1/v2c messages.
 *
 * Stateless; all members are static so the message layout can be tested
 * without a socket.
 */
class SnmpCodec {
public:
    /**
     * @brief Encodes a complete request message.
     * @throws std::invalid_argument if an OID cannot be parsed.
     */
    static std::vector<uint8_t> encodeRequest(PduType pduType, core::SnmpVersion version,
                                              const std::string& community, int32_t requestId,
                                              const std::vector<RequestBinding>& bindings);

    /**
     * @brief Decodes a GetResponse message.
     *
     * Malformed input never throws: it yields success=false with a
     * "Parse error" message. A request-id mismatch is reported the same way.
     */
    static core::SnmpResult decodeResponse(const std::vector<uint8_t>& message,
                                           int32_t expectedRequestId);

    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeInteger(int64_t value);
    static std::vector<uint8_t> encodeOctetString(const std::string& str);
    static std::vector<uint8_t> encodeOid(const std::string& oid);
    static std::vector<uint8_t> encodeNull();
    static std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content);

    static std::string decodeOid(const uint8_t* data, size_t length);

    static std::vector<uint32_t> parseOidString(const std::string& oid);

    /**
     * @brief True if @p oid equals @p prefix or lies beneath it.
     */
    static bool isOidPrefix(const std::string& prefix, const std::string& oid);

    static std::string errorStatusToString(int errorStatus);
};

} // namespace fleetwatch::infra

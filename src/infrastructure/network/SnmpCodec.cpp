#include "infrastructure/network/SnmpCodec.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fleetwatch::infra {

namespace {
// ASN.1/BER tag types
constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

// Wire values of the version field
constexpr int64_t SNMP_VERSION_1 = 0;
constexpr int64_t SNMP_VERSION_2C = 1;

core::SnmpDataType tagToDataType(uint8_t tag) {
    switch (tag) {
        case TAG_INTEGER: return core::SnmpDataType::Integer;
        case TAG_OCTET_STRING: return core::SnmpDataType::OctetString;
        case TAG_OID: return core::SnmpDataType::ObjectIdentifier;
        case TAG_IP_ADDRESS: return core::SnmpDataType::IpAddress;
        case TAG_COUNTER32: return core::SnmpDataType::Counter32;
        case TAG_GAUGE32: return core::SnmpDataType::Gauge32;
        case TAG_TIMETICKS: return core::SnmpDataType::TimeTicks;
        case TAG_COUNTER64: return core::SnmpDataType::Counter64;
        case TAG_NULL: return core::SnmpDataType::Null;
        case TAG_NO_SUCH_OBJECT: return core::SnmpDataType::NoSuchObject;
        case TAG_NO_SUCH_INSTANCE: return core::SnmpDataType::NoSuchInstance;
        case TAG_END_OF_MIB_VIEW: return core::SnmpDataType::EndOfMibView;
        default: return core::SnmpDataType::Unknown;
    }
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

/**
 * @brief Bounds-checked cursor over a received datagram.
 */
class BerReader {
public:
    BerReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t readByte() {
        if (offset_ >= size_) {
            throw std::runtime_error("Truncated message");
        }
        return data_[offset_++];
    }

    size_t readLength() {
        uint8_t first = readByte();
        if ((first & 0x80) == 0) {
            return first;
        }
        size_t numBytes = first & 0x7F;
        if (numBytes == 0 || numBytes > 4) {
            throw std::runtime_error("Unsupported length encoding");
        }
        size_t length = 0;
        for (size_t i = 0; i < numBytes; ++i) {
            length = (length << 8) | readByte();
        }
        if (length > remaining()) {
            throw std::runtime_error("Length exceeds message");
        }
        return length;
    }

    size_t expect(uint8_t tag, const char* what) {
        if (readByte() != tag) {
            throw std::runtime_error(std::string("Expected ") + what);
        }
        return readLength();
    }

    int64_t readInteger(const char* what) {
        size_t length = expect(TAG_INTEGER, what);
        int64_t value = decodeSigned(data_ + offset_, length);
        offset_ += length;
        return value;
    }

    const uint8_t* current() const { return data_ + offset_; }
    size_t offset() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }

    void skip(size_t length) {
        if (length > remaining()) {
            throw std::runtime_error("Truncated message");
        }
        offset_ += length;
    }

    static int64_t decodeSigned(const uint8_t* data, size_t length) {
        if (length == 0) {
            return 0;
        }
        if (length > 8) {
            throw std::runtime_error("Integer too long");
        }
        int64_t value = (data[0] & 0x80) ? -1 : 0;
        for (size_t i = 0; i < length; ++i) {
            value = static_cast<int64_t>((static_cast<uint64_t>(value) << 8) | data[i]);
        }
        return value;
    }

    static uint64_t decodeUnsigned(const uint8_t* data, size_t length) {
        uint64_t value = 0;
        for (size_t i = 0; i < length; ++i) {
            value = (value << 8) | data[i];
        }
        return value;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

core::SnmpVarBind decodeVarBind(BerReader& reader) {
    size_t seqLen = reader.expect(TAG_SEQUENCE, "SEQUENCE for varbind");
    size_t seqEnd = reader.offset() + seqLen;

    core::SnmpVarBind varbind;
    size_t oidLen = reader.expect(TAG_OID, "OID");
    varbind.oid = SnmpCodec::decodeOid(reader.current(), oidLen);
    reader.skip(oidLen);

    uint8_t valueTag = reader.readByte();
    size_t valueLen = reader.readLength();
    const uint8_t* value = reader.current();
    varbind.type = tagToDataType(valueTag);

    switch (valueTag) {
        case TAG_INTEGER:
            varbind.intValue = BerReader::decodeSigned(value, valueLen);
            varbind.value = std::to_string(*varbind.intValue);
            break;
        case TAG_OCTET_STRING:
            varbind.value.assign(reinterpret_cast<const char*>(value), valueLen);
            break;
        case TAG_OID:
            varbind.value = SnmpCodec::decodeOid(value, valueLen);
            break;
        case TAG_IP_ADDRESS:
            if (valueLen == 4) {
                varbind.value = std::to_string(value[0]) + "." + std::to_string(value[1]) + "." +
                                std::to_string(value[2]) + "." + std::to_string(value[3]);
            }
            break;
        case TAG_COUNTER32:
        case TAG_GAUGE32:
        case TAG_TIMETICKS:
        case TAG_COUNTER64:
            varbind.counterValue = BerReader::decodeUnsigned(value, valueLen);
            varbind.value = std::to_string(*varbind.counterValue);
            break;
        case TAG_NULL:
        case TAG_NO_SUCH_OBJECT:
        case TAG_NO_SUCH_INSTANCE:
        case TAG_END_OF_MIB_VIEW:
            break;
        default: {
            std::ostringstream oss;
            oss << std::hex;
            for (size_t i = 0; i < valueLen; ++i) {
                oss << std::setw(2) << std::setfill('0') << static_cast<int>(value[i]);
            }
            varbind.value = oss.str();
            break;
        }
    }
    reader.skip(valueLen);

    if (reader.offset() != seqEnd) {
        throw std::runtime_error("Varbind length mismatch");
    }
    return varbind;
}

} // namespace

std::vector<uint8_t> SnmpCodec::encodeRequest(PduType pduType, core::SnmpVersion version,
                                              const std::string& community, int32_t requestId,
                                              const std::vector<RequestBinding>& bindings) {
    std::vector<uint8_t> varbindList;
    for (const auto& binding : bindings) {
        std::vector<uint8_t> varbind = encodeOid(binding.oid);
        if (!binding.value) {
            append(varbind, encodeNull());
        } else if (const auto* number = std::get_if<int64_t>(&*binding.value)) {
            append(varbind, encodeInteger(*number));
        } else {
            append(varbind, encodeOctetString(std::get<std::string>(*binding.value)));
        }
        append(varbindList, encodeSequence(varbind));
    }

    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(requestId));
    append(pduContent, encodeInteger(0)); // error-status
    append(pduContent, encodeInteger(0)); // error-index
    append(pduContent, encodeSequence(varbindList));

    std::vector<uint8_t> pdu;
    pdu.push_back(static_cast<uint8_t>(pduType));
    append(pdu, encodeLength(pduContent.size()));
    append(pdu, pduContent);

    std::vector<uint8_t> message;
    append(message, encodeInteger(version == core::SnmpVersion::V1 ? SNMP_VERSION_1
                                                                  : SNMP_VERSION_2C));
    append(message, encodeOctetString(community));
    append(message, pdu);
    return encodeSequence(message);
}

core::SnmpResult SnmpCodec::decodeResponse(const std::vector<uint8_t>& message,
                                           int32_t expectedRequestId) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();

    try {
        BerReader reader(message.data(), message.size());
        reader.expect(TAG_SEQUENCE, "SEQUENCE");

        int64_t version = reader.readInteger("INTEGER for version");
        result.version = version == SNMP_VERSION_1 ? core::SnmpVersion::V1 : core::SnmpVersion::V2c;

        reader.skip(reader.expect(TAG_OCTET_STRING, "OCTET STRING for community"));

        if (reader.readByte() != static_cast<uint8_t>(PduType::GetResponse)) {
            throw std::runtime_error("Expected GetResponse PDU");
        }
        reader.readLength();

        int64_t requestId = reader.readInteger("INTEGER for request-id");
        if (requestId != expectedRequestId) {
            throw std::runtime_error("Request id mismatch");
        }
        result.errorStatus = static_cast<int>(reader.readInteger("INTEGER for error-status"));
        result.errorIndex = static_cast<int>(reader.readInteger("INTEGER for error-index"));

        if (result.errorStatus != 0) {
            result.success = false;
            result.errorMessage = errorStatusToString(result.errorStatus);
            return result;
        }

        size_t listLen = reader.expect(TAG_SEQUENCE, "SEQUENCE for varbind-list");
        size_t listEnd = reader.offset() + listLen;
        while (reader.offset() < listEnd) {
            result.varbinds.push_back(decodeVarBind(reader));
        }

        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.varbinds.clear();
        result.errorMessage = std::string("Parse error: ") + e.what();
    }

    return result;
}

// BER encoding helpers

std::vector<uint8_t> SnmpCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    }

    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeInteger(int64_t value) {
    // Minimal two's complement: drop leading bytes that only repeat the sign.
    std::vector<uint8_t> bytes;
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<uint8_t>((static_cast<uint64_t>(value) >> shift) & 0xFF));
    }
    size_t start = 0;
    while (start < bytes.size() - 1) {
        bool redundantZero = bytes[start] == 0x00 && (bytes[start + 1] & 0x80) == 0;
        bool redundantOnes = bytes[start] == 0xFF && (bytes[start + 1] & 0x80) != 0;
        if (!redundantZero && !redundantOnes) {
            break;
        }
        ++start;
    }

    std::vector<uint8_t> encoded{TAG_INTEGER};
    append(encoded, encodeLength(bytes.size() - start));
    encoded.insert(encoded.end(), bytes.begin() + static_cast<std::ptrdiff_t>(start), bytes.end());
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeOctetString(const std::string& str) {
    std::vector<uint8_t> encoded{TAG_OCTET_STRING};
    append(encoded, encodeLength(str.size()));
    encoded.insert(encoded.end(), str.begin(), str.end());
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeOid(const std::string& oid) {
    auto components = parseOidString(oid);
    if (components.size() < 2) {
        throw std::invalid_argument("OID needs at least two arcs: " + oid);
    }

    std::vector<uint8_t> oidBytes;
    oidBytes.push_back(static_cast<uint8_t>(components[0] * 40 + components[1]));

    for (size_t i = 2; i < components.size(); ++i) {
        uint32_t val = components[i];
        std::vector<uint8_t> subId{static_cast<uint8_t>(val & 0x7F)};
        val >>= 7;
        while (val > 0) {
            subId.insert(subId.begin(), static_cast<uint8_t>((val & 0x7F) | 0x80));
            val >>= 7;
        }
        append(oidBytes, subId);
    }

    std::vector<uint8_t> encoded{TAG_OID};
    append(encoded, encodeLength(oidBytes.size()));
    append(encoded, oidBytes);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeNull() {
    return {TAG_NULL, 0x00};
}

std::vector<uint8_t> SnmpCodec::encodeSequence(const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded{TAG_SEQUENCE};
    append(encoded, encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

std::string SnmpCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) return "";

    std::vector<uint32_t> components;
    uint8_t first = data[0];
    if (first < 80) {
        components.push_back(first / 40);
        components.push_back(first % 40);
    } else {
        components.push_back(2);
        components.push_back(first - 80u);
    }

    uint32_t value = 0;
    for (size_t i = 1; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        if ((data[i] & 0x80) == 0) {
            components.push_back(value);
            value = 0;
        }
    }

    std::ostringstream oss;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) oss << ".";
        oss << components[i];
    }
    return oss.str();
}

std::vector<uint32_t> SnmpCodec::parseOidString(const std::string& oid) {
    std::vector<uint32_t> components;
    std::istringstream iss(oid);
    std::string token;

    while (std::getline(iss, token, '.')) {
        if (token.empty()) {
            continue;
        }
        uint32_t arc = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), arc);
        if (ec != std::errc() || ptr != token.data() + token.size()) {
            throw std::invalid_argument("Invalid OID arc '" + token + "' in " + oid);
        }
        components.push_back(arc);
    }

    return components;
}

bool SnmpCodec::isOidPrefix(const std::string& prefix, const std::string& oid) {
    if (oid.size() < prefix.size()) return false;
    if (oid.compare(0, prefix.size(), prefix) != 0) return false;

    // Ensure we're at a boundary
    if (oid.size() > prefix.size() && oid[prefix.size()] != '.') {
        return false;
    }

    return true;
}

std::string SnmpCodec::errorStatusToString(int errorStatus) {
    switch (errorStatus) {
        case 0: return "No error";
        case 1: return "Response too big";
        case 2: return "No such name";
        case 3: return "Bad value";
        case 4: return "Read only";
        case 5: return "General error";
        case 6: return "No access";
        case 7: return "Wrong type";
        case 10: return "Wrong value";
        case 16: return "Authorization error";
        case 17: return "Not writable";
        default: return "Unknown error";
    }
}

} // namespace fleetwatch::infra

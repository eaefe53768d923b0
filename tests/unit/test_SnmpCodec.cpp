#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/SnmpCodec.hpp"

#include <stdexcept>

using namespace fleetwatch::core;
using namespace fleetwatch::infra;

namespace {

using Bytes = std::vector<uint8_t>;

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

Bytes varbind(const std::string& oid, const Bytes& value) {
    return SnmpCodec::encodeSequence(concat({SnmpCodec::encodeOid(oid), value}));
}

Bytes response(int32_t requestId, const std::vector<Bytes>& varbinds, int errorStatus = 0,
               int errorIndex = 0) {
    Bytes list;
    for (const auto& vb : varbinds) {
        list.insert(list.end(), vb.begin(), vb.end());
    }
    Bytes content = concat({SnmpCodec::encodeInteger(requestId), SnmpCodec::encodeInteger(errorStatus),
                            SnmpCodec::encodeInteger(errorIndex), SnmpCodec::encodeSequence(list)});
    Bytes pdu = concat({{static_cast<uint8_t>(PduType::GetResponse)},
                        SnmpCodec::encodeLength(content.size()), content});
    return SnmpCodec::encodeSequence(
        concat({SnmpCodec::encodeInteger(1), SnmpCodec::encodeOctetString("public"), pdu}));
}

} // namespace

TEST_CASE("BER primitives", "[SnmpCodec]") {
    SECTION("Integers use minimal two's complement") {
        REQUIRE(SnmpCodec::encodeInteger(0) == Bytes{0x02, 0x01, 0x00});
        REQUIRE(SnmpCodec::encodeInteger(127) == Bytes{0x02, 0x01, 0x7F});
        REQUIRE(SnmpCodec::encodeInteger(128) == Bytes{0x02, 0x02, 0x00, 0x80});
        REQUIRE(SnmpCodec::encodeInteger(256) == Bytes{0x02, 0x02, 0x01, 0x00});
        REQUIRE(SnmpCodec::encodeInteger(-1) == Bytes{0x02, 0x01, 0xFF});
        REQUIRE(SnmpCodec::encodeInteger(-129) == Bytes{0x02, 0x02, 0xFF, 0x7F});
    }

    SECTION("Long-form lengths") {
        REQUIRE(SnmpCodec::encodeLength(5) == Bytes{0x05});
        REQUIRE(SnmpCodec::encodeLength(200) == Bytes{0x81, 0xC8});
        REQUIRE(SnmpCodec::encodeLength(300) == Bytes{0x82, 0x01, 0x2C});
    }

    SECTION("OIDs") {
        REQUIRE(SnmpCodec::encodeOid(SnmpOids::SYS_DESCR) ==
                Bytes{0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00});

        auto encoded = SnmpCodec::encodeOid("1.3.6.1.4.1.9.1.516");
        REQUIRE(encoded[encoded.size() - 2] == 0x84);
        REQUIRE(encoded.back() == 0x04);
        REQUIRE(SnmpCodec::decodeOid(encoded.data() + 2, encoded.size() - 2) == "1.3.6.1.4.1.9.1.516");

        REQUIRE_THROWS_AS(SnmpCodec::encodeOid("1.3.six.1"), std::invalid_argument);
        REQUIRE_THROWS_AS(SnmpCodec::encodeOid("1"), std::invalid_argument);
    }

    SECTION("OID prefixes stop at arc boundaries") {
        REQUIRE(SnmpCodec::isOidPrefix(SnmpOids::IF_DESCR, "1.3.6.1.2.1.2.2.1.2.5"));
        REQUIRE(SnmpCodec::isOidPrefix(SnmpOids::IF_DESCR, SnmpOids::IF_DESCR));
        REQUIRE_FALSE(SnmpCodec::isOidPrefix(SnmpOids::IF_DESCR, "1.3.6.1.2.1.2.2.1.20.5"));
        REQUIRE_FALSE(SnmpCodec::isOidPrefix(SnmpOids::IF_DESCR, "1.3.6.1.2.1.2.2.1"));
    }
}

TEST_CASE("Request encoding", "[SnmpCodec]") {
    SECTION("GET for sysDescr") {
        auto message = SnmpCodec::encodeRequest(PduType::GetRequest, SnmpVersion::V2c, "public", 1,
                                                {{SnmpOids::SYS_DESCR, std::nullopt}});
        REQUIRE(message.size() == 40);
        REQUIRE(message[0] == 0x30);
        REQUIRE(message[1] == 0x26);
        REQUIRE(Bytes(message.begin() + 2, message.begin() + 5) == Bytes{0x02, 0x01, 0x01});
        REQUIRE(std::string(message.begin() + 7, message.begin() + 13) == "public");
        REQUIRE(message[13] == 0xA0);
        REQUIRE(Bytes(message.end() - 2, message.end()) == Bytes{0x05, 0x00});
    }

    SECTION("Version 1 on the wire is zero") {
        auto message = SnmpCodec::encodeRequest(PduType::GetNextRequest, SnmpVersion::V1, "public", 1,
                                                {{SnmpOids::IF_DESCR, std::nullopt}});
        REQUIRE(message[4] == 0x00);
        REQUIRE(message[13] == 0xA1);
    }

    SECTION("SET carries typed values") {
        auto number = SnmpCodec::encodeRequest(PduType::SetRequest, SnmpVersion::V2c, "private", 9,
                                               {{"1.3.6.1.2.1.2.2.1.7.5", SnmpValue{int64_t{2}}}});
        REQUIRE(Bytes(number.end() - 3, number.end()) == Bytes{0x02, 0x01, 0x02});

        auto text = SnmpCodec::encodeRequest(PduType::SetRequest, SnmpVersion::V2c, "private", 9,
                                             {{"1.3.6.1.2.1.31.1.1.1.18.5", SnmpValue{std::string("uplink")}}});
        REQUIRE(std::string(text.end() - 6, text.end()) == "uplink");
        REQUIRE(text[text.size() - 8] == 0x04);
    }
}

TEST_CASE("Response decoding", "[SnmpCodec]") {
    SECTION("Value types") {
        auto message = response(
            42, {varbind(SnmpOids::SYS_NAME, SnmpCodec::encodeOctetString("switch-01")),
                 varbind(SnmpOids::SYS_UPTIME, {0x43, 0x03, 0x89, 0x6C, 0x14}),
                 varbind(SnmpOids::SYS_OBJECT_ID, SnmpCodec::encodeOid("1.3.6.1.4.1.9.1.516")),
                 varbind("1.3.6.1.2.1.4.20.1.1.10.0.0.1", {0x40, 0x04, 0x0A, 0x00, 0x00, 0x01}),
                 varbind("1.3.6.1.2.1.2.2.1.6.1",
                         SnmpCodec::encodeOctetString(std::string("\x00\x1a\x2b\x3c\x4d\x5e", 6))),
                 varbind("1.3.6.1.4.1.99.1", SnmpCodec::encodeInteger(-5)),
                 varbind(SnmpOids::HR_PRINTER_STATUS, {0x81, 0x00})});

        auto result = SnmpCodec::decodeResponse(message, 42);
        REQUIRE(result.success);
        REQUIRE(result.version == SnmpVersion::V2c);
        REQUIRE(result.varbinds.size() == 7);

        REQUIRE(result.textOf(SnmpOids::SYS_NAME) == "switch-01");

        auto uptime = result.getVarBind(SnmpOids::SYS_UPTIME);
        REQUIRE(uptime->type == SnmpDataType::TimeTicks);
        REQUIRE(uptime->numeric() == 9006100);

        REQUIRE(result.textOf(SnmpOids::SYS_OBJECT_ID) == "1.3.6.1.4.1.9.1.516");
        REQUIRE(result.varbinds[3].value == "10.0.0.1");

        const auto& mac = result.varbinds[4].value;
        REQUIRE(mac.size() == 6);
        REQUIRE(mac[0] == '\x00');
        REQUIRE(mac[1] == '\x1a');

        REQUIRE(result.varbinds[5].intValue == -5);

        auto missing = result.getVarBind(SnmpOids::HR_PRINTER_STATUS);
        REQUIRE(missing->type == SnmpDataType::NoSuchInstance);
        REQUIRE(missing->isException());
        REQUIRE_FALSE(result.textOf(SnmpOids::HR_PRINTER_STATUS).has_value());
    }

    SECTION("Agent error status") {
        auto result = SnmpCodec::decodeResponse(
            response(7, {varbind(SnmpOids::SYS_NAME, SnmpCodec::encodeNull())}, 2, 1), 7);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorStatus == 2);
        REQUIRE(result.errorIndex == 1);
        REQUIRE(result.errorMessage == "No such name");
    }

    SECTION("Malformed input never throws") {
        auto message = response(7, {varbind(SnmpOids::SYS_NAME, SnmpCodec::encodeOctetString("x"))});

        auto mismatch = SnmpCodec::decodeResponse(message, 8);
        REQUIRE_FALSE(mismatch.success);
        REQUIRE(mismatch.errorMessage == "Parse error: Request id mismatch");

        auto truncated = message;
        truncated.resize(truncated.size() - 3);
        auto cut = SnmpCodec::decodeResponse(truncated, 7);
        REQUIRE_FALSE(cut.success);
        REQUIRE(cut.errorMessage.rfind("Parse error: ", 0) == 0);
        REQUIRE(cut.varbinds.empty());

        REQUIRE_FALSE(SnmpCodec::decodeResponse({}, 7).success);
        REQUIRE_FALSE(SnmpCodec::decodeResponse({0x04, 0x00}, 7).success);
    }

    SECTION("Requests are not responses") {
        auto request = SnmpCodec::encodeRequest(PduType::GetRequest, SnmpVersion::V2c, "public", 3,
                                                {{SnmpOids::SYS_NAME, std::nullopt}});
        auto result = SnmpCodec::decodeResponse(request, 3);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "Parse error: Expected GetResponse PDU");
    }
}

TEST_CASE("SNMP value helpers", "[SnmpTypes]") {
    SnmpVarBind counter;
    counter.type = SnmpDataType::Counter32;
    counter.counterValue = 1234;
    REQUIRE(counter.numeric() == 1234);
    REQUIRE_FALSE(counter.isException());

    SnmpVarBind null;
    null.type = SnmpDataType::Null;
    REQUIRE(null.isException());
    REQUIRE_FALSE(null.numeric().has_value());

    REQUIRE(snmpVersionFromString("1") == SnmpVersion::V1);
    REQUIRE(snmpVersionFromString("v3") == SnmpVersion::V2c);
    REQUIRE(snmpVersionToString(SnmpVersion::V2c) == "v2c");
    REQUIRE(SnmpCodec::errorStatusToString(17) == "Not writable");
}

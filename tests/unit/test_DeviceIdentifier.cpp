#include <catch2/catch_test_macros.hpp>

#include "Fakes.hpp"

#include "infrastructure/discovery/DeviceIdentifier.hpp"

using namespace fleetwatch::core;
using namespace fleetwatch::infra;
using namespace fleetwatch::testing;

namespace {

DiscoveredDevice hostWith(const std::string& ip, std::vector<uint16_t> ports) {
    DiscoveredDevice device;
    device.ip = ip;
    device.openPorts = std::move(ports);
    return device;
}

} // namespace

TEST_CASE("Identification candidates", "[DeviceIdentifier]") {
    REQUIRE(DeviceIdentifier::isCandidate(DeviceKind::Printer, hostWith("a", {631})));
    REQUIRE_FALSE(DeviceIdentifier::isCandidate(DeviceKind::Printer, hostWith("a", {80, 443})));
    REQUIRE(DeviceIdentifier::isCandidate(DeviceKind::MediaPlayer, hostWith("a", {8081})));
    REQUIRE_FALSE(DeviceIdentifier::isCandidate(DeviceKind::MediaPlayer, hostWith("a", {80})));
    REQUIRE(DeviceIdentifier::isCandidate(DeviceKind::Switch, hostWith("a", {22})));
    REQUIRE_FALSE(DeviceIdentifier::isCandidate(DeviceKind::Generic, hostWith("a", {22})));
}

TEST_CASE("Switch identification", "[DeviceIdentifier]") {
    auto snmp = std::make_shared<FakeSnmpService>();
    auto http = std::make_shared<FakeHttpClient>();
    DeviceIdentifier identifier(snmp, http);

    snmp->addValue("10.0.0.1", textBind(SnmpOids::SYS_DESCR, "Cisco IOS Software, C2960"));
    snmp->addValue("10.0.0.1", textBind(SnmpOids::SYS_NAME, "core-sw"));
    snmp->addValue("10.0.0.2", textBind(SnmpOids::SYS_DESCR, "HP LaserJet with Ethernet switch"));
    snmp->addValue("10.0.0.3", textBind(SnmpOids::SYS_DESCR, ""));

    SECTION("Accepted switch gets identity and vendor") {
        auto device = hostWith("10.0.0.1", {22});
        REQUIRE(identifier.identify(DeviceKind::Switch, device));
        REQUIRE(device.deviceKind == DeviceKind::Switch);
        REQUIRE(device.hostname == "core-sw");
        REQUIRE(device.modelInfo == "Cisco IOS Software, C2960");
        REQUIRE(device.vendor == "cisco");
        REQUIRE(snmp->lastConfig.community == "public");
        REQUIRE(snmp->lastConfig.timeoutMs == 2000);
    }

    SECTION("Ambiguous identity is rejected untouched") {
        auto device = hostWith("10.0.0.2", {22});
        REQUIRE_FALSE(identifier.identify(DeviceKind::Switch, device));
        REQUIRE_FALSE(device.deviceKind.has_value());
        REQUIRE_FALSE(device.hostname.has_value());
    }

    SECTION("Silent or empty agents are rejected") {
        auto silent = hostWith("10.0.0.99", {22});
        REQUIRE_FALSE(identifier.identify(DeviceKind::Switch, silent));
        auto empty = hostWith("10.0.0.3", {22});
        REQUIRE_FALSE(identifier.identify(DeviceKind::Switch, empty));
    }
}

TEST_CASE("Printer identification", "[DeviceIdentifier]") {
    auto snmp = std::make_shared<FakeSnmpService>();
    auto http = std::make_shared<FakeHttpClient>();
    DeviceIdentifier identifier(snmp, http);

    SECTION("SNMP identity and interface MAC are recorded") {
        snmp->addValue("10.0.0.5", textBind(SnmpOids::SYS_DESCR, "HP LaserJet 400"));
        snmp->addValue("10.0.0.5", textBind(SnmpOids::SYS_NAME, "prn-1"));
        snmp->addWalk("10.0.0.5", SnmpOids::IF_PHYS_ADDRESS,
                      {textBind("1.3.6.1.2.1.2.2.1.6.1", std::string("\x3c\x2a\xf4\x00\x00\x01", 6))});

        auto device = hostWith("10.0.0.5", {9100});
        REQUIRE(identifier.identify(DeviceKind::Printer, device));
        REQUIRE(device.deviceKind == DeviceKind::Printer);
        REQUIRE(device.modelInfo == "HP LaserJet 400");
        REQUIRE(device.hostname == "prn-1");
        REQUIRE(device.mac == "3c:2a:f4:00:00:01");
    }

    SECTION("A printer without SNMP is still a printer") {
        auto device = hostWith("10.0.0.6", {9100});
        REQUIRE(identifier.identify(DeviceKind::Printer, device));
        REQUIRE(device.deviceKind == DeviceKind::Printer);
        REQUIRE_FALSE(device.modelInfo.has_value());
        REQUIRE_FALSE(device.mac.has_value());
    }

    SECTION("A switch on the printer port is rejected") {
        snmp->addValue("10.0.0.7", textBind(SnmpOids::SYS_DESCR, "Catalyst 2960 switch"));
        auto device = hostWith("10.0.0.7", {9100});
        REQUIRE_FALSE(identifier.identify(DeviceKind::Printer, device));
    }
}

TEST_CASE("Media player identification", "[DeviceIdentifier]") {
    auto snmp = std::make_shared<FakeSnmpService>();
    auto http = std::make_shared<FakeHttpClient>();
    DeviceIdentifier identifier(snmp, http);

    SECTION("Main page markers") {
        http->respond("10.0.0.8", "/", 200,
                      "<title>iconBIT HD</title><a href=\"/status.xml\">s</a>");
        auto device = hostWith("10.0.0.8", {8081});
        REQUIRE(identifier.identify(DeviceKind::MediaPlayer, device));
        REQUIRE(device.deviceKind == DeviceKind::MediaPlayer);
        REQUIRE(device.vendor == "iconbit");
        REQUIRE(device.modelInfo == "iconBIT HD");
        REQUIRE(http->requests.front().port == 8081);
        REQUIRE(http->requests.front().basicAuth.has_value());
    }

    SECTION("Status document on an anonymous main page") {
        http->respond("10.0.0.9", "/", 200, "<html>files</html>");
        http->respond("10.0.0.9", "/status.xml", 200,
                      "<state>stop</state><file></file><position>0</position><duration>0</duration>");
        auto device = hostWith("10.0.0.9", {8081});
        REQUIRE(identifier.identify(DeviceKind::MediaPlayer, device));
        REQUIRE(device.modelInfo == "Iconbit");
    }

    SECTION("Now playing page") {
        http->respond("10.0.0.10", "/", 200, "<html>files</html>");
        http->respond("10.0.0.10", "/status.xml", 404);
        http->respond("10.0.0.10", "/now", 200, "<b>promo.mp4</b>");
        auto device = hostWith("10.0.0.10", {8081});
        REQUIRE(identifier.identify(DeviceKind::MediaPlayer, device));
    }

    SECTION("A bare 200 is not enough") {
        http->respond("10.0.0.11", "/", 200, "<html>It works!</html>");
        http->respond("10.0.0.11", "/status.xml", 404);
        http->respond("10.0.0.11", "/now", 404);
        auto device = hostWith("10.0.0.11", {8081});
        REQUIRE_FALSE(identifier.identify(DeviceKind::MediaPlayer, device));
        REQUIRE_FALSE(device.deviceKind.has_value());
    }

    SECTION("No main page") {
        auto device = hostWith("10.0.0.12", {8081});
        REQUIRE_FALSE(identifier.identify(DeviceKind::MediaPlayer, device));
        REQUIRE(http->requests.size() == 1);
    }
}

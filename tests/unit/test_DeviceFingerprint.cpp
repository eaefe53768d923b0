#include <catch2/catch_test_macros.hpp>

#include "core/types/DeviceFingerprint.hpp"

using namespace fleetwatch::core;

namespace {

SystemIdentity identity(std::optional<std::string> descr, std::optional<std::string> name = {}) {
    SystemIdentity id;
    id.sysDescr = std::move(descr);
    id.sysName = std::move(name);
    return id;
}

} // namespace

TEST_CASE("Switch classification", "[DeviceFingerprint]") {
    SECTION("Switch hints without printer hints") {
        REQUIRE(fingerprint::isSwitchIdentity(identity("Cisco IOS Software, C2960 Software")));
        REQUIRE(fingerprint::isSwitchIdentity(identity("D-Link DGS-1210-28", "access-1")));
        REQUIRE(fingerprint::isSwitchIdentity(identity(std::nullopt, "RouterOS CRS326")));
    }

    SECTION("Ambiguous identities are discarded") {
        REQUIRE_FALSE(fingerprint::isSwitchIdentity(identity("Ethernet MFP with switch module")));
    }

    SECTION("No hints at all") {
        REQUIRE_FALSE(fingerprint::isSwitchIdentity(identity("Linux 5.10 armv7l")));
        REQUIRE_FALSE(fingerprint::isSwitchIdentity(SystemIdentity{}));
    }
}

TEST_CASE("Printer classification", "[DeviceFingerprint]") {
    REQUIRE(fingerprint::isPrinterIdentity(identity("HP LaserJet Pro M404")));
    REQUIRE(fingerprint::isPrinterIdentity(identity("Ethernet MFP with switch module")));
    REQUIRE(fingerprint::isPrinterIdentity(SystemIdentity{}));
    REQUIRE_FALSE(fingerprint::isPrinterIdentity(identity("Catalyst 9300 switch")));
}

TEST_CASE("Vendor normalization", "[DeviceFingerprint]") {
    REQUIRE(fingerprint::normalizeVendor(std::string("Cisco IOS Software")) == "cisco");
    REQUIRE(fingerprint::normalizeVendor(std::string("DLINK DES-3200")) == "dlink");
    REQUIRE(fingerprint::normalizeVendor(std::string("MikroTik RouterOS")) == "mikrotik");
    REQUIRE(fingerprint::normalizeVendor(std::string("Aruba 2530")) == "aruba");
    REQUIRE(fingerprint::normalizeVendor(std::string("Netgear GS108")) == "generic");
    REQUIRE_FALSE(fingerprint::normalizeVendor(std::string()).has_value());
    REQUIRE_FALSE(fingerprint::normalizeVendor(std::nullopt).has_value());
}

TEST_CASE("Media player page markers", "[DeviceFingerprint]") {
    SECTION("Main page links") {
        REQUIRE(fingerprint::mainPageHasPlayerHints("<a href=\"/status.xml\">status</a>"));
        REQUIRE(fingerprint::mainPageHasPlayerHints("<a href=\"delete?file=a.mp4\">x</a>"));
        REQUIRE(fingerprint::mainPageHasPlayerHints("<h1>ICONBIT Toucan</h1>"));
        REQUIRE_FALSE(fingerprint::mainPageHasPlayerHints("<html>It works!</html>"));
    }

    SECTION("Markers past the scan window are ignored") {
        std::string body(6000, ' ');
        body += "status.xml";
        REQUIRE_FALSE(fingerprint::mainPageHasPlayerHints(body));
    }

    SECTION("Status document needs every tag") {
        REQUIRE(fingerprint::isPlayerStatusXml(
            "<status><state>play</state><file>a</file><position>1</position>"
            "<duration>9</duration></status>"));
        REQUIRE_FALSE(fingerprint::isPlayerStatusXml("<status><state>play</state></status>"));
    }

    SECTION("Now playing marker") {
        REQUIRE(fingerprint::hasNowPlayingMarker("Now: <B>clip.mp4</B>"));
        REQUIRE_FALSE(fingerprint::hasNowPlayingMarker("Now: nothing"));
    }

    SECTION("Title extraction") {
        REQUIRE(fingerprint::extractTitle("<TITLE>  iconBIT HDS4L </TITLE>") == "iconBIT HDS4L");
        REQUIRE_FALSE(fingerprint::extractTitle("<title> </title>").has_value());
        REQUIRE_FALSE(fingerprint::extractTitle("<p>none</p>").has_value());
    }
}

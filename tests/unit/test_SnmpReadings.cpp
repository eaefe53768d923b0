#include <catch2/catch_test_macros.hpp>

#include "Fakes.hpp"

#include "core/types/Errors.hpp"
#include "core/types/SnmpReadings.hpp"

using namespace fleetwatch::core;
using fleetwatch::testing::intBind;
using fleetwatch::testing::textBind;

TEST_CASE("OID helpers", "[SnmpReadings]") {
    REQUIRE(oidIndex("1.3.6.1.2.1.2.2.1.2.10101") == 10101);
    REQUIRE(oidIndex("7") == 7);
    REQUIRE_FALSE(oidIndex("1.3.6.x").has_value());
}

TEST_CASE("Uptime formatting", "[SnmpReadings]") {
    const int64_t ticks = (2 * 86400 + 3 * 3600 + 4 * 60 + 5) * 100;
    REQUIRE(formatUptimeCompact(ticks) == "2d 3h 4m");
    REQUIRE(formatUptimeCompact(5 * 60 * 100) == "5m");
    REQUIRE(formatUptimeCompact(3600 * 100) == "1h 0m");
    REQUIRE(formatUptimeFull(5 * 60 * 100) == "0d 0h 5m");
    REQUIRE(formatUptimeFull(-1) == "0d 0h 0m");
}

TEST_CASE("Printer readings", "[SnmpReadings]") {
    SECTION("Status codes") {
        REQUIRE(printerStatusFromCode(3) == "idle");
        REQUIRE(printerStatusFromCode(4) == "printing");
        REQUIRE(printerStatusFromCode(42) == "unknown");
    }

    SECTION("Toner colours") {
        REQUIRE(tonerColor("Black Toner Cartridge") == "black");
        REQUIRE(tonerColor("Toner Schwarz") == "black");
        REQUIRE(tonerColor("Cyan Cartridge HP 410A") == "cyan");
        REQUIRE_FALSE(tonerColor("Imaging Drum").has_value());
    }

    SECTION("Percentages") {
        REQUIRE(tonerPercent(50, 200) == 25);
        REQUIRE(tonerPercent(300, 200) == 100);
        REQUIRE_FALSE(tonerPercent(-3, 100).has_value());
        REQUIRE_FALSE(tonerPercent(10, 0).has_value());
    }

    SECTION("Supplies are paired by position") {
        auto toners = buildTonerLevels(
            {textBind("d.1", "Black Toner"), textBind("d.2", "Waste Toner Box")},
            {intBind("m.1", 1000)}, {intBind("c.1", 250), intBind("c.2", -3)});
        REQUIRE(toners.size() == 2);
        REQUIRE(toners[0].color == "black");
        REQUIRE(toners[0].levelPct == 25);
        REQUIRE(toners[0].maxCapacity == 1000);
        REQUIRE(toners[1].maxCapacity == 0);
        REQUIRE(toners[1].currentLevel == -3);
        REQUIRE_FALSE(toners[1].levelPct.has_value());
    }
}

TEST_CASE("Interface MAC selection", "[SnmpReadings]") {
    std::vector<SnmpVarBind> rows = {
        textBind("1.3.6.1.2.1.2.2.1.6.1", ""),
        textBind("1.3.6.1.2.1.2.2.1.6.2", std::string(6, '\0')),
        textBind("1.3.6.1.2.1.2.2.1.6.3", std::string("\x00\x11\x22\x33\x44\x55", 6)),
        textBind("1.3.6.1.2.1.2.2.1.6.4", std::string("\x66\x77\x88\x99\xaa\xbb", 6)),
    };
    REQUIRE(firstMacAddress(rows) == "00:11:22:33:44:55");
    REQUIRE_FALSE(firstMacAddress({}).has_value());
}

TEST_CASE("Port table assembly", "[SnmpReadings]") {
    PortTableColumns columns;
    columns.descr = {textBind("x.2", "Gi0/2"), textBind("x.1", "Gi0/1")};
    columns.alias = {textBind("a.1", "uplink")};
    columns.adminStatus = {intBind("s.1", 1), intBind("s.2", 2)};
    columns.operStatus = {intBind("o.1", 1), intBind("o.2", 7)};
    columns.speed = {intBind("v.1", 1000000000, SnmpDataType::Gauge32)};
    columns.pvid = {intBind("p.2", 20)};
    columns.poeAdmin = {intBind("e.1", 1), intBind("e.2", 2)};
    columns.poePower = {intBind("w.2", 15400)};

    auto ports = assemblePortTable(columns);
    REQUIRE(ports.size() == 2);

    const auto& first = ports[0];
    REQUIRE(first.port == "Gi0/1");
    REQUIRE(first.ifIndex == 1);
    REQUIRE(first.description == "uplink");
    REQUIRE(first.adminStatus == "up");
    REQUIRE(first.operStatus == "up");
    REQUIRE(first.speedMbps == 1000);
    REQUIRE_FALSE(first.vlan.has_value());
    REQUIRE(first.poeEnabled == true);

    const auto& second = ports[1];
    REQUIRE(second.adminStatus == "down");
    REQUIRE(second.operStatus == "lowerLayerDown");
    REQUIRE(second.vlan == 20);
    REQUIRE(second.poeEnabled == false);
    REQUIRE(second.poePowerW == 15.4);

    SECTION("Port names resolve to ifIndex") {
        REQUIRE(resolveIfIndex(ports, "gi0/2") == 2);
        REQUIRE(resolveIfIndex(ports, " 17 ") == 17);
        REQUIRE_THROWS_AS(resolveIfIndex(ports, "Fa0/9"), ProbeError);
    }
}

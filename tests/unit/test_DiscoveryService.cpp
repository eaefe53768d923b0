#include <catch2/catch_test_macros.hpp>

#include "Fakes.hpp"

#include "core/types/Errors.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/KeyValueStore.hpp"
#include "infrastructure/discovery/DiscoveryService.hpp"

#include <algorithm>

using namespace fleetwatch::core;
using namespace fleetwatch::infra;
using namespace fleetwatch::testing;

namespace {

struct DiscoveryFixture {
    DiscoveryFixture() {
        db = std::make_shared<Database>(":memory:");
        db->runMigrations();
        sessions = std::make_shared<DiscoverySessionStore>(std::make_shared<KeyValueStore>(db));
        scanner = std::make_shared<FakePortScanner>();
        snmp = std::make_shared<FakeSnmpService>();
        http = std::make_shared<FakeHttpClient>();
        neighbors = std::make_shared<FakeNeighborSource>();

        settings.subnet = "10.0.0.0/29";
        settings.ports = "9100,80";
        settings.tcpTimeoutSeconds = 0.5;
        settings.tcpRetries = 2;
        settings.tcpConcurrency = 32;

        service = std::make_unique<DiscoveryService>(
            sessions, scanner, std::make_shared<DeviceIdentifier>(snmp, http), neighbors,
            settings);
    }

    const DiscoveredDevice* find(const std::vector<DiscoveredDevice>& devices,
                                 const std::string& ip) const {
        auto it = std::find_if(devices.begin(), devices.end(),
                               [&ip](const DiscoveredDevice& d) { return d.ip == ip; });
        return it == devices.end() ? nullptr : &*it;
    }

    std::shared_ptr<Database> db;
    std::shared_ptr<DiscoverySessionStore> sessions;
    std::shared_ptr<FakePortScanner> scanner;
    std::shared_ptr<FakeSnmpService> snmp;
    std::shared_ptr<FakeHttpClient> http;
    std::shared_ptr<FakeNeighborSource> neighbors;
    ScanSettings settings;
    std::unique_ptr<DiscoveryService> service;
};

} // namespace

TEST_CASE("Printer discovery scan", "[DiscoveryService]") {
    DiscoveryFixture fx;
    fx.scanner->open("10.0.0.2", {9100});
    fx.scanner->open("10.0.0.3", {80});
    fx.scanner->open("10.0.0.4", {9100});
    fx.scanner->open("10.0.0.5", {9100, 80});
    fx.snmp->addValue("10.0.0.4", textBind(SnmpOids::SYS_DESCR, "Catalyst 2960 switch"));
    fx.neighbors->table = NeighborTable({{"10.0.0.2", "aa:bb:cc:00:00:02"}});

    ScanRequest request;
    request.kind = DeviceKind::Printer;
    request.knownDevices = {
        KnownDevice{"7", "10.0.0.9", std::string("AA:BB:CC:00:00:02")},
        KnownDevice{"8", "10.0.0.5", std::nullopt},
    };

    auto devices = fx.service->runScan(request);

    SECTION("Only identified printers are published") {
        REQUIRE(devices.size() == 2);
        REQUIRE(fx.find(devices, "10.0.0.3") == nullptr);
        REQUIRE(fx.find(devices, "10.0.0.4") == nullptr);
        REQUIRE(fx.service->results(DeviceKind::Printer) == devices);
    }

    SECTION("A known MAC at a new address is flagged as moved") {
        const auto* moved = fx.find(devices, "10.0.0.2");
        REQUIRE(moved != nullptr);
        REQUIRE(moved->mac == "aa:bb:cc:00:00:02");
        REQUIRE(moved->isKnown);
        REQUIRE(moved->knownDeviceId == "7");
        REQUIRE(moved->ipChanged);
        REQUIRE(moved->oldIp == "10.0.0.9");
    }

    SECTION("A device known by address is not moved") {
        const auto* known = fx.find(devices, "10.0.0.5");
        REQUIRE(known != nullptr);
        REQUIRE(known->isKnown);
        REQUIRE(known->knownDeviceId == "8");
        REQUIRE_FALSE(known->ipChanged);
        REQUIRE(known->openPorts == std::vector<uint16_t>{9100, 80});
    }

    SECTION("Final progress and released lock") {
        auto progress = fx.service->progress(DeviceKind::Printer);
        REQUIRE(progress.status == ScanStatus::Done);
        REQUIRE(progress.scanned == 6);
        REQUIRE(progress.total == 6);
        REQUIRE(progress.found == 2);
        REQUIRE_FALSE(fx.sessions->isLocked(DeviceKind::Printer));
    }

    SECTION("Scanner receives the configured tuning") {
        REQUIRE(fx.scanner->lastOptions.timeout == std::chrono::milliseconds(500));
        REQUIRE(fx.scanner->lastOptions.retries == 2);
        REQUIRE(fx.scanner->lastOptions.maxConcurrency == 32);
    }

    SECTION("Neighbor table is read once per scan") {
        REQUIRE(fx.neighbors->reads == 1);
    }
}

TEST_CASE("Discovery request overrides", "[DiscoveryService]") {
    DiscoveryFixture fx;
    fx.scanner->open("192.168.9.1", {22});
    fx.snmp->addValue("192.168.9.1", textBind(SnmpOids::SYS_DESCR, "MikroTik RouterOS CRS326"));
    fx.snmp->addValue("192.168.9.1", textBind(SnmpOids::SYS_NAME, "edge"));

    ScanRequest request;
    request.kind = DeviceKind::Switch;
    request.subnet = "192.168.9.0/30";
    request.ports = "22";

    auto devices = fx.service->runScan(request);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices.front().vendor == "mikrotik");
    REQUIRE(devices.front().hostname == "edge");
    REQUIRE(fx.service->progress(DeviceKind::Switch).total == 2);
}

TEST_CASE("Discovery rejections", "[DiscoveryService]") {
    DiscoveryFixture fx;

    SECTION("Second scan of the same kind conflicts") {
        REQUIRE(fx.sessions->tryLock(DeviceKind::Printer));
        ScanRequest request;
        request.kind = DeviceKind::Printer;
        REQUIRE_THROWS_AS(fx.service->runScan(request), LockConflict);
        REQUIRE(fx.sessions->isLocked(DeviceKind::Printer));
    }

    SECTION("Other kinds are unaffected by a held lock") {
        REQUIRE(fx.sessions->tryLock(DeviceKind::Printer));
        ScanRequest request;
        request.kind = DeviceKind::MediaPlayer;
        REQUIRE_NOTHROW(fx.service->runScan(request));
    }

    SECTION("Polling-only kinds cannot be discovered") {
        ScanRequest request;
        request.kind = DeviceKind::LabelPrinter;
        REQUIRE_THROWS_AS(fx.service->runScan(request), ConfigurationError);
    }

    SECTION("No usable hosts records an error and releases the lock") {
        ScanRequest request;
        request.kind = DeviceKind::Printer;
        request.subnet = "not-a-subnet";
        REQUIRE_THROWS_AS(fx.service->runScan(request), ConfigurationError);

        auto progress = fx.service->progress(DeviceKind::Printer);
        REQUIRE(progress.status == ScanStatus::Error);
        REQUIRE(progress.message == "No valid IPs to scan");
        REQUIRE_FALSE(fx.sessions->isLocked(DeviceKind::Printer));
    }

    SECTION("No usable ports") {
        ScanRequest request;
        request.kind = DeviceKind::Printer;
        request.ports = "0, 99999";
        REQUIRE_THROWS_AS(fx.service->runScan(request), ConfigurationError);
        REQUIRE(fx.service->progress(DeviceKind::Printer).message == "No valid ports configured");
    }

    SECTION("Host cap") {
        fx.settings.maxHosts = 4;
        DiscoveryService capped(fx.sessions, fx.scanner,
                                std::make_shared<DeviceIdentifier>(fx.snmp, fx.http),
                                fx.neighbors, fx.settings);
        ScanRequest request;
        request.kind = DeviceKind::Printer;
        REQUIRE_THROWS_AS(capped.runScan(request), SubnetLimitExceeded);
        REQUIRE(capped.progress(DeviceKind::Printer).status == ScanStatus::Error);
        REQUIRE_FALSE(fx.sessions->isLocked(DeviceKind::Printer));
    }
}

TEST_CASE("Background discovery scan", "[DiscoveryService]") {
    DiscoveryFixture fx;
    fx.scanner->open("10.0.0.6", {9100});

    ScanRequest request;
    request.kind = DeviceKind::Printer;
    auto future = fx.service->startScan(request);
    auto devices = future.get();

    REQUIRE(devices.size() == 1);
    REQUIRE(devices.front().ip == "10.0.0.6");
    REQUIRE(fx.service->progress(DeviceKind::Printer).status == ScanStatus::Done);
    REQUIRE_FALSE(fx.sessions->isLocked(DeviceKind::Printer));
}

TEST_CASE("Neighbor overlay", "[DiscoveryService]") {
    std::vector<DiscoveredDevice> devices(2);
    devices[0].ip = "10.1.0.1";
    devices[1].ip = "10.1.0.2";
    devices[1].mac = "00:00:00:00:00:aa";

    NeighborTable table({{"10.1.0.1", "00:00:00:00:00:bb"}, {"10.1.0.2", "00:00:00:00:00:cc"}});
    std::vector<KnownDevice> known = {KnownDevice{"1", "10.1.0.1", std::string("00:00:00:00:00:BB")}};

    DiscoveryService::applyNeighborTable(devices, table, known);

    REQUIRE(devices[0].mac == "00:00:00:00:00:bb");
    REQUIRE(devices[0].isKnown);
    REQUIRE_FALSE(devices[0].ipChanged);
    REQUIRE(devices[1].mac == "00:00:00:00:00:aa");
    REQUIRE_FALSE(devices[1].isKnown);
}

#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/PortScanner.hpp"

#include <asio.hpp>

#include <chrono>

using namespace fleetwatch::core;
using namespace fleetwatch::infra;
using namespace std::chrono_literals;

namespace {

/**
 * @brief A listening socket on an ephemeral loopback port; connects succeed without accept().
 */
class LoopbackListener {
public:
    LoopbackListener() : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
};

/**
 * @brief A listener whose accept queue is already full, so further SYNs are dropped.
 *
 * With a backlog of 0 the kernel queues one connection; the filler client
 * takes that slot and nothing is ever accepted.
 */
class SilentListener {
public:
    SilentListener() : acceptor_(io_), filler_(io_) {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.bind(endpoint);
        acceptor_.listen(0);
        filler_.connect(acceptor_.local_endpoint());
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket filler_;
};

/**
 * @brief A loopback port that was bound once and released, so connects are refused.
 */
uint16_t closedPort() {
    LoopbackListener listener;
    return listener.port();
}

} // namespace

TEST_CASE("Scan option clamping", "[PortScanner]") {
    ScanOptions options;
    options.timeout = 20ms;
    options.retries = -3;
    REQUIRE(options.effectiveTimeout() == 100ms);
    REQUIRE(options.effectiveRetries() == 0);
    REQUIRE(ScanOptions::backoffAfter(0) == 50ms);
    REQUIRE(ScanOptions::backoffAfter(2) == 150ms);

    HostScanResult host{"10.0.0.5", {9100, 80}};
    REQUIRE(host.found());
    REQUIRE(host.hasPort(80));
    REQUIRE_FALSE(host.hasPort(443));

    PortProbeResult probe;
    probe.state = ConnectState::TimedOut;
    REQUIRE(probe.stateToString() == "timeout");
}

TEST_CASE("TCP connect scanning on loopback", "[PortScanner]") {
    AsioContext context(2);
    context.start();
    PortScanner scanner(context);

    LoopbackListener listener;
    const uint16_t open = listener.port();
    const uint16_t closed = closedPort();

    SECTION("Single port checks") {
        REQUIRE(scanner.isPortOpen("127.0.0.1", open, 1000ms).get());
        REQUIRE_FALSE(scanner.isPortOpen("127.0.0.1", closed, 1000ms).get());
        REQUIRE_FALSE(scanner.isPortOpen("not-an-address", open, 1000ms).get());
    }

    SECTION("checkPorts returns only the open ports") {
        REQUIRE(scanner.checkPorts("127.0.0.1", {closed, open}, 1000ms).get() ==
                std::vector<uint16_t>{open});
        REQUIRE(scanner.checkPorts("127.0.0.1", {}, 1000ms).get().empty());
    }

    SECTION("scanHosts reports batches in host order") {
        ScanOptions options;
        options.timeout = 1000ms;
        options.retries = 1;
        options.maxConcurrency = 2;
        options.batchSize = 1;

        std::vector<BatchProgress> batches;
        auto found = scanner.scanHosts({"127.0.0.1", "bogus", "127.0.0.1"}, {open, closed}, options,
                                       [&](const BatchProgress& progress) { batches.push_back(progress); });

        REQUIRE(found.size() == 2);
        REQUIRE(found[0].address == "127.0.0.1");
        REQUIRE(found[0].openPorts == std::vector<uint16_t>{open});

        REQUIRE(batches.size() == 3);
        REQUIRE(batches[0].scanned == 1);
        REQUIRE(batches[0].found == 1);
        REQUIRE(batches[1].found == 1);
        REQUIRE(batches[2].scanned == 3);
        REQUIRE(batches[2].total == 3);
        REQUIRE(batches[2].found == 2);
    }

    SECTION("In-flight connects never exceed maxConcurrency across batches") {
        SilentListener silent;
        ScanOptions options;
        options.timeout = 100ms;
        options.retries = 0;
        options.maxConcurrency = 2;
        options.batchSize = 3;

        std::vector<std::string> hosts(6, "127.0.0.1");
        size_t batchCount = 0;
        auto found = scanner.scanHosts(hosts, {silent.port()}, options,
                                       [&](const BatchProgress&) { ++batchCount; });

        REQUIRE(found.empty());
        REQUIRE(batchCount == 2);
        REQUIRE(scanner.peakInFlight() == 2);
    }

    SECTION("Unanswered connects are retried with backoff") {
        SilentListener silent;
        const auto start = std::chrono::steady_clock::now();
        auto result = scanner.connectWithRetries("127.0.0.1", silent.port(), 100ms, 2).get();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.attempts == 3);
        REQUIRE(result.state == ConnectState::TimedOut);
        // three timeouts plus backoffs of 50 ms and 100 ms
        REQUIRE(elapsed >= 450ms);
        REQUIRE(elapsed < 5s);
    }

    SECTION("A refused port is retried too") {
        auto result = scanner.connectWithRetries("127.0.0.1", closed, 1000ms, 1).get();
        REQUIRE(result.attempts == 2);
        REQUIRE(result.state == ConnectState::Closed);
    }

    SECTION("Nothing to scan") {
        REQUIRE(scanner.scanHosts({}, {open}, ScanOptions{}, nullptr).empty());
        REQUIRE(scanner.scanHosts({"127.0.0.1"}, {}, ScanOptions{}, nullptr).empty());
    }

    context.stop();
}

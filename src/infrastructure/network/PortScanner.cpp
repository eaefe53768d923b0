#include "infrastructure/network/PortScanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <semaphore>

namespace fleetwatch::infra {

namespace {

/**
 * @brief Collects the results of a fixed number of probes and signals when all arrived.
 */
struct Countdown {
    explicit Countdown(size_t count) : remaining(count) {}

    std::atomic<size_t> remaining;
    std::promise<void> done;

    void arrive() {
        if (remaining.fetch_sub(1) == 1) {
            done.set_value();
        }
    }
};

} // namespace

PortScanner::PortScanner(AsioContext& context) : context_(context) {}

std::vector<core::HostScanResult> PortScanner::scanHosts(const std::vector<std::string>& hosts,
                                                         const std::vector<uint16_t>& ports,
                                                         const core::ScanOptions& options,
                                                         BatchCallback onBatch) {
    std::vector<core::HostScanResult> found;
    if (hosts.empty() || ports.empty()) {
        return found;
    }

    const size_t batchSize = std::max<size_t>(options.batchSize, 1);
    const auto concurrency = static_cast<std::ptrdiff_t>(std::max(options.maxConcurrency, 1));
    std::counting_semaphore<> limiter(concurrency);
    inFlight_ = 0;
    peakInFlight_ = 0;

    spdlog::info("Scanning {} hosts on {} ports (timeout {} ms, retries {}, concurrency {})",
                 hosts.size(), ports.size(), options.effectiveTimeout().count(),
                 options.effectiveRetries(), concurrency);

    core::BatchProgress progress;
    progress.total = hosts.size();

    for (size_t offset = 0; offset < hosts.size(); offset += batchSize) {
        auto end = std::min(offset + batchSize, hosts.size());
        std::vector<std::string> batch(hosts.begin() + static_cast<std::ptrdiff_t>(offset),
                                       hosts.begin() + static_cast<std::ptrdiff_t>(end));

        auto batchFound = scanBatch(batch, ports, options, limiter);
        for (auto& host : batchFound) {
            found.push_back(std::move(host));
        }

        progress.scanned = end;
        progress.found = found.size();
        if (onBatch) {
            onBatch(progress);
        }
    }

    spdlog::info("Scan finished: {} of {} hosts answered, at most {} connects in flight",
                 found.size(), hosts.size(), peakInFlight_.load());
    return found;
}

std::vector<core::HostScanResult> PortScanner::scanBatch(const std::vector<std::string>& batch,
                                                         const std::vector<uint16_t>& ports,
                                                         const core::ScanOptions& options,
                                                         std::counting_semaphore<>& limiter) {
    const size_t pairCount = batch.size() * ports.size();
    auto countdown = std::make_shared<Countdown>(pairCount);
    auto openFlags = std::make_shared<std::vector<std::atomic<bool>>>(pairCount);

    for (size_t h = 0; h < batch.size(); ++h) {
        for (size_t p = 0; p < ports.size(); ++p) {
            limiter.acquire();
            trackStarted();
            size_t slot = h * ports.size() + p;
            probeAsync(batch[h], ports[p], options.effectiveTimeout(), options.effectiveRetries(),
                       [this, countdown, openFlags, slot, &limiter](const core::PortProbeResult& result) {
                           (*openFlags)[slot].store(result.isOpen());
                           --inFlight_;
                           limiter.release();
                           countdown->arrive();
                       });
        }
    }

    countdown->done.get_future().wait();

    std::vector<core::HostScanResult> found;
    for (size_t h = 0; h < batch.size(); ++h) {
        core::HostScanResult host;
        host.address = batch[h];
        for (size_t p = 0; p < ports.size(); ++p) {
            if ((*openFlags)[h * ports.size() + p].load()) {
                host.openPorts.push_back(ports[p]);
            }
        }
        if (host.found()) {
            found.push_back(std::move(host));
        }
    }
    return found;
}

std::future<std::vector<uint16_t>> PortScanner::checkPorts(const std::string& address,
                                                           const std::vector<uint16_t>& ports,
                                                           std::chrono::milliseconds timeout) {
    struct Collector {
        std::mutex mutex;
        std::vector<uint16_t> open;
        std::promise<std::vector<uint16_t>> promise;
        size_t remaining{0};
    };

    auto collector = std::make_shared<Collector>();
    auto future = collector->promise.get_future();
    if (ports.empty()) {
        collector->promise.set_value({});
        return future;
    }
    collector->remaining = ports.size();

    for (uint16_t port : ports) {
        probeAsync(address, port, timeout, 0, [collector](const core::PortProbeResult& result) {
            std::lock_guard lock(collector->mutex);
            if (result.isOpen()) {
                collector->open.push_back(result.port);
            }
            if (--collector->remaining == 0) {
                std::sort(collector->open.begin(), collector->open.end());
                collector->promise.set_value(collector->open);
            }
        });
    }
    return future;
}

std::future<bool> PortScanner::isPortOpen(const std::string& address, uint16_t port,
                                          std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    probeAsync(address, port, timeout, 0, [promise](const core::PortProbeResult& result) {
        promise->set_value(result.isOpen());
    });
    return future;
}

std::future<core::PortProbeResult> PortScanner::connectWithRetries(const std::string& address,
                                                                   uint16_t port,
                                                                   std::chrono::milliseconds timeout,
                                                                   int retries) {
    auto promise = std::make_shared<std::promise<core::PortProbeResult>>();
    auto future = promise->get_future();
    probeAsync(address, port, timeout, std::max(retries, 0),
               [promise](const core::PortProbeResult& result) { promise->set_value(result); });
    return future;
}

void PortScanner::trackStarted() {
    size_t now = ++inFlight_;
    size_t peak = peakInFlight_.load();
    while (now > peak && !peakInFlight_.compare_exchange_weak(peak, now)) {
    }
}

void PortScanner::probeAsync(const std::string& address, uint16_t port,
                             std::chrono::milliseconds timeout, int retries, ProbeCallback onDone) {
    auto task = std::make_shared<ProbeTask>();
    task->result.address = address;
    task->result.port = port;
    task->timeout = timeout;
    task->retries = retries;
    task->onDone = std::move(onDone);

    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        spdlog::debug("Cannot probe {}:{}: {}", address, port, ec.message());
        task->result.state = core::ConnectState::Closed;
        context_.post([task]() { task->onDone(task->result); });
        return;
    }
    task->endpoint = asio::ip::tcp::endpoint(ip, port);
    attemptConnect(task);
}

void PortScanner::attemptConnect(std::shared_ptr<ProbeTask> task) {
    auto socket = std::make_shared<asio::ip::tcp::socket>(context_.getContext());
    auto timer = std::make_shared<asio::steady_timer>(context_.getContext());
    auto completed = std::make_shared<std::atomic<bool>>(false);

    timer->expires_after(task->timeout);
    timer->async_wait([this, task, socket, completed](const asio::error_code& ec) {
        if (ec || completed->exchange(true)) {
            return;
        }
        asio::error_code ignored;
        socket->close(ignored);
        onAttemptFinished(task, core::ConnectState::TimedOut);
    });

    socket->async_connect(task->endpoint,
                          [this, task, socket, timer, completed](const asio::error_code& ec) {
                              if (completed->exchange(true)) {
                                  return;
                              }
                              timer->cancel();
                              asio::error_code ignored;
                              socket->close(ignored);
                              onAttemptFinished(task, ec ? core::ConnectState::Closed
                                                         : core::ConnectState::Open);
                          });
}

void PortScanner::onAttemptFinished(std::shared_ptr<ProbeTask> task, core::ConnectState state) {
    int attempt = task->result.attempts++;
    task->result.state = state;

    if (state == core::ConnectState::Open || task->result.attempts > task->retries) {
        task->onDone(task->result);
        return;
    }

    auto backoff = std::make_shared<asio::steady_timer>(context_.getContext());
    backoff->expires_after(core::ScanOptions::backoffAfter(attempt));
    backoff->async_wait([this, task, backoff](const asio::error_code& ec) {
        if (ec) {
            task->onDone(task->result);
            return;
        }
        attemptConnect(task);
    });
}

} // namespace fleetwatch::infra

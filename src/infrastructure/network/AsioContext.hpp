#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief Thread pool around one asio::io_context.
 *
 * Application owns two: the I/O pool sized by `ioThreads` that drives
 * the port scanner, and a small pool for the control API. Single-threaded instances serialize SNMP exchanges, run the
 * discovery worker and back each poller WorkerPool.
 */
class AsioContext {
public:
    /**
     * @param threadCount Worker threads; 0 is treated as 1.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /// Idempotent.
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     *
     * Handlers still queued do not run until start() is called again.
     */
    void stop();

    asio::io_context& getContext() { return ioContext_; }

    bool isRunning() const { return running_.load(); }

    size_t threadCount() const { return threadCount_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace fleetwatch::infra

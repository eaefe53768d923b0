#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <exception>
#include <future>
#include <memory>
#include <type_traits>

namespace fleetwatch::infra {

/**
 * @brief Bounded pool for blocking poll tasks.
 *
 * Tasks run on their own threads, apart from the I/O pool, so a task may
 * block on scanner and SNMP futures.
 */
class WorkerPool {
public:
    /**
     * @param workers Thread count; 0 is treated as 1.
     */
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues @p task. Exceptions it throws surface from the future.
     */
    template <typename Task>
    auto submit(Task task) -> std::future<std::invoke_result_t<Task>> {
        using Result = std::invoke_result_t<Task>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();
        context_.post([promise, task = std::move(task)]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    task();
                    promise->set_value();
                } else {
                    promise->set_value(task());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        return future;
    }

    size_t size() const { return context_.threadCount(); }

private:
    AsioContext context_;
};

} // namespace fleetwatch::infra

#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace fleetwatch::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this]() { ioContext_.run(); });
    }

    spdlog::debug("Asio pool started ({} threads)", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("Asio pool stopped ({} threads)", threadCount_);
}

} // namespace fleetwatch::infra

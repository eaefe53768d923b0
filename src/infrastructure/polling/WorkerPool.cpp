#include "infrastructure/polling/WorkerPool.hpp"

namespace fleetwatch::infra {

WorkerPool::WorkerPool(size_t workers) : context_(workers) {
    context_.start();
}

WorkerPool::~WorkerPool() {
    context_.stop();
}

} // namespace fleetwatch::infra

#include "judge/worker_pool.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

worker_pool::slot::slot(worker_pool *pool)
    : pool(pool) {}

worker_pool::slot::slot(slot &&other) noexcept
    : pool(other.pool) {
    other.pool = nullptr;
}

worker_pool::slot &worker_pool::slot::operator=(slot &&other) noexcept {
    if (this != &other) {
        release();
        pool = other.pool;
        other.pool = nullptr;
    }
    return *this;
}

worker_pool::slot::~slot() {
    release();
}

void worker_pool::slot::release() {
    if (pool) {
        pool->give_back();
        pool = nullptr;
    }
}

worker_pool::worker_pool(size_t capacity)
    : total(capacity), free_slots(capacity) {
    if (capacity == 0)
        throw invalid_argument("Worker pool capacity should be positive");
}

worker_pool::slot worker_pool::acquire(chrono::milliseconds timeout) {
    unique_lock<mutex> mlock(mut);
    if (free_slots == 0)
        LOG(INFO) << "Worker pool saturated, waiting up to " << timeout.count() << "ms for a free slot";
    if (!cond.wait_for(mlock, timeout, [this] { return free_slots > 0; }))
        throw overloaded("No worker slot available within " + to_string(timeout.count()) + "ms");
    --free_slots;
    return slot(this);
}

size_t worker_pool::capacity() const {
    return total;
}

size_t worker_pool::available() const {
    unique_lock<mutex> mlock(mut);
    return free_slots;
}

void worker_pool::give_back() {
    unique_lock<mutex> mlock(mut);
    ++free_slots;
    mlock.unlock();
    cond.notify_one();
}

}  // namespace codejudge

#include "services/analysis/worker_pool.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("WorkerPool");
    return logger;
}
}  // anonymous namespace

WorkerPool::WorkerPool(unsigned int workerCount) {
    if (workerCount == 0) {
        workerCount = std::max(1U, std::thread::hardware_concurrency());
    }
    workers_.reserve(workerCount);
    for (unsigned int i = 0; i < workerCount; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
    getLogger()->debug("Started {} worker(s)", workerCount);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    available_.notify_one();
    return true;
}

void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            available_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            getLogger()->error("Worker task threw: {}", e.what());
        }
    }
}

}  // namespace dentescope::services

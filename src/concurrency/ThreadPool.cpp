#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace folio::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
    }

    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] { workerLoop(); });
}

void ThreadPool::workerLoop() {
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock lock(mutex);
            cv.wait(lock, [this] {
                return stopFlag.load() || !queue.empty();
            });

            if (stopFlag.load() && queue.empty()) break;

            task = std::move(queue.front());
            queue.pop();
        }

        if (!task) continue;

        busy_.fetch_add(1);
        try {
            (*task)();
        } catch (const std::exception& e) {
            // keep the worker alive; the task owns its own error reporting
            folio::log::Registry::folio()->error("[ThreadPool] Task threw: {}", e.what());
        } catch (...) {
            folio::log::Registry::folio()->error("[ThreadPool] Task threw a non-standard exception");
        }
        busy_.fetch_sub(1);
    }
}

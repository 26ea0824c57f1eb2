#include "thread_pool.hpp"

ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0)
        throw std::invalid_argument("ThreadPool needs at least one worker");

    workers.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i)
            workers.emplace_back([this]() { workerLoop(); });
    } catch (...) {
        // join the workers that did start before passing the failure on
        shutdown();
        throw;
    }
}

void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        // lock
        {
            std::unique_lock<std::mutex> lock(this->queue_mutex);
            this->condition.wait(lock, [this]() {
                return this->stop || !this->tasks.empty();
            });

            if (this->stop && this->tasks.empty())
                return;

            task = std::move(this->tasks.front());
            this->tasks.pop();
        }

        task(); // packaged_task keeps any exception in its future
    }
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop) return;
        stop = true;
    }
    condition.notify_all(); // Wake all threads
    for (std::thread &worker : workers)
        if (worker.joinable()) worker.join();
}

ThreadPool::~ThreadPool() {
    shutdown();
}

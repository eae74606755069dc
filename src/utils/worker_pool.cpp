#include "worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include "../error/gateway_error.hpp"

namespace wttp::concurrency {
    WorkerPool::WorkerPool(std::size_t num_workers, ThreadLauncher launcher) {
        if (num_workers == 0) {
            throw error::InvalidArgumentError("Worker pool needs at least one worker");
        }
        if (!launcher) {
            launcher = [](std::function<void()> body) { return std::thread(std::move(body)); };
        }

        workers_.reserve(num_workers);
        try {
            for (std::size_t i = 0; i < num_workers; ++i) {
                workers_.push_back(launcher([this] { work(); }));
            }
        } catch (const std::exception& e) {
            spdlog::warn("Worker pool started {} of {} workers: {}", workers_.size(), num_workers, e.what());
            // Workers already running must be joined before workers_ is destroyed.
            shutdown();
            throw;
        }
    }

    WorkerPool::~WorkerPool() { shutdown(); }

    void WorkerPool::shutdown() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t WorkerPool::size() const { return workers_.size(); }

    void WorkerPool::enqueue(std::function<void()> job) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw error::GatewayError("Cannot submit to a stopped worker pool");
            }
            jobs_.emplace(std::move(job));
        }

        condition_variable_.notify_one();
    }

    void WorkerPool::work() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_variable_.wait(lock, [this]() { return !jobs_.empty() || stop_; });

                if (stop_ && jobs_.empty()) {
                    return;
                }

                job = std::move(jobs_.front());
                jobs_.pop();
            }

            // packaged_task captures the task's exceptions into its future.
            job();
        }
    }
}  // namespace wttp::concurrency

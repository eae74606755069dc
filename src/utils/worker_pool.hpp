#ifndef WTTP_GATEWAY_WORKER_POOL_HPP
#define WTTP_GATEWAY_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace wttp::concurrency {
    // Fixed set of workers draining a FIFO queue. Destruction finishes queued work before joining.
    class WorkerPool {
       public:
        // Starts a thread running the given body. Defaults to std::thread.
        using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

        // If a worker fails to start, those already running are joined and the error is rethrown.
        explicit WorkerPool(std::size_t num_workers, ThreadLauncher launcher = {});

        ~WorkerPool();
        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        // Exceptions thrown by task surface from the returned future's get().
        template <typename F>
        std::future<std::invoke_result_t<F>> submit(F task) {
            using Result = std::invoke_result_t<F>;
            auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
            std::future<Result> future = packaged->get_future();
            enqueue([packaged]() { (*packaged)(); });
            return future;
        }

        [[nodiscard]] std::size_t size() const;

       private:
        void shutdown();
        void enqueue(std::function<void()> job);
        void work();

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> jobs_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        bool stop_ = false;
    };
}  // namespace wttp::concurrency

#endif

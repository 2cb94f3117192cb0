#pragma once

#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace wordsim::parallel {
    template <typename Func, typename... Args>
    concept VoidCallable = std::is_invocable_r_v<void, Func, Args...>;

    // One thread per pushed task. wait() (and the destructor) join every task pushed so far
    struct TaskQueue {
    private:
        std::vector<std::thread> threadPool;

    public:
        TaskQueue() noexcept = default;
        explicit TaskQueue(std::size_t initialCapacity) {
            threadPool.reserve(initialCapacity);
        }
        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;
        ~TaskQueue() { wait(); }

        template <typename Func, typename... Args>
            requires VoidCallable<Func, Args...>
        void push(Func&& func, Args&&... args) {
            threadPool.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
        }

        // Blocks local thread until all tasks finish
        void wait() {
            while (!threadPool.empty()) {
                auto thread = std::move(threadPool.back());
                threadPool.pop_back();
                thread.join();
            }
        }

        // Returns number of unjoined tasks
        std::size_t size() const noexcept {
            return threadPool.size();
        }
    };

    /*
    Splits [0, numJobs) into at most numThreads contiguous chunks of near-equal size (the first
    numJobs % numThreads chunks get one extra job) and pushes func(start, stop) for each non-empty
    chunk. Does not wait.
    */
    template <typename Func>
        requires VoidCallable<Func, std::size_t, std::size_t>
    void pushChunks(TaskQueue& queue, std::size_t numJobs, std::size_t numThreads, Func func) {
        if (numThreads == 0) numThreads = 1;
        const std::size_t baseWork = numJobs / numThreads;
        const std::size_t extraWork = numJobs % numThreads;

        std::size_t threadID = 0;
        for (std::size_t start = 0; start < numJobs; ++threadID) {
            const std::size_t stop = start + baseWork + static_cast<std::size_t>(threadID < extraWork);
            queue.push(func, start, stop);
            start = stop;
        }
    }
}

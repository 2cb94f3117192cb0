#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <utility>
#include <vector>

#include "../src/config.hpp"
#include "../src/parallelTaskQueue.hpp"

using wordsim::parallel::TaskQueue;

TEST_CASE("Parallel Task Queue: push() 1 thread sleep does not hang", "[parallelTaskQueue][parallel]") {
    TaskQueue queue(wordsim::config::HARDWARE_CONCURRENCY);

    auto start = std::chrono::steady_clock::now();
    queue.push([]() { std::this_thread::sleep_for(std::chrono::nanoseconds{5}); });
    queue.wait();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds{1});
    REQUIRE(queue.size() == 0);
}

TEST_CASE("Parallel Task Queue: push() 1 thread basic function", "[parallelTaskQueue][parallel]") {
    TaskQueue queue(wordsim::config::HARDWARE_CONCURRENCY);
    size_t x = 0;

    queue.push([&x]() { ++x; });
    queue.wait();
    REQUIRE(x == 1);
}

TEST_CASE("Parallel Task Queue: push() forwards arguments", "[parallelTaskQueue][parallel]") {
    TaskQueue queue;
    std::atomic<size_t> sum = 0;

    for (size_t i = 1; i <= 4; ++i) {
        queue.push([&sum](size_t a, size_t b) { sum.fetch_add(a * b); }, i, size_t{10});
    }
    REQUIRE(queue.size() == 4);
    queue.wait();
    REQUIRE(sum == 100);
}

TEST_CASE("Parallel Task Queue: destructor joins tasks", "[parallelTaskQueue][parallel]") {
    std::atomic<size_t> x = 0;
    {
        TaskQueue queue(wordsim::config::HARDWARE_CONCURRENCY);
        for (size_t i = 0; i < wordsim::config::HARDWARE_CONCURRENCY; ++i) {
            queue.push([&x]() { x.fetch_add(1); });
        }
    }
    REQUIRE(x == wordsim::config::HARDWARE_CONCURRENCY);
}

TEST_CASE("Parallel Task Queue: pushChunks() covers every job once", "[parallelTaskQueue][parallel]") {
    auto run = [](size_t numJobs, size_t numThreads) {
        TaskQueue queue(numThreads);
        std::vector<std::atomic<size_t>> hits(numJobs);
        std::vector<std::pair<size_t, size_t>> chunks;
        std::mutex mtx;

        wordsim::parallel::pushChunks(queue, numJobs, numThreads, [&](size_t start, size_t stop) {
            for (size_t i = start; i < stop; ++i) hits[i].fetch_add(1);
            std::lock_guard<std::mutex> lock(mtx);
            chunks.emplace_back(start, stop);
        });
        queue.wait();

        bool everyJobOnce = true;
        for (auto& h : hits) everyJobOnce = everyJobOnce && h.load() == 1;
        return std::make_pair(everyJobOnce, chunks);
    };

    SECTION("Uneven split") {
        auto [ok, chunks] = run(10, 4);
        REQUIRE(ok);
        REQUIRE(chunks.size() == 4);
        for (const auto& [start, stop] : chunks) {
            REQUIRE(stop - start >= 2);
            REQUIRE(stop - start <= 3);
        }
    }

    SECTION("Fewer jobs than threads") {
        auto [ok, chunks] = run(3, 8);
        REQUIRE(ok);
        REQUIRE(chunks.size() == 3);
    }

    SECTION("No jobs") {
        auto [ok, chunks] = run(0, 8);
        REQUIRE(ok);
        REQUIRE(chunks.empty());
    }

    SECTION("Zero threads runs one chunk") {
        auto [ok, chunks] = run(5, 0);
        REQUIRE(ok);
        REQUIRE(chunks.size() == 1);
    }
}

TEST_CASE("Parallel Task Queue: works with extreme thread contention", "[parallelTaskQueue][parallel]") {
    std::atomic<std::size_t> numThreadsRan = 0;
    std::atomic<std::size_t> counter = 0;
    constexpr std::size_t expectedThreadsRan = 1000;
    constexpr std::size_t incrementsPerThread = 10000;
    constexpr std::size_t expectedCounterValue = expectedThreadsRan * incrementsPerThread;

    TaskQueue queue(expectedThreadsRan);
    for (size_t threadID = 0; threadID < expectedThreadsRan; ++threadID) {
        queue.push([&numThreadsRan, &counter]() {
            for (size_t i = 0; i < incrementsPerThread; ++i) {
                counter.fetch_add(1);
            }
            numThreadsRan.fetch_add(1);
        });
    }
    queue.wait();
    REQUIRE(numThreadsRan == expectedThreadsRan);
    REQUIRE(counter == expectedCounterValue);
}

#include "../common/cancel_token.hpp"
#include "../common/logger.hpp"
#include "../common/periodic_task.hpp"
#include "../common/thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::seconds;

TEST(ThreadPool, ReturnsResultsThroughFutures) {
    ThreadPool pool(3, "test");
    auto a = pool.enqueue([](int x, int y) { return x * y; }, 6, 7);
    auto b = pool.enqueue([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(ThreadPool, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPool, ShutdownDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    ThreadPool pool(1);
    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&ran] {
            std::this_thread::sleep_for(milliseconds(1));
            ++ran;
        });
    }
    pool.shutdown();
    EXPECT_EQ(ran.load(), 20);
    EXPECT_THROW(pool.enqueue([] {}), std::runtime_error);
    pool.shutdown();
}

TEST(ThreadPool, ShutdownFromOwnWorkerIsRefused) {
    ThreadPool pool(2, "self");
    EXPECT_FALSE(pool.owns_current_thread());
    auto owned = pool.enqueue([&pool] { return pool.owns_current_thread(); });
    EXPECT_TRUE(owned.get());

    auto f = pool.enqueue([&pool] { pool.shutdown(); });
    EXPECT_THROW(f.get(), std::logic_error);
    EXPECT_EQ(pool.enqueue([] { return 5; }).get(), 5);
    pool.shutdown();
    EXPECT_EQ(pool.size(), 0u);
}

TEST(ThreadPool, TasksInheritTheCallersLogTag) {
    ThreadPool pool(2);
    std::string seen;
    {
        LogTag tag("owner 42");
        seen = pool.enqueue([] { return Logger::thread_tag(); }).get();
    }
    EXPECT_EQ(seen, "owner 42");
    EXPECT_EQ(pool.enqueue([] { return Logger::thread_tag(); }).get(), "");
}

TEST(LogTag, NestedScopesRestore) {
    EXPECT_EQ(Logger::thread_tag(), "");
    {
        LogTag outer("owner 1");
        {
            LogTag inner("owner 1/item 2");
            EXPECT_EQ(Logger::thread_tag(), "owner 1/item 2");
        }
        EXPECT_EQ(Logger::thread_tag(), "owner 1");
    }
    EXPECT_EQ(Logger::thread_tag(), "");
}

TEST(ParseLogLevel, KnownNamesAndFallback) {
    EXPECT_EQ(parse_log_level("debug", LogLevel::INFO), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("error", LogLevel::INFO), LogLevel::ERR);
    EXPECT_EQ(parse_log_level("loud", LogLevel::WARN), LogLevel::WARN);
}

TEST(CancelToken, SleepCompletesWhenNotCancelled) {
    CancelToken token;
    EXPECT_TRUE(token.sleep_for(milliseconds(5)));
    EXPECT_NO_THROW(token.throw_if_cancelled());
}

TEST(CancelToken, CancelWakesSleeper) {
    CancelToken token;
    auto start = std::chrono::steady_clock::now();
    auto sleeper = std::async(std::launch::async, [&token] {
        return token.sleep_for(seconds(30));
    });
    std::this_thread::sleep_for(milliseconds(20));
    token.cancel();
    EXPECT_FALSE(sleeper.get());
    EXPECT_LT(std::chrono::steady_clock::now() - start, seconds(10));
    EXPECT_TRUE(token.cancelled());
    EXPECT_THROW(token.throw_if_cancelled(), TransferCancelled);
    EXPECT_FALSE(token.sleep_for(seconds(30)));
}

TEST(PeriodicTask, RunsRepeatedlyAndStopsPromptly) {
    std::atomic<int> runs{0};
    PeriodicTask task("counter", milliseconds(5), [&runs] { ++runs; });
    task.start();
    EXPECT_TRUE(task.running());
    auto deadline = std::chrono::steady_clock::now() + seconds(5);
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    task.stop();
    EXPECT_GE(runs.load(), 3);
    EXPECT_FALSE(task.running());
}

TEST(PeriodicTask, SurvivesThrowingCallback) {
    std::atomic<int> runs{0};
    PeriodicTask task("thrower", milliseconds(2), [&runs] {
        ++runs;
        throw std::runtime_error("reap failed");
    });
    task.start();
    auto deadline = std::chrono::steady_clock::now() + seconds(5);
    while (runs.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    task.stop();
    EXPECT_GE(runs.load(), 2);
}

TEST(PeriodicTask, StopBeforeFirstIntervalSkipsCallback) {
    std::atomic<int> runs{0};
    PeriodicTask task("slow", seconds(60), [&runs] { ++runs; });
    task.start();
    auto start = std::chrono::steady_clock::now();
    task.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, seconds(5));
    EXPECT_EQ(runs.load(), 0);
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ThreadSystemTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "core/WorkerGroup.hpp"

using namespace DexVault;

// Global fixture for test setup and cleanup
struct ThreadTestFixture {
    ThreadTestFixture() {
        DEXVAULT_ENABLE_SILENT_MODE();
        ThreadSystem::Instance().init(4);
    }

    ~ThreadTestFixture() {
        if (!ThreadSystem::Instance().isShutdown()) {
            ThreadSystem::Instance().clean();
        }
    }
};

BOOST_GLOBAL_FIXTURE(ThreadTestFixture);

namespace {

// Polls until pred holds or the timeout elapses
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

BOOST_AUTO_TEST_SUITE(ThreadSystemTestSuite)

BOOST_AUTO_TEST_CASE(TestThreadPoolInitialization) {
    BOOST_CHECK(!ThreadSystem::Instance().isShutdown());
    BOOST_CHECK(ThreadSystem::Instance().isRunning());
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), 4u);

    // A second init keeps the running pool
    BOOST_CHECK(ThreadSystem::Instance().init(2));
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), 4u);
}

BOOST_AUTO_TEST_CASE(TestSimpleTaskExecution) {
    std::atomic<bool> taskExecuted{false};

    BOOST_CHECK(ThreadSystem::Instance().enqueueTask([&taskExecuted]() {
        taskExecuted = true;
    }));

    BOOST_CHECK(waitFor([&]() { return taskExecuted.load(); }));
}

BOOST_AUTO_TEST_CASE(TestTaskWithResult) {
    auto future = ThreadSystem::Instance().enqueueTaskWithResult([]() { return 151; },
                                                                 TaskPriority::High, "result");
    BOOST_CHECK_EQUAL(future.get(), 151);
}

BOOST_AUTO_TEST_CASE(TestExceptionPropagatesThroughFuture) {
    auto future = ThreadSystem::Instance().enqueueTaskWithResult([]() -> int {
        throw std::runtime_error("parse failure");
    });
    BOOST_CHECK_THROW(future.get(), std::runtime_error);

    // The worker that ran the throwing task keeps serving
    auto next = ThreadSystem::Instance().enqueueTaskWithResult([]() { return true; });
    BOOST_CHECK(next.get());
}

BOOST_AUTO_TEST_CASE(TestManyTasksAllRun) {
    const int numTasks = 500;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    futures.reserve(numTasks);

    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult([&counter]() {
            counter.fetch_add(1, std::memory_order_relaxed);
        }, i % 2 == 0 ? TaskPriority::Low : TaskPriority::Normal));
    }
    for (auto& future : futures) {
        future.wait();
    }
    BOOST_CHECK_EQUAL(counter.load(), numTasks);
}

BOOST_AUTO_TEST_CASE(TestTasksRunOnWorkerThreads) {
    std::mutex idsMutex;
    std::unordered_set<std::thread::id> ids;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 32; ++i) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            std::lock_guard<std::mutex> lock(idsMutex);
            ids.insert(std::this_thread::get_id());
        }));
    }
    for (auto& future : futures) {
        future.wait();
    }

    BOOST_CHECK(ids.count(std::this_thread::get_id()) == 0);
    BOOST_CHECK_LE(ids.size(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WorkerGroupTestSuite)

BOOST_AUTO_TEST_CASE(TestEveryIndexRunsOnce) {
    const size_t count = 200;
    std::vector<std::atomic<int>> hits(count);

    size_t finished = WorkerGroup::run(count, 8, [&hits](size_t i) {
        hits[i].fetch_add(1, std::memory_order_relaxed);
    });

    BOOST_CHECK_EQUAL(finished, count);
    for (size_t i = 0; i < count; ++i) {
        BOOST_CHECK_EQUAL(hits[i].load(), 1);
    }
}

BOOST_AUTO_TEST_CASE(TestZeroCountAndSingleWorker) {
    bool called = false;
    BOOST_CHECK_EQUAL(WorkerGroup::run(0, 4, [&called](size_t) { called = true; }), 0u);
    BOOST_CHECK(!called);

    // One worker means the caller does everything, in order
    std::vector<size_t> order;
    WorkerGroup::run(5, 1, [&order](size_t i) { order.push_back(i); });
    BOOST_CHECK_EQUAL(order.size(), 5u);
    for (size_t i = 0; i < order.size(); ++i) {
        BOOST_CHECK_EQUAL(order[i], i);
    }
}

BOOST_AUTO_TEST_CASE(TestConcurrencyIsBounded) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    WorkerGroup::run(40, 3, [&](size_t) {
        int now = active.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        active.fetch_sub(1);
    });

    BOOST_CHECK_LE(peak.load(), 3);
    BOOST_CHECK_EQUAL(active.load(), 0);
}

BOOST_AUTO_TEST_CASE(TestCancelStopsClaiming) {
    std::atomic<bool> cancel{false};
    std::atomic<size_t> ran{0};

    size_t finished = WorkerGroup::run(1000, 4, [&](size_t i) {
        ran.fetch_add(1);
        if (i == 10) {
            cancel.store(true);
        }
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }, &cancel);

    BOOST_CHECK_LT(finished, 1000u);
    BOOST_CHECK_EQUAL(finished, ran.load());
}

BOOST_AUTO_TEST_CASE(TestThrowingWorkCountsAsFinished) {
    std::atomic<int> ok{0};
    size_t finished = WorkerGroup::run(20, 4, [&ok](size_t i) {
        if (i % 5 == 0) {
            throw std::runtime_error("bad entry");
        }
        ok.fetch_add(1);
    });

    BOOST_CHECK_EQUAL(finished, 20u);
    BOOST_CHECK_EQUAL(ok.load(), 16);
}

BOOST_AUTO_TEST_CASE(TestNestedRunFromPoolTaskCompletes) {
    // Every pool thread runs a group; helpers cannot start until a
    // thread frees up, so each caller must be able to finish alone
    std::vector<std::future<size_t>> outer;
    for (int t = 0; t < 4; ++t) {
        outer.push_back(ThreadSystem::Instance().enqueueTaskWithResult([]() {
            std::atomic<size_t> sum{0};
            WorkerGroup::run(50, 8, [&sum](size_t i) { sum.fetch_add(i); });
            return sum.load();
        }));
    }
    for (auto& future : outer) {
        BOOST_REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        BOOST_CHECK_EQUAL(future.get(), 50u * 49u / 2u);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ThreadSystemShutdownSuite)

// Runs last: the pool cannot be restarted after clean()
BOOST_AUTO_TEST_CASE(TestShutdownRejectsWork) {
    ThreadSystem::Instance().clean();
    BOOST_CHECK(ThreadSystem::Instance().isShutdown());
    BOOST_CHECK(!ThreadSystem::Instance().enqueueTask([]() {}));
    BOOST_CHECK_THROW(ThreadSystem::Instance().enqueueTaskWithResult([]() { return 1; }),
                      std::runtime_error);
    BOOST_CHECK(!ThreadSystem::Instance().init());

    // WorkerGroup still completes on the calling thread
    std::atomic<int> ran{0};
    BOOST_CHECK_EQUAL(WorkerGroup::run(10, 4, [&ran](size_t) { ran.fetch_add(1); }), 10u);
    BOOST_CHECK_EQUAL(ran.load(), 10);
}

BOOST_AUTO_TEST_SUITE_END()

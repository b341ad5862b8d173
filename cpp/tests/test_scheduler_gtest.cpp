// ==============================================================================
// test_scheduler_gtest.cpp - Тесты пула рабочих потоков (GoogleTest)
// ==============================================================================

#include "salvage/scheduler.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace salvage::scan::test {

namespace {

/// Источник 0..count-1
WorkScheduler<int>::Source counting_source(int count) {
    auto next = std::make_shared<int>(0);
    return [next, count](int& out) {
        if (*next >= count) {
            return false;
        }
        out = (*next)++;
        return true;
    };
}

}  // namespace

TEST(SchedulerTest, ResolveWorkerCount_ZeroMeansHardware) {
    EXPECT_GE(resolve_worker_count(0), 1u);
    EXPECT_GE(resolve_worker_count(-5), 1u);
    EXPECT_EQ(resolve_worker_count(3), 3u);
}

TEST(SchedulerTest, ZeroWorkers_TreatedAsOne) {
    WorkScheduler<int> s(0);
    EXPECT_EQ(s.workers(), 1u);
}

TEST(SchedulerTest, EachItemProcessedExactlyOnce) {
    constexpr int kItems = 2000;
    std::vector<std::atomic<int>> seen(kItems);
    for (auto& s : seen) {
        s.store(0);
    }

    WorkScheduler<int> scheduler(8);
    auto stats = scheduler.run(counting_source(kItems),
                               [&](size_t, int& item) { seen[item].fetch_add(1); });

    EXPECT_EQ(stats.processed, static_cast<size_t>(kItems));
    EXPECT_EQ(stats.failed, 0u);
    for (int i = 0; i < kItems; ++i) {
        EXPECT_EQ(seen[i].load(), 1) << "item " << i;
    }
}

TEST(SchedulerTest, SingleWorker_RunsInCallingThread) {
    const auto caller = std::this_thread::get_id();
    bool same_thread = true;

    WorkScheduler<int> scheduler(1);
    scheduler.run(counting_source(10), [&](size_t worker, int&) {
        EXPECT_EQ(worker, 0u);
        same_thread = same_thread && std::this_thread::get_id() == caller;
    });

    EXPECT_TRUE(same_thread);
}

TEST(SchedulerTest, WorkerIdsWithinRange) {
    std::mutex mu;
    std::set<size_t> ids;

    WorkScheduler<int> scheduler(4);
    scheduler.run(counting_source(500), [&](size_t worker, int&) {
        std::lock_guard<std::mutex> lock(mu);
        ids.insert(worker);
    });

    ASSERT_FALSE(ids.empty());
    EXPECT_LT(*ids.rbegin(), 4u);
}

TEST(SchedulerTest, WorkerDone_CalledOncePerWorker) {
    std::atomic<int> done{0};

    WorkScheduler<int> scheduler(6);
    scheduler.on_worker_done([&](size_t) { done.fetch_add(1); });
    scheduler.run(counting_source(3), [](size_t, int&) {});

    EXPECT_EQ(done.load(), 6);
}

TEST(SchedulerTest, TaskFailure_ReportedAndOthersContinue) {
    std::mutex mu;
    std::vector<int> failed_items;
    std::atomic<int> ok{0};

    WorkScheduler<int> scheduler(4);
    scheduler.on_failure([&](const int& item, const std::string& what) {
        std::lock_guard<std::mutex> lock(mu);
        failed_items.push_back(item);
        EXPECT_EQ(what, "boom");
    });

    auto stats = scheduler.run(counting_source(100), [&](size_t, int& item) {
        if (item % 10 == 0) {
            throw std::runtime_error("boom");
        }
        ok.fetch_add(1);
    });

    EXPECT_EQ(stats.failed, 10u);
    EXPECT_EQ(stats.processed, 90u);
    EXPECT_EQ(ok.load(), 90);
    EXPECT_EQ(failed_items.size(), 10u);
}

TEST(SchedulerTest, NonStandardException_ReportedAsUnknown) {
    std::mutex mu;
    std::vector<std::string> messages;

    WorkScheduler<int> scheduler(2);
    scheduler.on_failure([&](const int&, const std::string& what) {
        std::lock_guard<std::mutex> lock(mu);
        messages.push_back(what);
    });

    auto stats = scheduler.run(counting_source(20), [](size_t, int& item) {
        if (item == 7) {
            throw 42;
        }
    });

    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.processed, 19u);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "unknown error");
}

TEST(SchedulerTest, Cancelled_NoNewWorkIssued) {
    CancellationToken cancel;
    cancel.cancel();
    std::atomic<int> pulled{0};

    WorkScheduler<int> scheduler(4, &cancel);
    auto stats = scheduler.run(
        [&](int& out) {
            pulled.fetch_add(1);
            out = 0;
            return true;
        },
        [](size_t, int&) {});

    EXPECT_EQ(pulled.load(), 0);
    EXPECT_EQ(stats.processed, 0u);
    EXPECT_TRUE(stats.cancelled);
}

TEST(SchedulerTest, CancelDuringRun_StopsEarly) {
    CancellationToken cancel;
    std::atomic<int> processed{0};

    WorkScheduler<int> scheduler(2, &cancel);
    auto stats = scheduler.run(counting_source(100000), [&](size_t, int&) {
        if (processed.fetch_add(1) == 50) {
            cancel.cancel();
        }
    });

    EXPECT_TRUE(stats.cancelled);
    EXPECT_LT(stats.processed, 100000u);
}

TEST(SchedulerTest, SourceException_RethrownAfterJoin) {
    int calls = 0;

    WorkScheduler<int> scheduler(3);
    EXPECT_THROW(scheduler.run(
                     [&](int& out) -> bool {
                         if (++calls > 5) {
                             throw std::runtime_error("source broke");
                         }
                         out = calls;
                         return true;
                     },
                     [](size_t, int&) {}),
                 std::runtime_error);
}

TEST(CancellationTokenTest, InitiallyNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());
    token.cancel();
    EXPECT_TRUE(token.cancelled());
}

}  // namespace salvage::scan::test

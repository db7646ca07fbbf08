/**
 * @file test_async_fallback_handler.cpp
 * @brief Unit tests for CWorkerPool and CAsyncFallbackHandler
 * @date 2025-12-01
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <vector>
#include <lap/core/CPath.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CMemory.hpp>
#include "CAsyncFallbackHandler.hpp"

using namespace lap::rds;
using namespace lap::core;

// ==================== Worker pool ====================

TEST(WorkerPoolTest, Submit_ReturnsResults) {
    CWorkerPool pool(3);
    EXPECT_EQ(pool.threadCount(), 3u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    CWorkerPool pool(0);
    EXPECT_EQ(pool.threadCount(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, ExceptionTravelsThroughFuture) {
    CWorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // the worker survives
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, DestructionDrainsQueue) {
    std::atomic<int> executed{0};
    {
        CWorkerPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.submit([&executed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++executed;
            });
        }
    }
    EXPECT_EQ(executed.load(), 50);
}

TEST(WorkerPoolTest, PendingTasks_CountsQueuedWork) {
    CWorkerPool pool(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    auto blocker = pool.submit([opened]() { opened.wait(); });
    std::vector<std::future<void>> queued;
    for (int i = 0; i < 3; ++i) {
        queued.push_back(pool.submit([]() {}));
    }

    // the blocker itself may still be queued
    EXPECT_GE(pool.pendingTasks(), 3u);
    EXPECT_LE(pool.pendingTasks(), 4u);

    gate.set_value();
    blocker.get();
    for (auto& task : queued) {
        task.get();
    }
    EXPECT_EQ(pool.pendingTasks(), 0u);
}

// ==================== Async handler ====================

class AsyncFallbackHandlerTest : public ::testing::Test {
protected:
    const String testDir = "/tmp/rds_async_handler_test";
    UniqueHandle<CFallbackHandler> handler;
    UniqueHandle<CAsyncFallbackHandler> asyncHandler;

    void SetUp() override {
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
        Path::createDirectory(testDir);
        handler = MakeUnique<CFallbackHandler>();
        asyncHandler = MakeUnique<CAsyncFallbackHandler>(*handler, 4);
    }

    void TearDown() override {
        asyncHandler.reset();
        handler.reset();
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
    }
};

TEST_F(AsyncFallbackHandlerTest, JSON_WriteThenRead) {
    String path = testDir + "/async.json";
    Json value = {{"async", true}, {"n", 5}};

    ASSERT_TRUE(asyncHandler->safeWriteJSON(value, path).get());

    auto loaded = asyncHandler->safeReadJSON(path).get();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, value);
}

TEST_F(AsyncFallbackHandlerTest, ArgumentsOutliveCaller) {
    std::future<Bool> pending;
    String path = testDir + "/scoped.jsonl";
    {
        Json records = Json::array({Json{{"id", 1}}, Json{{"id", 2}}});
        pending = asyncHandler->safeWriteJSONLines(records, path);
    }
    ASSERT_TRUE(pending.get());

    auto loaded = asyncHandler->safeReadJSONLines(path).get();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->size(), 2u);
}

TEST_F(AsyncFallbackHandlerTest, CSV_WriteThenRead) {
    String path = testDir + "/async.csv";
    Json records = Json::array({Json{{"k", "a"}}, Json{{"k", "b"}}});

    ASSERT_TRUE(asyncHandler->safeWriteCSV(records, path).get());

    auto rows = asyncHandler->safeReadCSV(path).get();
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[1].at("k"), "b");
}

TEST_F(AsyncFallbackHandlerTest, MissingFile_ResolvesToNothing) {
    EXPECT_FALSE(asyncHandler->safeReadJSON(testDir + "/absent.json").get().has_value());
    EXPECT_FALSE(asyncHandler->safeReadCSV(testDir + "/absent.csv").get().has_value());
}

TEST_F(AsyncFallbackHandlerTest, ManyPathsInParallel) {
    std::vector<std::future<Bool>> writes;
    for (int i = 0; i < 16; ++i) {
        writes.push_back(asyncHandler->safeWriteJSON(Json{{"i", i}}, testDir + "/f" + std::to_string(i) + ".json"));
    }
    for (auto& write : writes) {
        EXPECT_TRUE(write.get());
    }

    for (int i = 0; i < 16; ++i) {
        auto loaded = handler->safeReadJSON(testDir + "/f" + std::to_string(i) + ".json");
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ((*loaded)["i"], i);
    }
    EXPECT_EQ(asyncHandler->handler().getPerformanceStats().at(LAP_RDS_STAT_FILE_LOCKS), 16u);
}

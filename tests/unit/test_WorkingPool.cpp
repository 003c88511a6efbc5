#include <gtest/gtest.h>
#include "pool/WorkingPool.hpp"
#include "TestPools.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace wh::pool;
using namespace wh::concurrency;
using wh::test::waitUntil;

class WorkingPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<WorkingPool> pool_ = std::make_shared<WorkingPool>("test", 2, 16);
    std::shared_ptr<WaitGroup> tracker_ = std::make_shared<WaitGroup>();
    std::shared_ptr<Context> ctx_;
    Context::CancelFunc cancel_;
    std::thread runner_;

    void startPool() {
        auto [ctx, cancel] = Context::withCancel(Context::background());
        ctx_ = ctx;
        cancel_ = cancel;
        tracker_->add();
        runner_ = std::thread([pool = pool_, ctx = ctx_, tracker = tracker_] { pool->start(ctx, tracker); });
    }

    void stopPool() {
        if (cancel_) cancel_();
        if (runner_.joinable()) runner_.join();
    }

    void TearDown() override { stopPool(); }

    static JobPayload job(const std::string& type, const unsigned int maxRetries = 0) {
        JobPayload j;
        j.job_id = newJobId();
        j.type = type;
        j.max_retries = maxRetries;
        return j;
    }
};

TEST_F(WorkingPoolTest, QueueNames_DeriveFromBase) {
    EXPECT_EQ(pool_->name(), "test");
    EXPECT_EQ(pool_->queueName(), "test:pending");
    EXPECT_EQ(pool_->deadLetterQueueName(), "test:dlq");
    EXPECT_EQ(pool_->numWorkers(), 2u);
}

TEST(WorkingPoolConstructionTest, ZeroWorkers_BecomesOne) {
    const WorkingPool pool("solo", 0);
    EXPECT_EQ(pool.numWorkers(), 1u);
}

TEST_F(WorkingPoolTest, Dispatch_RunsRegisteredHandlerWithParams) {
    std::mutex mutex;
    std::multiset<int> seen;
    pool_->registerJob("record", [&](const nlohmann::json& params) {
        std::scoped_lock lock(mutex);
        seen.insert(params.at("n").get<int>());
    });

    startPool();
    for (int i = 0; i < 5; ++i) {
        auto j = job("record");
        j.params = {{"n", i}};
        pool_->submitJob(j);
    }

    ASSERT_TRUE(waitUntil([&] { return pool_->completedCount() == 5; }));
    std::scoped_lock lock(mutex);
    EXPECT_EQ(seen, (std::multiset<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(pool_->failedCount(), 0u);
}

TEST_F(WorkingPoolTest, FailingJob_IsRetriedThenDeadLettered) {
    std::atomic<int> attempts{0};
    pool_->registerJob("flaky", [&](const nlohmann::json&) {
        ++attempts;
        throw std::runtime_error("always fails");
    });

    startPool();
    pool_->submitJob(job("flaky", 2));

    ASSERT_TRUE(waitUntil([&] { return pool_->deadLetters().size() == 1; }));
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(pool_->failedCount(), 3u);

    const auto dead = pool_->deadLetters().front();
    EXPECT_EQ(dead.type, "flaky");
    EXPECT_EQ(dead.retry_count, 2u);
}

TEST_F(WorkingPoolTest, FailingJob_SucceedsOnRetry) {
    std::atomic<int> attempts{0};
    pool_->registerJob("second-time-lucky", [&](const nlohmann::json&) {
        if (++attempts == 1) throw std::runtime_error("first attempt fails");
    });

    startPool();
    pool_->submitJob(job("second-time-lucky", 3));

    ASSERT_TRUE(waitUntil([&] { return pool_->completedCount() == 1; }));
    EXPECT_EQ(attempts, 2);
    EXPECT_TRUE(pool_->deadLetters().empty());
}

TEST_F(WorkingPoolTest, UnknownJobType_IsDeadLettered) {
    startPool();
    pool_->submitJob(job("nobody-handles-this", 1));

    ASSERT_TRUE(waitUntil([&] { return pool_->deadLetters().size() == 1; }));
    EXPECT_EQ(pool_->completedCount(), 0u);
}

TEST_F(WorkingPoolTest, Start_ReturnsOnCancelAndReleasesTracker) {
    startPool();
    ASSERT_TRUE(waitUntil([&] { return pool_->isRunning(); }));

    stopPool();
    EXPECT_FALSE(pool_->isRunning());
    EXPECT_EQ(tracker_->count(), 0);
}

TEST_F(WorkingPoolTest, PendingJobs_SurviveRestart) {
    std::atomic<int> ran{0};
    pool_->registerJob("count", [&](const nlohmann::json&) { ++ran; });

    pool_->submitJob(job("count"));
    pool_->submitJob(job("count"));
    EXPECT_EQ(pool_->pendingCount(), 2u);

    startPool();
    ASSERT_TRUE(waitUntil([&] { return ran == 2; }));
    stopPool();

    ASSERT_TRUE(pool_->trySubmitJob(job("count")));
    EXPECT_EQ(pool_->pendingCount(), 1u);

    startPool();
    ASSERT_TRUE(waitUntil([&] { return ran == 3; }));
}

TEST_F(WorkingPoolTest, SubmitWithContext_ReturnsFalseWhenFullAndCancelled) {
    WorkingPool pool("small", 1, 1);
    ASSERT_TRUE(pool.trySubmitJob(job("x")));
    EXPECT_FALSE(pool.trySubmitJob(job("y")));

    const auto cancelled = Context::background();
    cancelled->cancel();
    EXPECT_FALSE(pool.submitJob(job("z"), *cancelled));
}

TEST(WorkingPoolRateLimitTest, Dispatch_RespectsCallsPerSecond) {
    auto pool = std::make_shared<WorkingPool>("limited", 4, 16, 20.0, 1);
    std::atomic<int> ran{0};
    pool->registerJob("tick", [&](const nlohmann::json&) { ++ran; });

    for (int i = 0; i < 6; ++i) {
        JobPayload j;
        j.job_id = newJobId();
        j.type = "tick";
        pool->submitJob(j);
    }

    auto [ctx, cancel] = Context::withCancel(Context::background());
    auto tracker = std::make_shared<WaitGroup>();
    tracker->add();

    const auto begin = std::chrono::steady_clock::now();
    std::thread runner([pool, ctx = ctx, tracker] { pool->start(ctx, tracker); });
    ASSERT_TRUE(waitUntil([&] { return ran == 6; }, std::chrono::seconds(5)));
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    cancel();
    runner.join();

    // one free token, five more at 50ms apart, however many workers compete
    EXPECT_GE(elapsed, std::chrono::milliseconds(240));
    EXPECT_EQ(pool->limiter().rate(), 20.0);
}

TEST(WorkingPoolRateLimitTest, CancelWhileThrottled_KeepsJobPending) {
    auto pool = std::make_shared<WorkingPool>("throttled", 1, 16, 0.2, 1);
    std::atomic<int> ran{0};
    pool->registerJob("tick", [&](const nlohmann::json&) { ++ran; });

    for (int i = 0; i < 2; ++i) {
        JobPayload j;
        j.type = "tick";
        pool->submitJob(j);
    }

    auto [ctx, cancel] = Context::withCancel(Context::background());
    auto tracker = std::make_shared<WaitGroup>();
    tracker->add();
    std::thread runner([pool, ctx = ctx, tracker] { pool->start(ctx, tracker); });

    ASSERT_TRUE(waitUntil([&] { return ran == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    cancel();
    runner.join();

    EXPECT_EQ(ran, 1);
    EXPECT_EQ(pool->pendingCount(), 1u);
    EXPECT_TRUE(pool->deadLetters().empty());
}

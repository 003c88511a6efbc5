#include <gtest/gtest.h>
#include "pool/ScheduleStore.hpp"
#include "pool/Scheduler.hpp"
#include "pool/WorkingPool.hpp"
#include "util/paths.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace wh::pool;
using namespace std::chrono_literals;

class ScheduleStoreTest : public ::testing::Test {
protected:
    fs::path dir_;
    fs::path file_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = wh::paths::getTestLogPath() / "schedules" / info->name();
        fs::remove_all(dir_);
        file_ = dir_ / "nested" / "schedules.json";
    }

    void TearDown() override { fs::remove_all(dir_); }

    static ScheduleRecord record(const std::string& name, const std::string& interval = "24h") {
        JobPayload job;
        job.type = "log";
        job.params = {{"message", name}};
        job.run_now = true;
        return {name, interval, "DailyPool", {job}};
    }
};

TEST_F(ScheduleStoreTest, EnsureExists_CreatesEmptyList) {
    const ScheduleStore store(file_);
    store.ensureExists();

    ASSERT_TRUE(fs::exists(file_));
    EXPECT_TRUE(store.load().empty());
}

TEST_F(ScheduleStoreTest, EnsureExists_LeavesExistingFileAlone) {
    const ScheduleStore store(file_);
    store.add(record("keep"));
    store.ensureExists();
    EXPECT_EQ(store.load().size(), 1u);
}

TEST_F(ScheduleStoreTest, Add_AppendsAndReplacesByName) {
    const ScheduleStore store(file_);
    store.add(record("A"));
    store.add(record("B"));
    store.add(record("A", "1h"));

    const auto records = store.load();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "A");
    EXPECT_EQ(records[0].interval, "1h");
    EXPECT_EQ(records[1].name, "B");
    ASSERT_EQ(records[1].jobs.size(), 1u);
    EXPECT_EQ(records[1].jobs[0].params.at("message"), "B");
    EXPECT_TRUE(records[1].jobs[0].run_now);
}

TEST_F(ScheduleStoreTest, Remove_DropsRecord) {
    const ScheduleStore store(file_);
    store.add(record("A"));
    store.add(record("B"));
    store.remove("A");

    const auto records = store.load();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "B");
}

TEST_F(ScheduleStoreTest, Remove_UnknownNameThrows) {
    const ScheduleStore store(file_);
    store.ensureExists();
    EXPECT_THROW(store.remove("ghost"), std::runtime_error);
}

TEST_F(ScheduleStoreTest, Load_MissingFileThrows) {
    const ScheduleStore store(file_);
    EXPECT_THROW((void)store.load(), std::runtime_error);
}

TEST_F(ScheduleStoreTest, Load_MalformedFileThrows) {
    fs::create_directories(file_.parent_path());
    std::ofstream(file_) << "[{\"name\": \"broken\"";

    const ScheduleStore store(file_);
    EXPECT_THROW((void)store.load(), std::runtime_error);
}

TEST_F(ScheduleStoreTest, Load_ReadsHandWrittenFile) {
    fs::create_directories(file_.parent_path());
    std::ofstream(file_) << R"([
  {
    "name": "DailyScheduler",
    "interval": "24h",
    "pool_name": "DailyPool",
    "jobs": [ { "type": "log", "params": { "message": "hello" }, "one_time": true } ]
  }
])";

    const auto records = ScheduleStore(file_).load();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pool_name, "DailyPool");
    ASSERT_EQ(records[0].jobs.size(), 1u);
    EXPECT_TRUE(records[0].jobs[0].one_time);
    EXPECT_FALSE(records[0].jobs[0].run_now);
}

TEST(MakeSchedulerTest, BuildsSchedulerFromRecord) {
    const auto target = std::make_shared<WorkingPool>("DailyPool", 1);
    JobPayload job;
    job.type = "log";
    const ScheduleRecord rec{"Every90", "1h30m", "DailyPool", {job, job}};

    const auto sched = makeScheduler(rec, target);
    EXPECT_EQ(sched->name(), "Every90");
    EXPECT_EQ(sched->interval(), 90min);
    EXPECT_EQ(sched->jobs().size(), 2u);
}

TEST(MakeSchedulerTest, InvalidIntervalThrows) {
    const auto target = std::make_shared<WorkingPool>("DailyPool", 1);
    EXPECT_THROW(makeScheduler({"bad", "soon", "DailyPool", {}}, target), std::invalid_argument);
    EXPECT_THROW(makeScheduler({"zero", "0", "DailyPool", {}}, target), std::invalid_argument);
}

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "selfupdate/update/update_scheduler.hpp"
#include "selfupdate/util/json_utils.hpp"
#include "testing.hpp"

#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace selfupdate {
namespace {

using namespace std::chrono_literals;

TimePoint LocalTime(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class FakeClock {
  public:
    explicit FakeClock(TimePoint start) : now_(start) {}

    TimePoint Now() const {
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }

    void Advance(std::chrono::seconds d) {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += d;
    }

  private:
    mutable std::mutex mu_;
    TimePoint now_;
};

// Holds every install until Release() is called.
class BlockingExecutor final : public IUpdateExecutor {
  public:
    Result DownloadAndInstallUpdate(const std::string& version, InstallResult& out) override {
        std::unique_lock<std::mutex> lk(mu_);
        ++entered_;
        cv_.notify_all();
        cv_.wait(lk, [this] { return released_; });
        out.new_version = version;
        return Result::Ok();
    }

    void WaitEntered() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return entered_ > 0; });
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            released_ = true;
        }
        cv_.notify_all();
    }

  private:
    std::mutex mu_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool released_ = false;
};

class ThrowingExecutor final : public IUpdateExecutor {
  public:
    Result DownloadAndInstallUpdate(const std::string&, InstallResult&) override {
        throw std::runtime_error("disk on fire");
    }
};

class UpdateSchedulerTest : public ::testing::Test {
  protected:
    UpdateScheduler::Options SchedulerOptions() {
        UpdateScheduler::Options opt;
        opt.sweep_interval = 10ms;
        opt.retry_delay = kRetryDelay;
        opt.clock = [this] { return clock.Now(); };
        return opt;
    }

    ScheduledUpdate MustSchedule(UpdateScheduler& s,
                                 const std::string& version,
                                 TimePoint when,
                                 const ScheduleOptions& options = {}) {
        ScheduledUpdate task;
        auto r = s.ScheduleUpdate(version, when, options, task);
        EXPECT_TRUE(r.is_ok()) << r.msg;
        return task;
    }

    ScheduledUpdate Get(const UpdateScheduler& s, const std::string& id) {
        auto task = s.GetScheduledUpdate(id);
        EXPECT_TRUE(task.has_value()) << id;
        return task.value_or(ScheduledUpdate{});
    }

    static constexpr std::chrono::seconds kRetryDelay{600};
    const TimePoint kStart = LocalTime(2025, 3, 12, 0, 0);
    FakeClock clock{kStart};
    testutil::FakeExecutor executor;
    testutil::TemporaryDirectory temp_dir;
};

TEST_F(UpdateSchedulerTest, RejectsInvalidRequests) {
    UpdateScheduler s(executor, SchedulerOptions());
    ScheduledUpdate task;

    EXPECT_EQ(s.ScheduleUpdate("", kStart, {}, task).err, EINVAL);

    ScheduleOptions negative;
    negative.max_retries = -1;
    EXPECT_FALSE(s.ScheduleUpdate("v1.1.0", kStart, negative, task).is_ok());

    ScheduleOptions bad_cron;
    bad_cron.cron_expression = "*/5 * * * *";
    auto r = s.ScheduleUpdate("v1.1.0", kStart, bad_cron, task);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "invalid cron expression: */5 * * * *");

    EXPECT_TRUE(s.GetScheduledUpdates().empty());
}

TEST_F(UpdateSchedulerTest, RunsDueTasksOnly) {
    UpdateScheduler s(executor, SchedulerOptions());
    const auto now = MustSchedule(s, "v1.1.0", kStart);
    const auto later = MustSchedule(s, "v1.2.0", kStart + 1h);

    EXPECT_TRUE(now.id.starts_with("update_v1.1.0_"));
    EXPECT_NE(now.id, later.id);
    EXPECT_FALSE(now.is_recurring);

    EXPECT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();

    EXPECT_EQ(Get(s, now.id).status, ScheduleStatus::kCompleted);
    EXPECT_EQ(Get(s, later.id).status, ScheduleStatus::kPending);
    EXPECT_EQ(executor.Calls(), std::vector<std::string>{"v1.1.0"});

    auto pending = s.GetPendingUpdates();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, later.id);
}

TEST_F(UpdateSchedulerTest, DailyTaskSchedulesNextRun) {
    UpdateScheduler s(executor, SchedulerOptions());
    ScheduleOptions options;
    options.cron_expression = "@daily";
    options.auto_confirm = true;
    options.metadata["source"] = "cli";
    const auto first = MustSchedule(s, "v1.1.0", kStart, options);
    EXPECT_TRUE(first.is_recurring);

    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();

    EXPECT_EQ(Get(s, first.id).status, ScheduleStatus::kCompleted);

    auto pending = s.GetPendingUpdates();
    ASSERT_EQ(pending.size(), 1u);
    const auto& next = pending[0];
    EXPECT_NE(next.id, first.id);
    EXPECT_EQ(next.scheduled_time, LocalTime(2025, 3, 13, 0, 0));
    EXPECT_TRUE(next.is_recurring);
    EXPECT_TRUE(next.auto_confirm);
    EXPECT_EQ(next.retry_count, 0);
    EXPECT_EQ(next.cron_expression, "@daily");
    EXPECT_EQ(next.metadata.at("source"), "cli");
    EXPECT_EQ(next.metadata.at("previous_task"), first.id);

    // Not due until the clock reaches the next midnight.
    EXPECT_EQ(s.SweepOnce(), 0u);
    clock.Advance(24h);
    EXPECT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();
    EXPECT_EQ(executor.Calls().size(), 2u);
}

TEST_F(UpdateSchedulerTest, FailedTaskRetriesThenGivesUp) {
    executor.script = {false, false, false};
    UpdateScheduler s(executor, SchedulerOptions());
    ScheduleOptions options;
    options.max_retries = 3;
    const auto task = MustSchedule(s, "v1.1.0", kStart, options);

    for (int attempt = 1; attempt <= 2; ++attempt) {
        ASSERT_EQ(s.SweepOnce(), 1u) << "attempt " << attempt;
        s.WaitForIdle();

        const auto t = Get(s, task.id);
        EXPECT_EQ(t.status, ScheduleStatus::kPending);
        EXPECT_EQ(t.retry_count, attempt);
        EXPECT_EQ(t.scheduled_time, clock.Now() + kRetryDelay);
        EXPECT_EQ(t.last_error, "download failed: mirror unavailable");

        EXPECT_EQ(s.SweepOnce(), 0u);
        clock.Advance(kRetryDelay);
    }

    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();
    const auto t = Get(s, task.id);
    EXPECT_EQ(t.status, ScheduleStatus::kFailed);
    EXPECT_EQ(t.retry_count, 3);
    EXPECT_EQ(t.last_error, "download failed: mirror unavailable");

    clock.Advance(kRetryDelay);
    EXPECT_EQ(s.SweepOnce(), 0u);
    EXPECT_EQ(executor.Calls().size(), 3u);
}

TEST_F(UpdateSchedulerTest, RetrySuccessClearsError) {
    executor.script = {false, true};
    UpdateScheduler s(executor, SchedulerOptions());
    const auto task = MustSchedule(s, "v1.1.0", kStart);

    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();
    clock.Advance(kRetryDelay);
    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();

    const auto t = Get(s, task.id);
    EXPECT_EQ(t.status, ScheduleStatus::kCompleted);
    EXPECT_EQ(t.retry_count, 1);
    EXPECT_TRUE(t.last_error.empty());
}

TEST_F(UpdateSchedulerTest, ExecutorExceptionCountsAsFailure) {
    ThrowingExecutor throwing;
    UpdateScheduler s(throwing, SchedulerOptions());
    ScheduleOptions options;
    options.max_retries = 0;
    const auto task = MustSchedule(s, "v1.1.0", kStart, options);

    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();

    const auto t = Get(s, task.id);
    EXPECT_EQ(t.status, ScheduleStatus::kFailed);
    EXPECT_EQ(t.last_error, "unexpected error: disk on fire");
}

TEST_F(UpdateSchedulerTest, CancellationRules) {
    BlockingExecutor blocking;
    UpdateScheduler s(blocking, SchedulerOptions());
    const auto running = MustSchedule(s, "v1.1.0", kStart);
    const auto pending = MustSchedule(s, "v1.2.0", kStart + 1h);

    auto r = s.CancelScheduledUpdate("update_missing");
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_EQ(r.msg, "scheduled update not found: update_missing");

    ASSERT_EQ(s.SweepOnce(), 1u);
    blocking.WaitEntered();
    EXPECT_EQ(Get(s, running.id).status, ScheduleStatus::kRunning);

    r = s.CancelScheduledUpdate(running.id);
    EXPECT_EQ(r.err, EBUSY);
    EXPECT_EQ(r.msg, "cannot cancel running update: " + running.id);

    ASSERT_TRUE(s.CancelScheduledUpdate(pending.id).is_ok());
    EXPECT_EQ(Get(s, pending.id).status, ScheduleStatus::kCancelled);
    EXPECT_EQ(s.CancelScheduledUpdate(pending.id).err, EINVAL);

    blocking.Release();
    s.WaitForIdle();
    EXPECT_EQ(Get(s, running.id).status, ScheduleStatus::kCompleted);
    EXPECT_EQ(s.CancelScheduledUpdate(running.id).err, EINVAL);

    // A cancelled task is never dispatched.
    clock.Advance(2h);
    EXPECT_EQ(s.SweepOnce(), 0u);
}

TEST_F(UpdateSchedulerTest, ReloadIsRefusedWhileInstalling) {
    BlockingExecutor blocking;
    UpdateScheduler s(blocking, SchedulerOptions());
    MustSchedule(s, "v1.1.0", kStart);

    ASSERT_EQ(s.SweepOnce(), 1u);
    blocking.WaitEntered();
    EXPECT_EQ(s.LoadFromFile(temp_dir.Sub("none.json")).err, EBUSY);

    blocking.Release();
    s.WaitForIdle();
    EXPECT_TRUE(s.LoadFromFile(temp_dir.Sub("none.json")).is_ok());
    EXPECT_TRUE(s.GetScheduledUpdates().empty());
}

TEST_F(UpdateSchedulerTest, CleanupRemovesOldFinishedTasks) {
    UpdateScheduler s(executor, SchedulerOptions());
    const auto done = MustSchedule(s, "v1.1.0", kStart);
    ScheduleOptions daily;
    daily.cron_expression = "@daily";
    const auto recurring = MustSchedule(s, "v1.2.0", kStart, daily);
    const auto future = MustSchedule(s, "v1.3.0", kStart + 72h * 10);

    ASSERT_EQ(s.SweepOnce(), 2u);
    s.WaitForIdle();

    EXPECT_EQ(s.CleanupCompletedTasks(std::chrono::hours(24 * 7)), 0u);
    clock.Advance(std::chrono::hours(24 * 8));
    EXPECT_EQ(s.CleanupCompletedTasks(std::chrono::hours(24 * 7)), 1u);

    EXPECT_FALSE(s.GetScheduledUpdate(done.id).has_value());
    EXPECT_TRUE(s.GetScheduledUpdate(recurring.id).has_value());
    EXPECT_TRUE(s.GetScheduledUpdate(future.id).has_value());
}

TEST_F(UpdateSchedulerTest, StatsCountTasksByStatus) {
    executor.script = {true};
    UpdateScheduler s(executor, SchedulerOptions());
    MustSchedule(s, "v1.1.0", kStart);
    const auto cancelled = MustSchedule(s, "v1.2.0", kStart + 1h);
    ScheduleOptions weekly;
    weekly.cron_expression = "@weekly";
    MustSchedule(s, "v1.3.0", kStart + 2h, weekly);
    ASSERT_TRUE(s.CancelScheduledUpdate(cancelled.id).is_ok());

    ASSERT_EQ(s.SweepOnce(), 1u);
    s.WaitForIdle();

    const auto stats = s.GetStats();
    EXPECT_EQ(stats["total"], 3);
    EXPECT_EQ(stats["completed"], 1);
    EXPECT_EQ(stats["cancelled"], 1);
    EXPECT_EQ(stats["pending"], 1);
    EXPECT_EQ(stats["failed"], 0);
    EXPECT_EQ(stats["recurring"], 1);
    EXPECT_EQ(stats["in_flight"], 0);
    EXPECT_EQ(stats["running"], false);
}

TEST_F(UpdateSchedulerTest, SaveAndLoadRestoresInterruptedTasks) {
    const std::string path = temp_dir.Sub("scheduled_updates.json");
    ScheduledUpdate kept;
    {
        UpdateScheduler s(executor, SchedulerOptions());
        ScheduleOptions options;
        options.auto_confirm = true;
        options.max_retries = 5;
        options.cron_expression = "@monthly";
        options.metadata["requested_by"] = "ops";
        kept = MustSchedule(s, "v1.1.0", kStart + 1h, options);
        MustSchedule(s, "v1.2.0", kStart + 2h);
        ASSERT_TRUE(s.SaveToFile(path).is_ok());
    }

    // Simulate a process that died mid-install.
    nlohmann::json doc;
    ASSERT_TRUE(jsonutil::LoadJsonObjectFromFile(path, doc).is_ok());
    ASSERT_EQ(doc["tasks"].size(), 2u);
    doc["tasks"][0]["status"] = "running";
    testutil::WriteFile(path, doc.dump());

    UpdateScheduler s(executor, SchedulerOptions());
    ASSERT_TRUE(s.LoadFromFile(path).is_ok());
    EXPECT_EQ(Get(s, kept.id).status, ScheduleStatus::kRunning);
    EXPECT_EQ(s.RequeueInterruptedTasks(), 1u);
    EXPECT_EQ(s.RequeueInterruptedTasks(), 0u);

    const auto loaded = Get(s, kept.id);
    EXPECT_EQ(loaded.status, ScheduleStatus::kPending);
    EXPECT_EQ(loaded.version, "v1.1.0");
    EXPECT_EQ(loaded.scheduled_time, kStart + 1h);
    EXPECT_EQ(loaded.max_retries, 5);
    EXPECT_TRUE(loaded.auto_confirm);
    EXPECT_TRUE(loaded.is_recurring);
    EXPECT_EQ(loaded.cron_expression, "@monthly");
    EXPECT_EQ(loaded.metadata.at("requested_by"), "ops");
    EXPECT_EQ(s.GetScheduledUpdates().size(), 2u);
}

TEST_F(UpdateSchedulerTest, LoadRejectsMalformedTasks) {
    const std::string path = temp_dir.Sub("scheduled_updates.json");
    UpdateScheduler s(executor, SchedulerOptions());

    testutil::WriteFile(path, R"({"tasks": [{"id": "a", "version": "v1", "status": "sleeping",
        "scheduled_time": "2025-03-12T00:00:00Z", "created_at": "2025-03-12T00:00:00Z",
        "updated_at": "2025-03-12T00:00:00Z"}]})");
    EXPECT_FALSE(s.LoadFromFile(path).is_ok());

    testutil::WriteFile(path, R"({"tasks": [{"id": "a", "version": "v1", "status": "pending",
        "scheduled_time": "2025-03-12T00:00:00Z", "created_at": "2025-03-12T00:00:00Z",
        "updated_at": "2025-03-12T00:00:00Z", "cron_expression": "0 */2 * * *"}]})");
    EXPECT_FALSE(s.LoadFromFile(path).is_ok());

    testutil::WriteFile(path, R"({"tasks": {}})");
    EXPECT_FALSE(s.LoadFromFile(path).is_ok());
}

TEST_F(UpdateSchedulerTest, MergePicksUpExternalChanges) {
    const std::string path = temp_dir.Sub("scheduled_updates.json");

    UpdateScheduler daemon(executor, SchedulerOptions());
    const auto existing = MustSchedule(daemon, "v1.1.0", kStart + 1h);
    ASSERT_TRUE(daemon.SaveToFile(path).is_ok());

    ScheduledUpdate added;
    {
        UpdateScheduler cli(executor, SchedulerOptions());
        ASSERT_TRUE(cli.LoadFromFile(path).is_ok());
        added = MustSchedule(cli, "v1.2.0", kStart + 2h);
        ASSERT_TRUE(cli.CancelScheduledUpdate(existing.id).is_ok());
        ASSERT_TRUE(cli.SaveToFile(path).is_ok());
    }

    ASSERT_TRUE(daemon.MergeFromFile(path).is_ok());
    EXPECT_EQ(Get(daemon, existing.id).status, ScheduleStatus::kCancelled);
    EXPECT_EQ(Get(daemon, added.id).status, ScheduleStatus::kPending);
    EXPECT_EQ(daemon.GetScheduledUpdates().size(), 2u);
}

TEST_F(UpdateSchedulerTest, RunningTaskInStateFileCannotBeCancelled) {
    const std::string path = temp_dir.Sub("state/scheduled_updates.json");
    auto opt = SchedulerOptions();
    opt.state_file = path;
    BlockingExecutor blocking;
    UpdateScheduler daemon(blocking, opt);
    UpdateScheduler cli(executor, opt);

    ScheduledUpdate task;
    ASSERT_TRUE(cli.EditStateFile([&] { return cli.ScheduleUpdate("v1.1.0", kStart, {}, task); }).is_ok());

    ASSERT_EQ(daemon.SweepOnce(), 1u);
    blocking.WaitEntered();

    auto r = cli.EditStateFile([&] { return cli.CancelScheduledUpdate(task.id); });
    EXPECT_EQ(r.err, EBUSY);
    EXPECT_EQ(r.msg, "cannot cancel running update: " + task.id);
    EXPECT_EQ(Get(cli, task.id).status, ScheduleStatus::kRunning);

    // A stale writer recording a cancellation does not stop the install.
    nlohmann::json doc;
    ASSERT_TRUE(jsonutil::LoadJsonObjectFromFile(path, doc).is_ok());
    doc["tasks"][0]["status"] = "cancelled";
    testutil::WriteFile(path, doc.dump());
    ASSERT_TRUE(daemon.MergeFromFile(path).is_ok());
    EXPECT_EQ(Get(daemon, task.id).status, ScheduleStatus::kRunning);

    blocking.Release();
    daemon.WaitForIdle();
    ASSERT_TRUE(cli.LoadFromFile(path).is_ok());
    EXPECT_EQ(Get(cli, task.id).status, ScheduleStatus::kCompleted);
}

TEST_F(UpdateSchedulerTest, CancellationInStateFileWinsOverNextSweep) {
    auto opt = SchedulerOptions();
    opt.state_file = temp_dir.Sub("scheduled_updates.json");
    UpdateScheduler daemon(executor, opt);
    UpdateScheduler cli(executor, opt);

    ScheduledUpdate task;
    ASSERT_TRUE(cli.EditStateFile([&] { return cli.ScheduleUpdate("v1.1.0", kStart, {}, task); }).is_ok());
    ASSERT_TRUE(cli.EditStateFile([&] { return cli.CancelScheduledUpdate(task.id); }).is_ok());

    EXPECT_EQ(daemon.SweepOnce(), 0u);
    EXPECT_EQ(Get(daemon, task.id).status, ScheduleStatus::kCancelled);
    EXPECT_TRUE(executor.Calls().empty());
}

TEST_F(UpdateSchedulerTest, EditStateFileDiscardsFailedEdits) {
    auto opt = SchedulerOptions();
    opt.state_file = temp_dir.Sub("scheduled_updates.json");
    UpdateScheduler cli(executor, opt);

    auto r = cli.EditStateFile([&] { return cli.CancelScheduledUpdate("update_missing"); });
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_FALSE(std::filesystem::exists(opt.state_file));

    UpdateScheduler plain(executor, SchedulerOptions());
    EXPECT_EQ(plain.SyncStateFile().err, EINVAL);
}

TEST_F(UpdateSchedulerTest, BackgroundSweepRunsDueTasks) {
    UpdateScheduler s(executor, SchedulerOptions());
    const auto task = MustSchedule(s, "v1.1.0", kStart);

    ASSERT_TRUE(s.Start().is_ok());
    EXPECT_TRUE(s.IsRunning());
    EXPECT_EQ(s.Start().err, EALREADY);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (Get(s, task.id).status != ScheduleStatus::kCompleted && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(Get(s, task.id).status, ScheduleStatus::kCompleted);

    ASSERT_TRUE(s.Stop().is_ok());
    EXPECT_FALSE(s.IsRunning());
    EXPECT_EQ(s.Stop().err, EALREADY);
    s.WaitForIdle();
}

} // namespace
} // namespace selfupdate

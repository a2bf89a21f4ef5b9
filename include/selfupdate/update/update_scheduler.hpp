#pragma once

#include "selfupdate/io/fd.hpp"
#include "selfupdate/update/update_manager.hpp"
#include "selfupdate/util/result.hpp"
#include "selfupdate/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace selfupdate {

enum class ScheduleStatus { kPending, kRunning, kCompleted, kFailed, kCancelled };

const char* ToString(ScheduleStatus status);
bool ParseScheduleStatus(std::string_view text, ScheduleStatus& out);

struct ScheduledUpdate {
    std::string id;
    std::string version;
    TimePoint scheduled_time{};
    ScheduleStatus status = ScheduleStatus::kPending;
    TimePoint created_at{};
    TimePoint updated_at{};
    int retry_count = 0;
    int max_retries = 3;
    std::string last_error;
    std::string cron_expression;
    bool is_recurring = false;
    bool auto_confirm = false;
    std::map<std::string, std::string> metadata;

    bool IsTerminal() const {
        return status == ScheduleStatus::kCompleted || status == ScheduleStatus::kFailed ||
               status == ScheduleStatus::kCancelled;
    }
};

struct ScheduleOptions {
    bool auto_confirm = false;
    // Failed attempts after which the task is marked failed.
    int max_retries = 3;
    // Setting an expression makes the task recurring.
    std::string cron_expression;
    std::map<std::string, std::string> metadata;
};

nlohmann::json ScheduledUpdateToJson(const ScheduledUpdate& task);
Result ParseScheduledUpdate(const nlohmann::json& j, ScheduledUpdate& out);

// Runs update tasks at their scheduled time.
//
// A background thread sweeps the task table every `sweep_interval`; each due
// task is dispatched on its own thread so a slow install never holds up the
// others. The table lock is held only to inspect or mutate tasks, never
// across an install.
class UpdateScheduler {
  public:
    using Clock = std::function<TimePoint()>;

    struct Options {
        std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
        std::chrono::seconds retry_delay{std::chrono::minutes(10)};
        Clock clock;
        // When set, every sweep merges this file before dispatching and
        // records the dispatched tasks before releasing "<state_file>.lock";
        // finished tasks are recorded the same way. Other processes must
        // go through EditStateFile() so their edits never race a dispatch.
        std::string state_file;
    };

    explicit UpdateScheduler(IUpdateExecutor& executor);
    UpdateScheduler(IUpdateExecutor& executor, Options opt);
    ~UpdateScheduler();

    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    // Each fails when the scheduler is already in the requested state. Stop()
    // leaves in-flight installs running.
    Result Start();
    Result Stop();
    bool IsRunning() const;

    Result ScheduleUpdate(const std::string& version,
                          TimePoint when,
                          const ScheduleOptions& options,
                          ScheduledUpdate& out);

    // Fails for unknown ids and for tasks that are already running.
    Result CancelScheduledUpdate(const std::string& id);

    // Sorted by scheduled time.
    std::vector<ScheduledUpdate> GetScheduledUpdates() const;
    std::vector<ScheduledUpdate> GetPendingUpdates() const;
    std::optional<ScheduledUpdate> GetScheduledUpdate(const std::string& id) const;

    // Dispatches every pending task that is due; returns how many.
    size_t SweepOnce();
    // Blocks until no dispatched task is still executing.
    void WaitForIdle();

    // Removes non-recurring terminal tasks last updated before now - older_than.
    size_t CleanupCompletedTasks(std::chrono::seconds older_than);

    nlohmann::json GetStats() const;

    Result SaveToFile(const std::string& path) const;
    // Replaces the task table with the tasks recorded in `path`, statuses
    // included.
    Result LoadFromFile(const std::string& path);
    // Adds tasks this scheduler does not know yet and applies cancellations
    // of pending tasks recorded in the file.
    Result MergeFromFile(const std::string& path);

    // Resets tasks left running by a process that is gone back to pending.
    // Returns how many were reset.
    size_t RequeueInterruptedTasks();

    // Loads the state file under its lock, applies `edit` and saves the
    // result when `edit` succeeds.
    Result EditStateFile(const std::function<Result()>& edit);
    // Merges the state file and writes the merged table back, under its lock.
    Result SyncStateFile();

  private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    TimePoint Now() const;
    std::string NewIdLocked(const std::string& version, TimePoint now);
    void SweepLoop();
    void ExecuteTask(const std::string& id);
    Result LockStateFile(Fd& lock) const;
    void FinishTaskLocked(ScheduledUpdate& task, const Result& r, const InstallResult& result, TimePoint now);
    void ReapWorkersLocked(std::vector<std::thread>& finished);
    Result ReadTasks(const std::string& path, std::vector<ScheduledUpdate>& out) const;

    IUpdateExecutor& executor_;
    Options opt_;

    mutable std::mutex mu_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    std::map<std::string, ScheduledUpdate> tasks_;
    bool running_ = false;
    size_t in_flight_ = 0;
    std::uint64_t sequence_ = 0;
    std::vector<Worker> workers_;
    std::thread sweep_thread_;
};

} // namespace selfupdate

#include "selfupdate/update/update_scheduler.hpp"

#include "selfupdate/update/cron_schedule.hpp"
#include "selfupdate/util/json_utils.hpp"
#include "selfupdate/util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace selfupdate {

using namespace jsonutil;

namespace {

struct StatusName {
    ScheduleStatus status;
    std::string_view name;
};

constexpr StatusName kStatusNames[] = {
    {ScheduleStatus::kPending, "pending"},     {ScheduleStatus::kRunning, "running"},
    {ScheduleStatus::kCompleted, "completed"}, {ScheduleStatus::kFailed, "failed"},
    {ScheduleStatus::kCancelled, "cancelled"},
};

Result GetRequiredTime(const nlohmann::json& j, const char* key, TimePoint& out) {
    std::string text;
    if (!GetStringIfPresent(j, key, text)) {
        return Result::Fail(EINVAL, std::string("missing '") + key + "'");
    }
    if (!ParseRfc3339(text, out)) {
        return Result::Fail(EINVAL, std::string("invalid timestamp for '") + key + "': " + text);
    }
    return Result::Ok();
}

std::vector<ScheduledUpdate> SortedByTime(std::vector<ScheduledUpdate> v) {
    std::sort(v.begin(), v.end(), [](const ScheduledUpdate& a, const ScheduledUpdate& b) {
        if (a.scheduled_time != b.scheduled_time) return a.scheduled_time < b.scheduled_time;
        return a.id < b.id;
    });
    return v;
}

} // namespace

const char* ToString(ScheduleStatus status) {
    for (const auto& s : kStatusNames) {
        if (s.status == status) return s.name.data();
    }
    return "unknown";
}

bool ParseScheduleStatus(std::string_view text, ScheduleStatus& out) {
    for (const auto& s : kStatusNames) {
        if (s.name == text) {
            out = s.status;
            return true;
        }
    }
    return false;
}

nlohmann::json ScheduledUpdateToJson(const ScheduledUpdate& task) {
    return {
        {"id", task.id},
        {"version", task.version},
        {"scheduled_time", FormatRfc3339(task.scheduled_time)},
        {"status", ToString(task.status)},
        {"created_at", FormatRfc3339(task.created_at)},
        {"updated_at", FormatRfc3339(task.updated_at)},
        {"retry_count", task.retry_count},
        {"max_retries", task.max_retries},
        {"last_error", task.last_error},
        {"cron_expression", task.cron_expression},
        {"is_recurring", task.is_recurring},
        {"auto_confirm", task.auto_confirm},
        {"metadata", task.metadata},
    };
}

Result ParseScheduledUpdate(const nlohmann::json& j, ScheduledUpdate& out) {
    if (!j.is_object()) return Result::Fail(EINVAL, "task must be a JSON object");
    if (!GetStringIfPresent(j, "id", out.id) || out.id.empty()) return Result::Fail(EINVAL, "task is missing 'id'");
    if (!GetStringIfPresent(j, "version", out.version) || out.version.empty()) {
        return Result::Fail(EINVAL, "task " + out.id + " is missing 'version'");
    }

    std::string status;
    GetStringIfPresent(j, "status", status);
    if (!ParseScheduleStatus(status, out.status)) {
        return Result::Fail(EINVAL, "task " + out.id + " has invalid status '" + status + "'");
    }

    for (auto [key, field] : {std::pair{"scheduled_time", &out.scheduled_time},
                              std::pair{"created_at", &out.created_at},
                              std::pair{"updated_at", &out.updated_at}}) {
        auto r = GetRequiredTime(j, key, *field);
        if (!r.is_ok()) return Result::Fail(r.err, "task " + out.id + ": " + r.msg);
    }

    GetIntIfPresent(j, "retry_count", out.retry_count);
    GetIntIfPresent(j, "max_retries", out.max_retries);
    GetStringIfPresent(j, "last_error", out.last_error);
    GetStringIfPresent(j, "cron_expression", out.cron_expression);
    GetBoolIfPresent(j, "is_recurring", out.is_recurring);
    GetBoolIfPresent(j, "auto_confirm", out.auto_confirm);

    if (!out.cron_expression.empty() && !ParseCronExpression(out.cron_expression)) {
        return Result::Fail(EINVAL, "task " + out.id + " has unsupported cron expression: " + out.cron_expression);
    }

    out.metadata.clear();
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        for (const auto& [k, v] : it->items()) {
            if (v.is_string()) out.metadata[k] = v.get<std::string>();
        }
    }
    return Result::Ok();
}

UpdateScheduler::UpdateScheduler(IUpdateExecutor& executor) : UpdateScheduler(executor, Options{}) {}

UpdateScheduler::UpdateScheduler(IUpdateExecutor& executor, Options opt)
    : executor_(executor), opt_(std::move(opt)) {
    if (!opt_.clock) opt_.clock = [] { return std::chrono::system_clock::now(); };
}

UpdateScheduler::~UpdateScheduler() {
    if (IsRunning()) (void)Stop();
    WaitForIdle();
}

TimePoint UpdateScheduler::Now() const {
    return opt_.clock();
}

Result UpdateScheduler::Start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return Result::Fail(EALREADY, "scheduler is already running");
    if (sweep_thread_.joinable()) return Result::Fail(EBUSY, "scheduler is still stopping");
    running_ = true;
    sweep_thread_ = std::thread([this] { SweepLoop(); });
    LogInfo("Update scheduler started (sweep every %lld ms)",
            static_cast<long long>(opt_.sweep_interval.count()));
    return Result::Ok();
}

Result UpdateScheduler::Stop() {
    std::thread sweeper;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_) return Result::Fail(EALREADY, "scheduler is not running");
        running_ = false;
        sweeper = std::move(sweep_thread_);
    }
    wake_cv_.notify_all();
    if (sweeper.joinable()) sweeper.join();
    LogInfo("Update scheduler stopped");
    return Result::Ok();
}

bool UpdateScheduler::IsRunning() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_;
}

void UpdateScheduler::SweepLoop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (running_) {
        if (wake_cv_.wait_for(lk, opt_.sweep_interval, [this] { return !running_; })) break;
        lk.unlock();
        SweepOnce();
        lk.lock();
    }
}

std::string UpdateScheduler::NewIdLocked(const std::string& version, TimePoint now) {
    const auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    std::string id;
    do {
        id = "update_" + version + "_" + std::to_string(unix_seconds) + "_" + std::to_string(++sequence_);
    } while (tasks_.count(id) != 0);
    return id;
}

Result UpdateScheduler::ScheduleUpdate(const std::string& version,
                                       TimePoint when,
                                       const ScheduleOptions& options,
                                       ScheduledUpdate& out) {
    if (version.empty()) return Result::Fail(EINVAL, "version is required");
    if (options.max_retries < 0) return Result::Fail(EINVAL, "max retries must not be negative");
    if (!options.cron_expression.empty() && !ParseCronExpression(options.cron_expression)) {
        return Result::Fail(EINVAL, "invalid cron expression: " + options.cron_expression);
    }

    const TimePoint now = Now();
    std::lock_guard<std::mutex> lk(mu_);

    ScheduledUpdate task;
    task.id = NewIdLocked(version, now);
    task.version = version;
    task.scheduled_time = when;
    task.status = ScheduleStatus::kPending;
    task.created_at = now;
    task.updated_at = now;
    task.max_retries = options.max_retries;
    task.cron_expression = options.cron_expression;
    task.is_recurring = !options.cron_expression.empty();
    task.auto_confirm = options.auto_confirm;
    task.metadata = options.metadata;

    tasks_[task.id] = task;
    out = task;
    LogInfo("Scheduled update %s for version %s at %s%s%s", task.id.c_str(), version.c_str(),
            FormatRfc3339(when).c_str(), task.is_recurring ? " recurring " : "",
            task.cron_expression.c_str());
    return Result::Ok();
}

Result UpdateScheduler::CancelScheduledUpdate(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return Result::Fail(ENOENT, "scheduled update not found: " + id);

    auto& task = it->second;
    if (task.status == ScheduleStatus::kRunning) {
        return Result::Fail(EBUSY, "cannot cancel running update: " + id);
    }
    if (task.status != ScheduleStatus::kPending) {
        return Result::Fail(EINVAL, "scheduled update " + id + " is already " + ToString(task.status));
    }
    task.status = ScheduleStatus::kCancelled;
    task.updated_at = Now();
    LogInfo("Cancelled scheduled update %s", id.c_str());
    return Result::Ok();
}

std::vector<ScheduledUpdate> UpdateScheduler::GetScheduledUpdates() const {
    std::vector<ScheduledUpdate> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(tasks_.size());
        for (const auto& [id, task] : tasks_) out.push_back(task);
    }
    return SortedByTime(std::move(out));
}

std::vector<ScheduledUpdate> UpdateScheduler::GetPendingUpdates() const {
    std::vector<ScheduledUpdate> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, task] : tasks_) {
            if (task.status == ScheduleStatus::kPending) out.push_back(task);
        }
    }
    return SortedByTime(std::move(out));
}

std::optional<ScheduledUpdate> UpdateScheduler::GetScheduledUpdate(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

void UpdateScheduler::ReapWorkersLocked(std::vector<std::thread>& finished) {
    auto it = std::partition(workers_.begin(), workers_.end(),
                             [](const Worker& w) { return !w.done->load(); });
    for (auto w = it; w != workers_.end(); ++w) finished.push_back(std::move(w->thread));
    workers_.erase(it, workers_.end());
}

Result UpdateScheduler::LockStateFile(Fd& lock) const {
    if (opt_.state_file.empty()) return Result::Fail(EINVAL, "scheduler has no state file");
    const std::filesystem::path parent = std::filesystem::path(opt_.state_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) return Result::Fail(ec.value(), "cannot create directory " + parent.string() + ": " + ec.message());
    }
    return Fd::LockExclusive(opt_.state_file + ".lock", lock);
}

size_t UpdateScheduler::SweepOnce() {
    Fd state_lock;
    if (!opt_.state_file.empty()) {
        auto r = LockStateFile(state_lock);
        if (r.is_ok()) r = MergeFromFile(opt_.state_file);
        if (!r.is_ok()) {
            LogError("Skipping sweep, cannot sync %s: %s", opt_.state_file.c_str(), r.msg.c_str());
            return 0;
        }
    }

    const TimePoint now = Now();
    std::vector<std::thread> finished;
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ReapWorkersLocked(finished);

        for (auto& [id, task] : tasks_) {
            if (task.status != ScheduleStatus::kPending || task.scheduled_time > now) continue;
            task.status = ScheduleStatus::kRunning;
            task.updated_at = now;
            ++in_flight_;
            due.push_back(id);
        }
    }

    // Other processes must see the tasks as running before the lock is
    // released, otherwise they could still cancel them.
    if (!due.empty() && state_lock.Valid()) {
        auto r = SaveToFile(opt_.state_file);
        if (!r.is_ok()) {
            LogWarn("Cannot record dispatched updates in %s: %s", opt_.state_file.c_str(), r.msg.c_str());
        }
    }
    state_lock.Close();

    if (!due.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& id : due) {
            auto done = std::make_shared<std::atomic_bool>(false);
            workers_.push_back(Worker{std::thread([this, task_id = id, done] {
                                          ExecuteTask(task_id);
                                          done->store(true);
                                      }),
                                      done});
        }
    }

    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
    if (!due.empty()) LogDebug("Sweep dispatched %zu scheduled updates", due.size());
    return due.size();
}

void UpdateScheduler::ExecuteTask(const std::string& id) {
    std::string version;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tasks_.find(id);
        if (it != tasks_.end()) version = it->second.version;
    }

    InstallResult result;
    Result r = Result::Fail(ENOENT, "scheduled update disappeared: " + id);
    if (!version.empty()) {
        LogInfo("Running scheduled update %s (version %s)", id.c_str(), version.c_str());
        try {
            r = executor_.DownloadAndInstallUpdate(version, result);
        } catch (const std::exception& e) {
            r = Result::Fail(-1, std::string("unexpected error: ") + e.what());
        }
    }

    const TimePoint now = Now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tasks_.find(id);
        if (it != tasks_.end()) FinishTaskLocked(it->second, r, result, now);
    }

    if (!opt_.state_file.empty()) {
        auto sync = SyncStateFile();
        if (!sync.is_ok()) {
            LogWarn("Cannot record result of scheduled update %s in %s: %s", id.c_str(),
                    opt_.state_file.c_str(), sync.msg.c_str());
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    --in_flight_;
    idle_cv_.notify_all();
}

void UpdateScheduler::FinishTaskLocked(ScheduledUpdate& task,
                                       const Result& r,
                                       const InstallResult& result,
                                       TimePoint now) {
    task.updated_at = now;

    if (!r.is_ok()) {
        ++task.retry_count;
        task.last_error = r.msg;
        if (task.retry_count < task.max_retries) {
            task.status = ScheduleStatus::kPending;
            task.scheduled_time = now + opt_.retry_delay;
            LogWarn("Scheduled update %s failed (attempt %d of %d), retrying at %s: %s", task.id.c_str(),
                    task.retry_count, task.max_retries, FormatRfc3339(task.scheduled_time).c_str(),
                    r.msg.c_str());
        } else {
            task.status = ScheduleStatus::kFailed;
            LogError("Scheduled update %s failed permanently after %d attempts: %s", task.id.c_str(),
                     task.retry_count, r.msg.c_str());
        }
        return;
    }

    task.status = ScheduleStatus::kCompleted;
    task.last_error.clear();
    LogInfo("Scheduled update %s completed: %s -> %s", task.id.c_str(), result.old_version.c_str(),
            result.new_version.c_str());

    if (!task.is_recurring) return;
    const auto period = ParseCronExpression(task.cron_expression);
    if (!period) {
        LogError("Recurring update %s has unsupported cron expression '%s'", task.id.c_str(),
                 task.cron_expression.c_str());
        return;
    }

    ScheduledUpdate next;
    next.id = NewIdLocked(task.version, now);
    next.version = task.version;
    next.scheduled_time = NextCronTime(*period, now);
    next.status = ScheduleStatus::kPending;
    next.created_at = now;
    next.updated_at = now;
    next.max_retries = task.max_retries;
    next.cron_expression = task.cron_expression;
    next.is_recurring = true;
    next.auto_confirm = task.auto_confirm;
    next.metadata = task.metadata;
    next.metadata["previous_task"] = task.id;

    LogInfo("Next run of recurring update %s scheduled at %s as %s", task.version.c_str(),
            FormatRfc3339(next.scheduled_time).c_str(), next.id.c_str());
    tasks_.emplace(next.id, std::move(next));
}

void UpdateScheduler::WaitForIdle() {
    std::vector<std::thread> finished;
    {
        std::unique_lock<std::mutex> lk(mu_);
        idle_cv_.wait(lk, [this] { return in_flight_ == 0; });
        for (auto& w : workers_) finished.push_back(std::move(w.thread));
        workers_.clear();
    }
    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
}

size_t UpdateScheduler::CleanupCompletedTasks(std::chrono::seconds older_than) {
    const TimePoint cutoff = Now() - older_than;
    std::lock_guard<std::mutex> lk(mu_);

    size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const auto& task = it->second;
        if (!task.is_recurring && task.IsTerminal() && task.updated_at < cutoff) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) LogInfo("Removed %zu finished scheduled updates", removed);
    return removed;
}

nlohmann::json UpdateScheduler::GetStats() const {
    std::lock_guard<std::mutex> lk(mu_);
    nlohmann::json stats = {
        {"total", tasks_.size()},
        {"running", running_},
        {"in_flight", in_flight_},
    };
    size_t recurring = 0;
    for (const auto& s : kStatusNames) stats[std::string(s.name)] = 0;
    for (const auto& [id, task] : tasks_) {
        auto& slot = stats[ToString(task.status)];
        slot = slot.get<size_t>() + 1;
        if (task.is_recurring) ++recurring;
    }
    stats["recurring"] = recurring;
    return stats;
}

Result UpdateScheduler::SaveToFile(const std::string& path) const {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : GetScheduledUpdates()) tasks.push_back(ScheduledUpdateToJson(task));
    return WriteJsonFileAtomic(path, nlohmann::json{{"tasks", std::move(tasks)}});
}

Result UpdateScheduler::ReadTasks(const std::string& path, std::vector<ScheduledUpdate>& out) const {
    out.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return Result::Ok();

    nlohmann::json doc;
    auto r = LoadJsonObjectFromFile(path, doc);
    if (!r.is_ok()) return r;

    auto it = doc.find("tasks");
    if (it == doc.end()) return Result::Ok();
    if (!it->is_array()) return Result::Fail(EINVAL, path + ": 'tasks' must be an array");

    for (const auto& item : *it) {
        ScheduledUpdate task;
        r = ParseScheduledUpdate(item, task);
        if (!r.is_ok()) return Result::Fail(r.err, path + ": " + r.msg);
        out.push_back(std::move(task));
    }
    return Result::Ok();
}

Result UpdateScheduler::LoadFromFile(const std::string& path) {
    std::vector<ScheduledUpdate> loaded;
    auto r = ReadTasks(path, loaded);
    if (!r.is_ok()) return r;

    std::lock_guard<std::mutex> lk(mu_);
    if (in_flight_ > 0) return Result::Fail(EBUSY, "cannot reload while updates are running");

    tasks_.clear();
    for (auto& task : loaded) tasks_[task.id] = std::move(task);
    LogDebug("Loaded %zu scheduled updates from %s", tasks_.size(), path.c_str());
    return Result::Ok();
}

size_t UpdateScheduler::RequeueInterruptedTasks() {
    const TimePoint now = Now();
    std::lock_guard<std::mutex> lk(mu_);
    if (in_flight_ > 0) return 0;

    size_t requeued = 0;
    for (auto& [id, task] : tasks_) {
        if (task.status != ScheduleStatus::kRunning) continue;
        LogWarn("Scheduled update %s was interrupted, marking pending", id.c_str());
        task.status = ScheduleStatus::kPending;
        task.updated_at = now;
        ++requeued;
    }
    return requeued;
}

Result UpdateScheduler::MergeFromFile(const std::string& path) {
    std::vector<ScheduledUpdate> loaded;
    auto r = ReadTasks(path, loaded);
    if (!r.is_ok()) return r;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto& task : loaded) {
        auto it = tasks_.find(task.id);
        if (it == tasks_.end()) {
            if (task.status == ScheduleStatus::kRunning) task.status = ScheduleStatus::kPending;
            LogInfo("Picked up scheduled update %s", task.id.c_str());
            tasks_.emplace(task.id, std::move(task));
            continue;
        }
        if (task.status != ScheduleStatus::kCancelled || it->second.status == ScheduleStatus::kCancelled) continue;
        if (it->second.status == ScheduleStatus::kPending) {
            it->second.status = ScheduleStatus::kCancelled;
            it->second.updated_at = task.updated_at;
            LogInfo("Scheduled update %s was cancelled externally", task.id.c_str());
        } else {
            LogWarn("Ignoring cancellation of scheduled update %s, it is already %s", task.id.c_str(),
                    ToString(it->second.status));
        }
    }
    return Result::Ok();
}

Result UpdateScheduler::EditStateFile(const std::function<Result()>& edit) {
    Fd lock;
    auto r = LockStateFile(lock);
    if (!r.is_ok()) return r;
    r = LoadFromFile(opt_.state_file);
    if (!r.is_ok()) return r;
    r = edit();
    if (!r.is_ok()) return r;
    return SaveToFile(opt_.state_file);
}

Result UpdateScheduler::SyncStateFile() {
    Fd lock;
    auto r = LockStateFile(lock);
    if (!r.is_ok()) return r;
    r = MergeFromFile(opt_.state_file);
    if (!r.is_ok()) return r;
    return SaveToFile(opt_.state_file);
}

} // namespace selfupdate

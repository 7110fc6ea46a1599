#pragma once

#include "sluice/errors.hpp"
#include "sluice/execution_router.hpp"
#include "sluice/job_queue.hpp"
#include "sluice/named_lock_service.hpp"
#include "sluice/notifier.hpp"
#include "sluice/request_store.hpp"
#include "sluice/sandbox/script_sandbox.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

namespace sluice {
namespace testing {

// Ordered record of side effects across fakes
class EventLog {
public:
    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    // Index of the first matching event, or -1
    int index_of(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i] == event) return static_cast<int>(i);
        }
        return -1;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

// Stands in for the server side of advisory locks, shared by every session
struct FakeLockServer {
    std::mutex mutex;
    std::set<int64_t> held;
    std::atomic<int> sessions_opened{0};
    std::atomic<int> sessions_closed{0};
    std::atomic<int> try_lock_calls{0};
    std::atomic<bool> fail_open{false};
    std::atomic<bool> fail_unlock{false};
};

class FakeLockSession : public AdvisoryLockSession {
public:
    explicit FakeLockSession(FakeLockServer& server) : server_(server) {
        server_.sessions_opened++;
    }

    ~FakeLockSession() override {
        std::lock_guard<std::mutex> lock(server_.mutex);
        for (int64_t id : mine_) server_.held.erase(id);
        server_.sessions_closed++;
    }

    bool try_lock(int64_t lock_id) override {
        server_.try_lock_calls++;
        std::lock_guard<std::mutex> lock(server_.mutex);
        if (server_.held.count(lock_id)) return false;
        server_.held.insert(lock_id);
        mine_.insert(lock_id);
        return true;
    }

    void unlock(int64_t lock_id) override {
        if (server_.fail_unlock) {
            throw std::runtime_error("connection lost during unlock");
        }
        std::lock_guard<std::mutex> lock(server_.mutex);
        server_.held.erase(lock_id);
        mine_.erase(lock_id);
    }

private:
    FakeLockServer& server_;
    std::set<int64_t> mine_;
};

class FakeLockSource : public AdvisoryLockSource {
public:
    explicit FakeLockSource(FakeLockServer& server) : server_(server) {}

    std::unique_ptr<AdvisoryLockSession> open_session() override {
        if (server_.fail_open) {
            throw std::runtime_error("Timed out waiting for a database connection from the pool");
        }
        return std::make_unique<FakeLockSession>(server_);
    }

private:
    FakeLockServer& server_;
};

class FakeJobQueue : public JobQueue {
public:
    std::optional<std::string> enqueue(const std::string& channel_key,
                                       const std::string& request_id,
                                       const std::string& approver_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& job : pending) {
            if (job.request_id == request_id) return std::nullopt;
        }
        QueueJob job;
        job.id = "row-" + std::to_string(++sequence);
        job.job_id = "job_" + std::to_string(sequence);
        job.channel_key = channel_key;
        job.request_id = request_id;
        job.approver_id = approver_id;
        pending.push_back(job);
        return job.id;
    }

    std::vector<QueueJob> fetch(int batch_size) override {
        std::lock_guard<std::mutex> lock(mutex);
        fetch_calls++;
        std::vector<QueueJob> batch;
        while (!pending.empty() && static_cast<int>(batch.size()) < batch_size) {
            batch.push_back(pending.front());
            pending.pop_front();
        }
        return batch;
    }

    void complete(const QueueJob& job) override {
        std::lock_guard<std::mutex> lock(mutex);
        completed.push_back(job.id);
    }

    bool fail(const QueueJob& job, const std::string& error, int retry_delay_ms) override {
        std::lock_guard<std::mutex> lock(mutex);
        failed.push_back(job.id);
        last_error = error;
        last_retry_delay_ms = retry_delay_ms;
        return true;
    }

    void defer(const QueueJob& job, int delay_ms) override {
        std::lock_guard<std::mutex> lock(mutex);
        deferred.push_back(job.id);
        last_defer_delay_ms = delay_ms;
    }

    size_t handled() {
        std::lock_guard<std::mutex> lock(mutex);
        return completed.size() + failed.size() + deferred.size();
    }

    std::mutex mutex;
    std::deque<QueueJob> pending;
    std::vector<std::string> completed;
    std::vector<std::string> failed;
    std::vector<std::string> deferred;
    std::string last_error;
    int last_retry_delay_ms = -1;
    int last_defer_delay_ms = -1;
    int fetch_calls = 0;
    int sequence = 0;
};

class FakeRequestStore : public RequestStore {
public:
    explicit FakeRequestStore(EventLog* log = nullptr) : log_(log) {}

    void put(const ExecutionRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_[request.id] = request;
    }

    std::optional<ExecutionRequest> get_request_by_id(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        reads++;
        auto it = requests_.find(id);
        if (it == requests_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<ExecutionRequest> set_execution_outcome(const std::string& id,
                                                          const ExecutionOutcome& outcome) override {
        if (fail_writes) {
            throw std::runtime_error("metadata store unavailable");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        writes++;
        if (log_) log_->add("persist:" + id);
        auto it = requests_.find(id);
        if (it == requests_.end()) return std::nullopt;
        it->second.status = outcome.success ? RequestStatus::executed : RequestStatus::failed;
        it->second.execution_result = outcome.output;
        it->second.execution_error = outcome.error;
        it->second.is_compressed = outcome.compressed;
        it->second.result_original_size = outcome.original_size;
        it->second.executed_at = outcome.executed_at;
        return it->second;
    }

    std::atomic<int> reads{0};
    std::atomic<int> writes{0};
    std::atomic<bool> fail_writes{false};

private:
    EventLog* log_;
    std::mutex mutex_;
    std::map<std::string, ExecutionRequest> requests_;
};

class FakeInstanceDirectory : public InstanceDirectory {
public:
    void put(const DatabaseInstance& instance) { instances_[instance.id] = instance; }

    std::optional<DatabaseInstance> find_instance(const std::string& id) override {
        auto it = instances_.find(id);
        if (it == instances_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, DatabaseInstance> instances_;
};

class RecordingNotifier : public Notifier {
public:
    explicit RecordingNotifier(EventLog* log = nullptr) : log_(log) {}

    void notify(NotificationKind kind,
                const ExecutionRequest& request,
                const std::string& executor_id,
                const ExecutionOutcome*,
                const std::string& reason) override {
        if (fail) {
            throw std::runtime_error("notification transport down");
        }
        std::lock_guard<std::mutex> lock(mutex);
        kinds.push_back(kind);
        executors.push_back(executor_id);
        reasons.push_back(reason);
        if (log_) log_->add("notify:" + to_string(kind) + ":" + request.id);
    }

    std::mutex mutex;
    std::vector<NotificationKind> kinds;
    std::vector<std::string> executors;
    std::vector<std::string> reasons;
    std::atomic<bool> fail{false};

private:
    EventLog* log_;
};

class FakeRequestExecutor : public RequestExecutor {
public:
    using Behavior = std::function<ExecutionOutcome(const ExecutionRequest&)>;

    explicit FakeRequestExecutor(EventLog* log = nullptr) : log_(log) {
        behavior = [](const ExecutionRequest&) { return ExecutionOutcome::succeeded("[]", 0); };
    }

    ExecutionOutcome execute_request(const ExecutionRequest& request) override {
        calls++;
        if (log_) log_->add("execute:" + request.id);
        return behavior(request);
    }

    Behavior behavior;
    std::atomic<int> calls{0};

private:
    EventLog* log_;
};

class FakeQueryExecutor : public QueryExecutor {
public:
    ExecutionOutcome execute(const std::string& text, const std::optional<std::string>& schema) override {
        std::lock_guard<std::mutex> lock(mutex);
        texts.push_back(text);
        schemas.push_back(schema.value_or(""));
        return outcome;
    }

    void close() override { closed++; }

    std::mutex mutex;
    std::vector<std::string> texts;
    std::vector<std::string> schemas;
    ExecutionOutcome outcome = ExecutionOutcome::succeeded("[]", 0);
    std::atomic<int> closed{0};
};

class FakeSandbox : public ScriptSandbox {
public:
    ExecutionOutcome execute(const std::string& script, const ScriptEnvironment& environment) override {
        calls++;
        last_script = script;
        last_environment = environment;
        return outcome;
    }

    std::atomic<int> calls{0};
    std::string last_script;
    ScriptEnvironment last_environment;
    ExecutionOutcome outcome = ExecutionOutcome::succeeded("2", 1);
};

inline ExecutionRequest make_request(const std::string& id,
                                     const std::string& instance_id = "inst-1",
                                     const std::string& database = "orders") {
    ExecutionRequest request;
    request.id = id;
    request.user_id = "user-1";
    request.user_email = "dev@example.com";
    request.database_type = DatabaseType::postgresql;
    request.instance_id = instance_id;
    request.instance_name = "Primary";
    request.database_name = database;
    request.submission_type = SubmissionType::query;
    request.query_content = "SELECT 1";
    request.status = RequestStatus::approved;
    return request;
}

inline QueueJob make_job(const ExecutionRequest& request, const std::string& approver = "approver-1") {
    QueueJob job;
    job.id = "row-" + request.id;
    job.job_id = "job_" + request.id;
    job.channel_key = make_channel_key(request);
    job.request_id = request.id;
    job.approver_id = approver;
    return job;
}

} // namespace testing
} // namespace sluice

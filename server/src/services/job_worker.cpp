#include "sluice/job_worker.hpp"
#include "sluice/errors.hpp"
#include "sluice/logging.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace sluice {

namespace {

// Releases the channel lock and decrements the active counter on scope exit
class JobScope {
public:
    JobScope(LockProvider& locks, const std::string& channel_key, std::atomic<int>& active_jobs)
        : locks_(locks), channel_key_(channel_key), active_jobs_(active_jobs) {}

    ~JobScope() {
        try {
            locks_.release(channel_key_);
        } catch (const std::exception& e) {
            spdlog::error("[Worker] Failed to release lock for {}: {}", channel_key_, e.what());
        }
        active_jobs_--;
    }

    JobScope(const JobScope&) = delete;
    JobScope& operator=(const JobScope&) = delete;

private:
    LockProvider& locks_;
    const std::string& channel_key_;
    std::atomic<int>& active_jobs_;
};

} // anonymous namespace

JobWorker::JobWorker(std::shared_ptr<JobQueue> queue,
                     std::shared_ptr<LockProvider> locks,
                     std::shared_ptr<RequestStore> requests,
                     std::shared_ptr<RequestExecutor> executor,
                     std::shared_ptr<Notifier> notifier,
                     WorkerConfig worker_config,
                     QueueConfig queue_config)
    : queue_(std::move(queue)),
      locks_(std::move(locks)),
      requests_(std::move(requests)),
      executor_(std::move(executor)),
      notifier_(std::move(notifier)),
      worker_config_(std::move(worker_config)),
      queue_config_(std::move(queue_config)) {}

JobWorker::~JobWorker() {
    stop();
}

void JobWorker::process_job(const QueueJob& job) {
    active_jobs_++;
    spdlog::info("[Worker] Processing job {} (channel={}, request={})",
                 job.job_id, job.channel_key, job.request_id);

    if (!locks_->acquire(job.channel_key)) {
        active_jobs_--;
        spdlog::info("[Worker] Lock unavailable for {}, job {} will retry", job.channel_key, job.job_id);
        throw LockUnavailableError(job.channel_key);
    }

    JobScope scope(*locks_, job.channel_key, active_jobs_);

    try {
        run_locked(job);
    } catch (const std::exception& e) {
        spdlog::error("[Worker] Job {} failed (request={}, channel={}): {}",
                      job.job_id, job.request_id, job.channel_key, e.what());
        record_failure(job, e.what());
        throw;
    }
}

void JobWorker::run_locked(const QueueJob& job) {
    auto request = requests_->get_request_by_id(job.request_id);
    if (!request) {
        spdlog::error("[Worker] Request {} not found, dropping job {}", job.request_id, job.job_id);
        return;
    }

    if (is_terminal_outcome(request->status)) {
        spdlog::info("[Worker] Request {} already {}, skipping job {}",
                     request->id, to_string(request->status), job.job_id);
        audit::record("execution", "execution_skipped", "skipped", {
            {"jobId", job.job_id},
            {"requestId", request->id},
            {"queueKey", job.channel_key},
            {"status", to_string(request->status)}
        });
        return;
    }

    spdlog::info("[Worker] Executing request {} ({} {})",
                 request->id, to_string(request->database_type), to_string(request->submission_type));

    ExecutionOutcome outcome = executor_->execute_request(*request);

    auto updated = requests_->set_execution_outcome(request->id, outcome);

    audit::record("execution", outcome.success ? "query_executed" : "execution_failed",
                  outcome.success ? "success" : "failure", {
        {"jobId", job.job_id},
        {"requestId", request->id},
        {"queueKey", job.channel_key},
        {"approvedBy", job.approver_id},
        {"rowCount", outcome.row_count},
        {"category", to_string(outcome.category)},
        {"error", outcome.error}
    });

    send_notifications(updated ? *updated : *request, outcome, job.approver_id);

    spdlog::info("[Worker] Job {} completed (request={}, success={}, rows={})",
                 job.job_id, request->id, outcome.success, outcome.row_count);
}

void JobWorker::record_failure(const QueueJob& job, const std::string& error) {
    ExecutionOutcome failure = ExecutionOutcome::failed(ErrorCategory::internal, error);

    try {
        requests_->set_execution_outcome(job.request_id, failure);
    } catch (const std::exception& e) {
        spdlog::error("[Worker] Could not persist failure for request {}: {}", job.request_id, e.what());
    }

    try {
        auto request = requests_->get_request_by_id(job.request_id);
        if (request) {
            send_notifications(*request, failure, job.approver_id);
        }
    } catch (const std::exception& e) {
        spdlog::error("[Worker] Could not load request {} for failure notification: {}",
                      job.request_id, e.what());
    }
}

void JobWorker::send_notifications(const ExecutionRequest& request,
                                   const ExecutionOutcome& outcome,
                                   const std::string& approver_id) {
    try {
        notifier_->notify(NotificationKind::request_approved, request, approver_id, &outcome, "");
        notifier_->notify(outcome.success ? NotificationKind::execution_success : NotificationKind::execution_failed,
                          request, approver_id, &outcome, outcome.error);
        spdlog::debug("[Worker] Notifications sent for request {}", request.id);
    } catch (const std::exception& e) {
        spdlog::error("[Worker] Failed to send notifications for request {}: {}", request.id, e.what());
    }
}

void JobWorker::start() {
    if (running_) {
        spdlog::warn("[Worker] Worker already running");
        return;
    }

    consumer_ = std::make_unique<QueueConsumer>(
        queue_, [this](const QueueJob& job) { process_job(job); }, queue_config_);
    consumer_->start();
    running_ = true;

    spdlog::info("[Worker] Worker {} started (queue={}, concurrency={})",
                 worker_config_.worker_id, queue_config_.name, queue_config_.worker_concurrency);
    audit::record("system", "worker_started", "success", {
        {"workerId", worker_config_.worker_id},
        {"queueName", queue_config_.name},
        {"concurrency", queue_config_.worker_concurrency}
    });
}

void JobWorker::stop() {
    if (!running_) {
        return;
    }

    spdlog::info("[Worker] Stopping worker, waiting for {} active job(s)...", active_jobs_.load());
    consumer_->stop_accepting();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(queue_config_.shutdown_timeout_ms);
    while (active_jobs_ > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (active_jobs_ == 0) {
        consumer_->join();
    } else {
        spdlog::warn("[Worker] Shutdown timeout reached with {} active job(s)", active_jobs_.load());
    }

    running_ = false;
    spdlog::info("[Worker] Worker stopped");
    audit::record("system", "worker_stopped", "success", {
        {"workerId", worker_config_.worker_id},
        {"activeJobs", active_jobs_.load()}
    });
}

WorkerStatus JobWorker::status() const {
    WorkerStatus status;
    status.running = running_;
    status.active_jobs = active_jobs_;
    return status;
}

} // namespace sluice

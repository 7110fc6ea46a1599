#pragma once

#include "sluice/config.hpp"
#include "sluice/execution_router.hpp"
#include "sluice/job_queue.hpp"
#include "sluice/named_lock_service.hpp"
#include "sluice/notifier.hpp"
#include "sluice/queue_consumer.hpp"
#include "sluice/request_store.hpp"
#include <atomic>
#include <memory>

namespace sluice {

struct WorkerStatus {
    bool running = false;
    int active_jobs = 0;
};

/**
 * JobWorker - executes queued requests one channel at a time
 *
 * Per job: lock the channel, load the request, skip it if it already has a
 * terminal outcome, execute, persist the outcome and notify, all while the
 * channel lock is held. The lock is released and the active counter
 * decremented on every path.
 *
 * A contended lock raises LockUnavailableError without side effects. Any
 * other failure after the lock is taken is persisted as a failed outcome,
 * notified, and rethrown so the queue can redeliver the job.
 */
class JobWorker {
public:
    JobWorker(std::shared_ptr<JobQueue> queue,
              std::shared_ptr<LockProvider> locks,
              std::shared_ptr<RequestStore> requests,
              std::shared_ptr<RequestExecutor> executor,
              std::shared_ptr<Notifier> notifier,
              WorkerConfig worker_config,
              QueueConfig queue_config);
    ~JobWorker();

    JobWorker(const JobWorker&) = delete;
    JobWorker& operator=(const JobWorker&) = delete;

    void process_job(const QueueJob& job);

    void start();

    // Stops fetching, then waits up to shutdown_timeout_ms for active jobs
    void stop();

    WorkerStatus status() const;

private:
    void run_locked(const QueueJob& job);
    void record_failure(const QueueJob& job, const std::string& error);
    void send_notifications(const ExecutionRequest& request,
                            const ExecutionOutcome& outcome,
                            const std::string& approver_id);

    std::shared_ptr<JobQueue> queue_;
    std::shared_ptr<LockProvider> locks_;
    std::shared_ptr<RequestStore> requests_;
    std::shared_ptr<RequestExecutor> executor_;
    std::shared_ptr<Notifier> notifier_;
    WorkerConfig worker_config_;
    QueueConfig queue_config_;

    std::unique_ptr<QueueConsumer> consumer_;
    std::atomic<bool> running_{false};
    std::atomic<int> active_jobs_{0};
};

} // namespace sluice

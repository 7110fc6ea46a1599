#pragma once

#include "sluice/async_database.hpp"
#include "sluice/config.hpp"
#include "sluice/execution_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sluice {

/**
 * Durable, at-least-once job queue.
 *
 * Jobs sharing a channel key are handed out one at a time, oldest first.
 * The named lock stays the authoritative guard; this only keeps a second
 * job of a busy channel from being delivered while the first is outstanding.
 */
class JobQueue {
public:
    virtual ~JobQueue() = default;

    // Returns the new job id, or nullopt when the request already has an outstanding job
    virtual std::optional<std::string> enqueue(const std::string& channel_key,
                                               const std::string& request_id,
                                               const std::string& approver_id) = 0;

    // Claims up to batch_size jobs and marks them active
    virtual std::vector<QueueJob> fetch(int batch_size) = 0;

    virtual void complete(const QueueJob& job) = 0;

    // Schedules a retry after retry_delay_ms. Returns false once the retry budget is spent.
    virtual bool fail(const QueueJob& job, const std::string& error, int retry_delay_ms) = 0;

    // Offers the job again after delay_ms without consuming a retry
    virtual void defer(const QueueJob& job, int delay_ms) = 0;
};

class PgJobQueue : public JobQueue {
private:
    std::shared_ptr<AsyncDbPool> db_pool_;
    QueueConfig config_;

public:
    PgJobQueue(std::shared_ptr<AsyncDbPool> db_pool, QueueConfig config);

    std::optional<std::string> enqueue(const std::string& channel_key,
                                       const std::string& request_id,
                                       const std::string& approver_id) override;
    std::vector<QueueJob> fetch(int batch_size) override;
    void complete(const QueueJob& job) override;
    bool fail(const QueueJob& job, const std::string& error, int retry_delay_ms) override;
    void defer(const QueueJob& job, int delay_ms) override;
};

// Turns an approval into a queued execution
class ApprovalTrigger {
public:
    explicit ApprovalTrigger(std::shared_ptr<JobQueue> queue) : queue_(std::move(queue)) {}

    std::optional<std::string> on_approved(const ExecutionRequest& request, const std::string& approver_id);

private:
    std::shared_ptr<JobQueue> queue_;
};

} // namespace sluice

#pragma once

#include "sluice/async_database.hpp"
#include "sluice/config.hpp"
#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace sluice {

/**
 * QueueMaintenanceService - periodic housekeeping of the job tables
 *
 * Each cycle, under a cluster-wide advisory lock so only one worker process does it:
 * 1. Expire active jobs that outlived expire_in_ms (retry, or expired when out of retries)
 * 2. Move finished jobs older than archive_completed_after_seconds to jobs_archive
 * 3. Delete archived jobs older than delete_after_days
 */
class QueueMaintenanceService {
private:
    std::shared_ptr<AsyncDbPool> db_pool_;
    QueueConfig config_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

public:
    // Fixed cluster-wide lock id for the housekeeping cycle
    static constexpr int64_t MAINTENANCE_LOCK_ID = 737101;

    QueueMaintenanceService(std::shared_ptr<AsyncDbPool> db_pool, QueueConfig config);
    ~QueueMaintenanceService();

    void start();
    void stop();

    // One full cycle; returns false when another process held the lock
    bool run_cycle();

private:
    void loop();

    int expire_stalled_jobs(PGconn* conn);
    int archive_finished_jobs(PGconn* conn);
    int delete_archived_jobs(PGconn* conn);
};

} // namespace sluice

#pragma once

#include "sluice/async_database.hpp"
#include "sluice/backend_pool.hpp"
#include "sluice/config.hpp"
#include "sluice/job_queue.hpp"
#include "sluice/job_worker.hpp"
#include "sluice/named_lock_service.hpp"
#include "sluice/queue_maintenance_service.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace sluice {

// Throws ConfigurationError when the metadata pool can not serve the worker's
// lock sessions plus request loads; warns when it is merely tight
void check_pool_capacity(const DatabaseConfig& database, const QueueConfig& queue);

/**
 * WorkerDaemon - wires the execution engine together
 *
 * initialize() connects to the metadata store and applies the schema;
 * run() starts the worker and the maintenance service and blocks until
 * request_stop(). Shutdown order: worker, channel locks, maintenance,
 * target connections, metadata pool.
 */
class WorkerDaemon {
public:
    explicit WorkerDaemon(Config config);
    ~WorkerDaemon();

    void initialize();

    void run();

    // Safe to call from a signal handler
    void request_stop() { stop_requested_ = true; }

    void shutdown();

    // Queues an approved request by id; nullopt when a job is already outstanding
    std::optional<std::string> enqueue_request(const std::string& request_id, const std::string& approver_id);

private:
    Config config_;

    std::shared_ptr<AsyncDbPool> db_pool_;
    std::shared_ptr<NamedLockService> locks_;
    std::shared_ptr<PgJobQueue> queue_;
    std::shared_ptr<PgRequestStore> requests_;
    std::shared_ptr<BackendPool> backends_;
    std::unique_ptr<JobWorker> worker_;
    std::unique_ptr<QueueMaintenanceService> maintenance_;

    std::atomic<bool> stop_requested_{false};
    bool shut_down_ = false;
};

} // namespace sluice

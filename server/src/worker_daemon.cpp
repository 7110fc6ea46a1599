#include "sluice/worker_daemon.hpp"
#include "sluice/errors.hpp"
#include "sluice/execution_router.hpp"
#include "sluice/notifier.hpp"
#include "sluice/request_store.hpp"
#include "sluice/sandbox/script_sandbox.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace sluice {

void check_pool_capacity(const DatabaseConfig& database, const QueueConfig& queue) {
    // Each running job pins one connection for its channel lock
    if (database.pool_size <= queue.worker_concurrency) {
        throw ConfigurationError("DB_POOL_SIZE=" + std::to_string(database.pool_size) +
                                 " leaves no connection for request loads with WORKER_CONCURRENCY=" +
                                 std::to_string(queue.worker_concurrency) +
                                 "; use at least " + std::to_string(queue.worker_concurrency + 3));
    }
    int recommended = queue.worker_concurrency + 3;
    if (database.pool_size < recommended) {
        spdlog::warn("[Daemon] DB_POOL_SIZE={} is small for WORKER_CONCURRENCY={}, recommended at least {}",
                     database.pool_size, queue.worker_concurrency, recommended);
    }
}

WorkerDaemon::WorkerDaemon(Config config) : config_(std::move(config)) {}

WorkerDaemon::~WorkerDaemon() {
    shutdown();
}

void WorkerDaemon::initialize() {
    SessionSettings settings;
    settings.statement_timeout_ms = config_.database.statement_timeout;
    settings.lock_timeout_ms = config_.database.lock_timeout;
    settings.idle_in_transaction_timeout_ms = config_.database.idle_timeout;
    settings.connect_timeout_ms = config_.database.connection_timeout;

    check_pool_capacity(config_.database, config_.queue);

    spdlog::info("[Daemon] Creating metadata store pool ({} connections)", config_.database.pool_size);
    db_pool_ = std::make_shared<AsyncDbPool>(config_.database.connection_string(),
                                             config_.database.pool_size,
                                             settings,
                                             config_.database.pool_acquisition_timeout);

    initialize_schema(*db_pool_, config_.database.schema_dir);

    locks_ = std::make_shared<NamedLockService>(std::make_shared<PgAdvisoryLockSource>(db_pool_));
    queue_ = std::make_shared<PgJobQueue>(db_pool_, config_.queue);
    requests_ = std::make_shared<PgRequestStore>(db_pool_);

    backends_ = std::make_shared<BackendPool>(make_executor_factory(config_.target, config_.execution));
    auto router = std::make_shared<ExecutionRouter>(std::make_shared<PgInstanceDirectory>(db_pool_),
                                                    backends_,
                                                    std::make_shared<QuickJsSandbox>(config_.sandbox),
                                                    config_.target,
                                                    config_.execution);

    worker_ = std::make_unique<JobWorker>(queue_, locks_, requests_, router,
                                          std::make_shared<LogNotifier>(),
                                          config_.worker, config_.queue);
    maintenance_ = std::make_unique<QueueMaintenanceService>(db_pool_, config_.queue);

    spdlog::info("[Daemon] Initialized");
}

void WorkerDaemon::run() {
    if (!worker_) {
        throw SluiceError("WorkerDaemon::run called before initialize");
    }

    worker_->start();
    maintenance_->start();

    while (!stop_requested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Daemon] Stop requested");
    shutdown();
}

void WorkerDaemon::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (worker_) {
        worker_->stop();
    }
    if (locks_) {
        locks_->release_all();
    }
    if (maintenance_) {
        maintenance_->stop();
    }
    if (backends_) {
        backends_->close();
    }

    // The worker may still hold pooled connections if its drain timed out
    worker_.reset();
    maintenance_.reset();
    locks_.reset();
    queue_.reset();
    requests_.reset();
    db_pool_.reset();

    spdlog::info("[Daemon] Shutdown complete");
}

std::optional<std::string> WorkerDaemon::enqueue_request(const std::string& request_id,
                                                         const std::string& approver_id) {
    if (!requests_ || !queue_) {
        throw SluiceError("WorkerDaemon::enqueue_request called before initialize");
    }

    auto request = requests_->get_request_by_id(request_id);
    if (!request) {
        throw NotFoundError("Request not found: " + request_id);
    }
    if (request->status != RequestStatus::approved) {
        throw ValidationError("Request " + request_id + " is " + to_string(request->status) + ", not approved");
    }

    ApprovalTrigger trigger(queue_);
    return trigger.on_approved(*request, approver_id);
}

} // namespace sluice

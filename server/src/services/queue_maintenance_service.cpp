#include "sluice/queue_maintenance_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace sluice {

namespace {

int affected_rows(const PGResultPtr& result) {
    const char* tuples = PQcmdTuples(result.get());
    return (tuples && *tuples) ? std::atoi(tuples) : 0;
}

} // anonymous namespace

QueueMaintenanceService::QueueMaintenanceService(std::shared_ptr<AsyncDbPool> db_pool, QueueConfig config)
    : db_pool_(std::move(db_pool)), config_(std::move(config)) {
}

QueueMaintenanceService::~QueueMaintenanceService() {
    stop();
}

void QueueMaintenanceService::start() {
    if (running_) {
        spdlog::warn("[Maintenance] Already running");
        return;
    }

    running_ = true;
    thread_ = std::thread(&QueueMaintenanceService::loop, this);

    spdlog::info("[Maintenance] Started: interval={}s, archive_after={}s, delete_after={}d",
                 config_.maintenance_interval_seconds,
                 config_.archive_completed_after_seconds,
                 config_.delete_after_days);
}

void QueueMaintenanceService::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("[Maintenance] Stopped");
}

void QueueMaintenanceService::loop() {
    while (running_) {
        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("[Maintenance] Cycle error: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::seconds(config_.maintenance_interval_seconds),
                          [this] { return !running_.load(); });
    }
}

bool QueueMaintenanceService::run_cycle() {
    auto conn = db_pool_->acquire();

    sendQueryParamsAsync(conn.get(),
        "SELECT pg_try_advisory_lock($1::bigint)",
        {std::to_string(MAINTENANCE_LOCK_ID)});
    auto lock_result = getTuplesResult(conn.get());
    bool has_lock = PQntuples(lock_result.get()) > 0 &&
                    std::string(PQgetvalue(lock_result.get(), 0, 0)) == "t";

    if (!has_lock) {
        spdlog::debug("[Maintenance] Skipping cycle, another instance holds the lock");
        return false;
    }

    auto cycle_start = std::chrono::steady_clock::now();
    std::string cycle_error;
    int expired = 0;
    int archived = 0;
    int deleted = 0;

    try {
        expired = expire_stalled_jobs(conn.get());
        archived = archive_finished_jobs(conn.get());
        deleted = delete_archived_jobs(conn.get());
    } catch (const std::exception& e) {
        cycle_error = e.what();
    }

    // Always release the lock we acquired
    try {
        sendQueryParamsAsync(conn.get(),
            "SELECT pg_advisory_unlock($1::bigint)",
            {std::to_string(MAINTENANCE_LOCK_ID)});
        getTuplesResult(conn.get());
    } catch (const std::exception& e) {
        spdlog::warn("[Maintenance] Failed to release lock explicitly, resetting connection: {}", e.what());
        PQreset(conn.get());
    }

    if (!cycle_error.empty()) {
        throw std::runtime_error(cycle_error);
    }

    if (expired > 0 || archived > 0 || deleted > 0) {
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - cycle_start).count();
        spdlog::info("[Maintenance] expired={}, archived={}, deleted={} ({}ms)",
                     expired, archived, deleted, duration_ms);
    }
    return true;
}

int QueueMaintenanceService::expire_stalled_jobs(PGconn* conn) {
    sendQueryParamsAsync(conn, R"(
        UPDATE sluice.jobs
        SET state = CASE WHEN retry_count < retry_limit THEN 'retry' ELSE 'expired' END,
            retry_count = CASE WHEN retry_count < retry_limit THEN retry_count + 1 ELSE retry_count END,
            completed_on = CASE WHEN retry_count < retry_limit THEN NULL ELSE NOW() END,
            start_after = NOW(),
            started_on = NULL,
            last_error = 'Job expired after ' || expire_in_ms || 'ms'
        WHERE name = $1
          AND state = 'active'
          AND started_on + (expire_in_ms * INTERVAL '1 millisecond') < NOW()
    )", {config_.name});
    return affected_rows(getCommandResultPtr(conn));
}

int QueueMaintenanceService::archive_finished_jobs(PGconn* conn) {
    sendQueryParamsAsync(conn, R"(
        WITH moved AS (
            DELETE FROM sluice.jobs
            WHERE name = $1
              AND state IN ('completed', 'failed', 'expired')
              AND completed_on < NOW() - ($2::int * INTERVAL '1 second')
            RETURNING *
        )
        INSERT INTO sluice.jobs_archive (
            id, name, singleton_key, request_id, payload, state, retry_count, retry_limit,
            start_after, expire_in_ms, created_on, started_on, completed_on, last_error)
        SELECT id, name, singleton_key, request_id, payload, state, retry_count, retry_limit,
               start_after, expire_in_ms, created_on, started_on, completed_on, last_error
        FROM moved
        ON CONFLICT (id) DO NOTHING
    )", {config_.name, std::to_string(config_.archive_completed_after_seconds)});
    return affected_rows(getCommandResultPtr(conn));
}

int QueueMaintenanceService::delete_archived_jobs(PGconn* conn) {
    sendQueryParamsAsync(conn, R"(
        DELETE FROM sluice.jobs_archive
        WHERE name = $1
          AND archived_on < NOW() - ($2::int * INTERVAL '1 day')
    )", {config_.name, std::to_string(config_.delete_after_days)});
    return affected_rows(getCommandResultPtr(conn));
}

} // namespace sluice

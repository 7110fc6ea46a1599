#include "sluice/job_queue.hpp"
#include "sluice/ids.hpp"
#include "sluice/logging.hpp"
#include <spdlog/spdlog.h>

namespace sluice {

PgJobQueue::PgJobQueue(std::shared_ptr<AsyncDbPool> db_pool, QueueConfig config)
    : db_pool_(std::move(db_pool)), config_(std::move(config)) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
}

std::optional<std::string> PgJobQueue::enqueue(const std::string& channel_key,
                                               const std::string& request_id,
                                               const std::string& approver_id) {
    QueueJob job;
    job.id = generate_uuid();
    job.job_id = generate_job_id();
    job.channel_key = channel_key;
    job.request_id = request_id;
    job.approver_id = approver_id;

    std::string sql = R"(
        INSERT INTO sluice.jobs (id, name, singleton_key, request_id, payload, retry_limit, expire_in_ms)
        VALUES ($1::uuid, $2, $3, $4, $5::jsonb, $6::int, $7::int)
        ON CONFLICT (name, request_id) WHERE state IN ('created', 'retry', 'active') DO NOTHING
        RETURNING id
    )";

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, {
        job.id,
        config_.name,
        channel_key,
        request_id,
        job.to_payload().dump(),
        std::to_string(config_.max_retries),
        std::to_string(config_.job_timeout_ms)
    });
    auto result = getTuplesResult(conn.get());

    if (PQntuples(result.get()) == 0) {
        spdlog::info("[JobQueue] Request {} already has an outstanding job, not enqueued", request_id);
        return std::nullopt;
    }

    spdlog::info("[JobQueue] Job enqueued: id={}, queueKey={}, requestId={}", job.id, channel_key, request_id);
    return job.id;
}

std::vector<QueueJob> PgJobQueue::fetch(int batch_size) {
    // Only the oldest pending job of each channel is eligible, and only while
    // no job of that channel is active.
    std::string sql = R"(
        WITH next AS (
            SELECT j.id
            FROM sluice.jobs j
            WHERE j.name = $1
              AND j.state IN ('created', 'retry')
              AND j.start_after <= NOW()
              AND NOT EXISTS (
                  SELECT 1 FROM sluice.jobs o
                  WHERE o.name = j.name
                    AND o.singleton_key = j.singleton_key
                    AND o.id <> j.id
                    AND (o.state = 'active'
                         OR (o.state IN ('created', 'retry')
                             AND (o.created_on, o.id) < (j.created_on, j.id)))
              )
            ORDER BY j.created_on, j.id
            LIMIT $2::int
            FOR UPDATE SKIP LOCKED
        )
        UPDATE sluice.jobs j
        SET state = 'active', started_on = NOW()
        FROM next
        WHERE j.id = next.id
        RETURNING j.id, j.payload, j.retry_count, j.created_on
    )";

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, {config_.name, std::to_string(batch_size)});
    auto result = getTuplesResult(conn.get());

    std::vector<QueueJob> jobs;
    std::vector<std::pair<QueueJob, std::string>> unreadable;
    int rows = PQntuples(result.get());
    for (int i = 0; i < rows; ++i) {
        std::string id = PQgetvalue(result.get(), i, 0);
        try {
            auto payload = nlohmann::json::parse(PQgetvalue(result.get(), i, 1));
            QueueJob job = QueueJob::from_payload(id, payload);
            job.retry_count = std::atoi(PQgetvalue(result.get(), i, 2));
            jobs.push_back(std::move(job));
        } catch (const std::exception& e) {
            spdlog::error("[JobQueue] Dropping job {} with unreadable payload: {}", id, e.what());
            QueueJob broken;
            broken.id = id;
            unreadable.emplace_back(broken, std::string("Unreadable payload: ") + e.what());
        }
    }
    result.reset();
    conn.reset();

    for (const auto& entry : unreadable) {
        fail(entry.first, entry.second, 0);
    }

    if (rows > 0) {
        spdlog::debug("[JobQueue] Fetched {} job(s) from {}", rows, config_.name);
    }
    return jobs;
}

void PgJobQueue::complete(const QueueJob& job) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), R"(
        UPDATE sluice.jobs
        SET state = 'completed', completed_on = NOW()
        WHERE id = $1::uuid AND state = 'active'
    )", {job.id});
    auto result = getCommandResultPtr(conn.get());

    if (std::string(PQcmdTuples(result.get())) == "0") {
        spdlog::warn("[JobQueue] Job {} was no longer active when completed", job.id);
    }
}

bool PgJobQueue::fail(const QueueJob& job, const std::string& error, int retry_delay_ms) {
    std::string sql = R"(
        UPDATE sluice.jobs
        SET state = CASE WHEN retry_count < retry_limit THEN 'retry' ELSE 'failed' END,
            retry_count = CASE WHEN retry_count < retry_limit THEN retry_count + 1 ELSE retry_count END,
            start_after = CASE WHEN retry_count < retry_limit
                               THEN NOW() + ($2::int * INTERVAL '1 millisecond')
                               ELSE start_after END,
            completed_on = CASE WHEN retry_count < retry_limit THEN NULL ELSE NOW() END,
            started_on = NULL,
            last_error = $3
        WHERE id = $1::uuid AND state = 'active'
        RETURNING state
    )";

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, {job.id, std::to_string(retry_delay_ms), error});
    auto result = getTuplesResult(conn.get());

    if (PQntuples(result.get()) == 0) {
        spdlog::warn("[JobQueue] Job {} was no longer active when failed", job.id);
        return false;
    }

    bool will_retry = std::string(PQgetvalue(result.get(), 0, 0)) == "retry";
    if (will_retry) {
        spdlog::warn("[JobQueue] Job {} failed (attempt {}), retrying in {}ms: {}",
                     job.id, job.retry_count + 1, retry_delay_ms, error);
    } else {
        spdlog::error("[JobQueue] Job {} failed permanently after {} retries: {}",
                      job.id, job.retry_count, error);
    }
    return will_retry;
}

void PgJobQueue::defer(const QueueJob& job, int delay_ms) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), R"(
        UPDATE sluice.jobs
        SET state = 'retry',
            started_on = NULL,
            start_after = NOW() + ($2::int * INTERVAL '1 millisecond')
        WHERE id = $1::uuid AND state = 'active'
    )", {job.id, std::to_string(delay_ms)});
    getCommandResult(conn.get());

    spdlog::debug("[JobQueue] Job {} deferred by {}ms", job.id, delay_ms);
}

std::optional<std::string> ApprovalTrigger::on_approved(const ExecutionRequest& request,
                                                        const std::string& approver_id) {
    std::string channel_key = make_channel_key(request);
    auto job_id = queue_->enqueue(channel_key, request.id, approver_id);

    audit::record("execution", "job_enqueued", job_id ? "success" : "skipped", {
        {"requestId", request.id},
        {"queueKey", channel_key},
        {"approvedBy", approver_id},
        {"jobId", job_id ? *job_id : ""}
    });
    return job_id;
}

} // namespace sluice

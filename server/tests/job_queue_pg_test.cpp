/**
 * Job Queue Tests (PostgreSQL)
 *
 * Exercises the durable queue against a live database: deduplication,
 * head-of-line delivery per channel, retries, deferral, advisory locks and
 * the maintenance cycle. Every live test is skipped when PG_HOST is unset.
 */

#include "sluice/async_database.hpp"
#include "sluice/config.hpp"
#include "sluice/ids.hpp"
#include "sluice/job_queue.hpp"
#include "sluice/named_lock_service.hpp"
#include "sluice/queue_maintenance_service.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>

using namespace sluice;

namespace {

std::shared_ptr<AsyncDbPool> g_pool;

bool pg_configured() {
    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  Skipping test - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return false;
    }
    return true;
}

std::shared_ptr<AsyncDbPool> pool() {
    if (!g_pool) {
        auto db_config = DatabaseConfig::from_env();
        g_pool = std::make_shared<AsyncDbPool>(db_config.connection_string(), 4);
        initialize_schema(*g_pool, db_config.schema_dir);
    }
    return g_pool;
}

// Each test works on its own queue name so runs never see each other's jobs
QueueConfig fresh_queue(int max_retries = 3) {
    QueueConfig config;
    config.name = "test_" + generate_uuid();
    config.max_retries = max_retries;
    return config;
}

void drop_queue(const QueueConfig& config) {
    auto conn = pool()->acquire();
    sendQueryParamsAsync(conn.get(), "DELETE FROM sluice.jobs WHERE name = $1", {config.name});
    getCommandResult(conn.get());
}

std::vector<std::string> request_ids(const std::vector<QueueJob>& jobs) {
    std::vector<std::string> ids;
    for (const auto& job : jobs) ids.push_back(job.request_id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // anonymous namespace

bool test_id_formats() {
    std::cout << "\n=== Test: Id Formats ===" << std::endl;

    std::string uuid = generate_uuid();
    TEST_ASSERT(uuid.size() == 36, "UUID has canonical length");
    TEST_ASSERT(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' && uuid[23] == '-', "UUID dashes in place");
    TEST_ASSERT(uuid[14] == '7', "UUID carries version 7");
    TEST_ASSERT(generate_uuid() != uuid, "UUIDs are unique");

    std::string job_id = generate_job_id();
    TEST_ASSERT(job_id.rfind("job_", 0) == 0, "Job id starts with job_");
    size_t second = job_id.find('_', 4);
    TEST_ASSERT(second != std::string::npos, "Job id has a timestamp segment");
    std::string millis = job_id.substr(4, second - 4);
    TEST_ASSERT(!millis.empty() && std::all_of(millis.begin(), millis.end(), ::isdigit), "Timestamp is numeric");
    TEST_ASSERT(job_id.size() - second - 1 == 9, "Random suffix has 9 characters");

    return true;
}

bool test_enqueue_deduplicates_per_request() {
    std::cout << "\n=== Test: Enqueue Deduplication ===" << std::endl;
    if (!pg_configured()) return true;

    auto config = fresh_queue();
    PgJobQueue queue(pool(), config);

    auto first = queue.enqueue("postgresql:i1:orders", "req-1", "approver-1");
    auto second = queue.enqueue("postgresql:i1:orders", "req-1", "approver-2");
    TEST_ASSERT(first.has_value(), "First enqueue creates a job");
    TEST_ASSERT(!second.has_value(), "Second enqueue for the same request is skipped");

    auto jobs = queue.fetch(10);
    TEST_ASSERT(jobs.size() == 1, "Exactly one job delivered");
    TEST_ASSERT(jobs[0].approver_id == "approver-1", "Payload of the first enqueue kept");
    queue.complete(jobs[0]);

    auto again = queue.enqueue("postgresql:i1:orders", "req-1", "approver-3");
    TEST_ASSERT(again.has_value(), "Request can be enqueued again once its job finished");

    drop_queue(config);
    return true;
}

bool test_head_of_line_per_channel() {
    std::cout << "\n=== Test: Head Of Line Per Channel ===" << std::endl;
    if (!pg_configured()) return true;

    auto config = fresh_queue();
    PgJobQueue queue(pool(), config);

    queue.enqueue("postgresql:i1:a", "a-1", "approver");
    queue.enqueue("postgresql:i1:a", "a-2", "approver");
    queue.enqueue("postgresql:i1:b", "b-1", "approver");

    auto batch = queue.fetch(10);
    TEST_ASSERT(request_ids(batch) == std::vector<std::string>({"a-1", "b-1"}),
                "Only the oldest job of each channel delivered");
    for (const auto& job : batch) {
        TEST_ASSERT(job.channel_key.rfind("postgresql:i1:", 0) == 0, "Channel key round-trips through the payload");
    }

    TEST_ASSERT(queue.fetch(10).empty(), "Nothing else while channel a is active");

    for (const auto& job : batch) {
        if (job.request_id == "a-1") queue.complete(job);
    }
    auto next = queue.fetch(10);
    TEST_ASSERT(request_ids(next) == std::vector<std::string>({"a-2"}), "Next job of channel a delivered after completion");

    for (const auto& job : batch) {
        if (job.request_id == "b-1") queue.complete(job);
    }
    queue.complete(next[0]);

    drop_queue(config);
    return true;
}

bool test_fail_retries_then_gives_up() {
    std::cout << "\n=== Test: Fail And Retry ===" << std::endl;
    if (!pg_configured()) return true;

    auto config = fresh_queue(1);
    PgJobQueue queue(pool(), config);

    queue.enqueue("postgresql:i1:c", "c-1", "approver");

    auto first = queue.fetch(1);
    TEST_ASSERT(first.size() == 1 && first[0].retry_count == 0, "First delivery has no retries");
    TEST_ASSERT(queue.fail(first[0], "connection refused", 0), "Failure within budget schedules a retry");

    auto second = queue.fetch(1);
    TEST_ASSERT(second.size() == 1 && second[0].retry_count == 1, "Retry delivered with retry_count 1");
    TEST_ASSERT(!queue.fail(second[0], "connection refused", 0), "Failure past the budget is final");

    TEST_ASSERT(queue.fetch(1).empty(), "Failed job not delivered again");

    auto conn = pool()->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT state, last_error FROM sluice.jobs WHERE name = $1", {config.name});
    auto result = getTuplesResult(conn.get());
    TEST_ASSERT(PQntuples(result.get()) == 1, "Job row still present");
    TEST_ASSERT(std::string(PQgetvalue(result.get(), 0, 0)) == "failed", "Job state is failed");
    TEST_ASSERT(std::string(PQgetvalue(result.get(), 0, 1)) == "connection refused", "Last error stored");
    result.reset();
    conn.reset();

    drop_queue(config);
    return true;
}

bool test_defer_consumes_no_retry() {
    std::cout << "\n=== Test: Defer ===" << std::endl;
    if (!pg_configured()) return true;

    auto config = fresh_queue();
    PgJobQueue queue(pool(), config);

    queue.enqueue("postgresql:i1:d", "d-1", "approver");
    auto jobs = queue.fetch(1);
    TEST_ASSERT(jobs.size() == 1, "Job delivered");

    queue.defer(jobs[0], 60000);
    TEST_ASSERT(queue.fetch(1).empty(), "Deferred job waits for its delay");

    queue.defer(jobs[0], 0);
    auto conn = pool()->acquire();
    sendQueryParamsAsync(conn.get(),
        "UPDATE sluice.jobs SET start_after = NOW() WHERE name = $1", {config.name});
    getCommandResult(conn.get());
    conn.reset();

    auto again = queue.fetch(1);
    TEST_ASSERT(again.size() == 1, "Deferred job delivered once due");
    TEST_ASSERT(again[0].retry_count == 0, "Deferral did not consume a retry");
    queue.complete(again[0]);

    drop_queue(config);
    return true;
}

bool test_advisory_lock_contention() {
    std::cout << "\n=== Test: Advisory Lock Contention ===" << std::endl;
    if (!pg_configured()) return true;

    auto source = std::make_shared<PgAdvisoryLockSource>(pool());
    NamedLockService first(source);
    NamedLockService second(source);

    std::string key = "postgresql:" + generate_uuid() + ":orders";
    TEST_ASSERT(first.acquire(key), "First service acquires the channel");
    TEST_ASSERT(!second.acquire(key), "Second service is refused while it is held");

    first.release(key);
    TEST_ASSERT(second.acquire(key), "Second service acquires after release");
    second.release(key);

    TEST_ASSERT(first.active_lock_count() == 0 && second.active_lock_count() == 0, "No locks left behind");

    return true;
}

bool test_maintenance_cycle() {
    std::cout << "\n=== Test: Maintenance Cycle ===" << std::endl;
    if (!pg_configured()) return true;

    auto config = fresh_queue(0);
    config.job_timeout_ms = 1;
    PgJobQueue queue(pool(), config);

    queue.enqueue("postgresql:i1:m", "m-1", "approver");
    auto jobs = queue.fetch(1);
    TEST_ASSERT(jobs.size() == 1, "Job active");

    {
        auto conn = pool()->acquire();
        sendQueryParamsAsync(conn.get(),
            "UPDATE sluice.jobs SET started_on = NOW() - INTERVAL '1 minute' WHERE name = $1", {config.name});
        getCommandResult(conn.get());
    }

    QueueMaintenanceService maintenance(pool(), config);
    TEST_ASSERT(maintenance.run_cycle(), "Cycle ran under the maintenance lock");

    auto conn = pool()->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT state FROM sluice.jobs WHERE name = $1", {config.name});
    auto result = getTuplesResult(conn.get());
    TEST_ASSERT(PQntuples(result.get()) == 1, "Stalled job still recorded");
    TEST_ASSERT(std::string(PQgetvalue(result.get(), 0, 0)) == "expired", "Stalled job without retries expired");
    result.reset();
    conn.reset();

    drop_queue(config);
    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Job Queue Tests (PostgreSQL)                         ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    try {
        all_passed &= test_id_formats();
        all_passed &= test_enqueue_deduplicates_per_request();
        all_passed &= test_head_of_line_per_channel();
        all_passed &= test_fail_retries_then_gives_up();
        all_passed &= test_defer_consumes_no_retry();
        all_passed &= test_advisory_lock_contention();
        all_passed &= test_maintenance_cycle();
    } catch (const std::exception& e) {
        std::cerr << "❌ Unexpected error: " << e.what() << std::endl;
        all_passed = false;
    }

    g_pool.reset();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}

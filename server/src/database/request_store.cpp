#include "sluice/request_store.hpp"
#include <spdlog/spdlog.h>
#include <ctime>

namespace sluice {

namespace {

const char* REQUEST_COLUMNS = R"(
    id::text, user_id::text, user_email, database_type, instance_id::text, instance_name,
    database_name, schema_name, submission_type, query, script_file_name, script_content,
    status, approver_email, execution_result, execution_error,
    COALESCE(is_compressed, false), COALESCE(result_original_size, 0),
    EXTRACT(EPOCH FROM executed_at)::bigint
)";

std::string text_at(const PGresult* result, int row, int col) {
    return PQgetisnull(result, row, col) ? std::string() : std::string(PQgetvalue(result, row, col));
}

ExecutionRequest request_from_row(const PGresult* result, int row) {
    ExecutionRequest request;
    request.id = text_at(result, row, 0);
    request.user_id = text_at(result, row, 1);
    request.user_email = text_at(result, row, 2);
    request.database_type = parse_database_type(text_at(result, row, 3));
    request.instance_id = text_at(result, row, 4);
    request.instance_name = text_at(result, row, 5);
    request.database_name = text_at(result, row, 6);
    if (!PQgetisnull(result, row, 7) && !text_at(result, row, 7).empty()) {
        request.schema_name = text_at(result, row, 7);
    }
    request.submission_type = parse_submission_type(text_at(result, row, 8));
    request.query_content = text_at(result, row, 9);
    request.script_filename = text_at(result, row, 10);
    request.script_content = text_at(result, row, 11);
    request.status = parse_request_status(text_at(result, row, 12));
    request.approver_id = text_at(result, row, 13);
    request.execution_result = text_at(result, row, 14);
    request.execution_error = text_at(result, row, 15);
    request.is_compressed = text_at(result, row, 16) == "t";
    request.result_original_size = std::stoll(text_at(result, row, 17));
    if (!PQgetisnull(result, row, 18)) {
        request.executed_at = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(std::stoll(text_at(result, row, 18))));
    }
    return request;
}

} // anonymous namespace

std::optional<ExecutionRequest> PgRequestStore::get_request_by_id(const std::string& id) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        std::string("SELECT ") + REQUEST_COLUMNS + " FROM query_requests WHERE id::text = $1",
        {id});
    auto result = getTuplesResult(conn.get());

    if (PQntuples(result.get()) == 0) {
        return std::nullopt;
    }
    return request_from_row(result.get(), 0);
}

std::optional<ExecutionRequest> PgRequestStore::set_execution_outcome(const std::string& id,
                                                                      const ExecutionOutcome& outcome) {
    std::string sql = std::string(R"(
        UPDATE query_requests
        SET status = $2,
            execution_result = NULLIF($3, ''),
            execution_error = NULLIF($4, ''),
            is_compressed = $5::boolean,
            result_original_size = $6::bigint,
            executed_at = NOW(),
            updated_at = NOW()
        WHERE id::text = $1
        RETURNING )") + REQUEST_COLUMNS;

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, {
        id,
        to_string(outcome.success ? RequestStatus::executed : RequestStatus::failed),
        outcome.output,
        outcome.error,
        outcome.compressed ? "true" : "false",
        std::to_string(outcome.original_size)
    });
    auto result = getTuplesResult(conn.get());

    if (PQntuples(result.get()) == 0) {
        spdlog::warn("[Worker] Outcome for unknown request {} not stored", id);
        return std::nullopt;
    }
    return request_from_row(result.get(), 0);
}

std::optional<DatabaseInstance> PgInstanceDirectory::find_instance(const std::string& id) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT id::text, name, type, host, port FROM database_instances WHERE id::text = $1",
        {id});
    auto result = getTuplesResult(conn.get());

    if (PQntuples(result.get()) == 0) {
        return std::nullopt;
    }

    DatabaseInstance instance;
    instance.id = PQgetvalue(result.get(), 0, 0);
    instance.name = PQgetvalue(result.get(), 0, 1);
    instance.type = parse_database_type(PQgetvalue(result.get(), 0, 2));
    instance.host = PQgetvalue(result.get(), 0, 3);
    instance.port = std::atoi(PQgetvalue(result.get(), 0, 4));
    return instance;
}

} // namespace sluice

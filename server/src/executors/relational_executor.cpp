#include "sluice/executors/relational_executor.hpp"
#include "sluice/errors.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <chrono>

namespace sluice {

namespace {

// Single-quotes a conninfo value, escaping backslashes and quotes
std::string conninfo_value(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

bool starts_with_keyword(const std::string& sql, size_t pos, const char* keyword) {
    size_t i = 0;
    for (; keyword[i] != '\0'; ++i) {
        if (pos + i >= sql.size()) return false;
        if (std::toupper(static_cast<unsigned char>(sql[pos + i])) != keyword[i]) return false;
    }
    size_t end = pos + i;
    return end == sql.size() || !(std::isalnum(static_cast<unsigned char>(sql[end])) || sql[end] == '_');
}

} // anonymous namespace

bool is_read_statement(const std::string& sql) {
    size_t pos = 0;
    while (pos < sql.size() && (std::isspace(static_cast<unsigned char>(sql[pos])) || sql[pos] == '(')) {
        ++pos;
    }
    return starts_with_keyword(sql, pos, "SELECT") || starts_with_keyword(sql, pos, "WITH");
}

std::string build_count_query(const std::string& sql) {
    size_t end = sql.size();
    while (end > 0 && (std::isspace(static_cast<unsigned char>(sql[end - 1])) || sql[end - 1] == ';')) {
        --end;
    }
    return "SELECT COUNT(*) FROM (" + sql.substr(0, end) + "\n) AS sluice_row_estimate";
}

std::optional<std::string> row_limit_violation(int64_t estimated_rows, int64_t max_rows) {
    if (max_rows <= 0 || estimated_rows <= max_rows) {
        return std::nullopt;
    }
    return "Query would return " + std::to_string(estimated_rows) +
           " rows, which exceeds the limit of " + std::to_string(max_rows) +
           " rows. Add a LIMIT clause or narrow the filters.";
}

bool is_timeout_error_text(const std::string& message) {
    return message.find("statement timeout") != std::string::npos;
}

std::string query_timeout_message(int timeout_ms) {
    return "Query exceeded " + std::to_string(timeout_ms / 1000) +
           " second timeout. Please optimize your query or add filters to reduce execution time.";
}

std::string RelationalTarget::connection_string() const {
    return "host=" + conninfo_value(host) +
           " port=" + std::to_string(port) +
           " dbname=" + conninfo_value(database) +
           " user=" + conninfo_value(user) +
           " password=" + conninfo_value(password) +
           (use_ssl ? " sslmode=require" : " sslmode=disable") +
           " connect_timeout=" + std::to_string(connect_timeout_seconds) +
           " client_encoding=UTF8" +
           " application_name=sluice-executor";
}

RelationalExecutor::RelationalExecutor(RelationalTarget target, ExecutionConfig config)
    : target_(std::move(target)), config_(std::move(config)) {
}

RelationalExecutor::~RelationalExecutor() {
    close();
}

void RelationalExecutor::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        spdlog::debug("[RelationalExecutor] Closing connection to {}:{}/{}", target_.host, target_.port, target_.database);
        conn_.reset();
    }
}

PGconn* RelationalExecutor::ensure_connected() {
    if (conn_ && PQstatus(conn_.get()) == CONNECTION_OK) {
        return conn_.get();
    }
    conn_.reset();

    SessionSettings settings;
    settings.statement_timeout_ms = config_.query_timeout_ms;
    settings.lock_timeout_ms = config_.query_timeout_ms;
    settings.idle_in_transaction_timeout_ms = config_.query_timeout_ms;
    settings.connect_timeout_ms = target_.connect_timeout_seconds * 1000;

    try {
        conn_ = asyncConnect(target_.connection_string().c_str(), settings);
    } catch (const std::exception& e) {
        throw ConfigurationError("Failed to connect to " + target_.host + ":" +
                                 std::to_string(target_.port) + "/" + target_.database + ": " + e.what());
    }

    spdlog::info("[RelationalExecutor] Connected to {}:{}/{}", target_.host, target_.port, target_.database);
    return conn_.get();
}

void RelationalExecutor::run_command(const std::string& sql) {
    sendAndWait(conn_.get(), sql.c_str());
    getCommandResult(conn_.get());
}

// Settings from an earlier request (its schema, or SET commands in its text)
// must not apply to this one
void RelationalExecutor::reset_session() {
    run_command("RESET ALL");
    run_command("RESET ROLE");
    run_command("SET statement_timeout = " + std::to_string(config_.query_timeout_ms));
    run_command("SET lock_timeout = " + std::to_string(config_.query_timeout_ms));
    run_command("SET idle_in_transaction_session_timeout = " + std::to_string(config_.query_timeout_ms));
}

// A transaction left open by the submitted text must not leak into the next request
void RelationalExecutor::rollback_open_transaction() {
    if (!conn_) return;
    PGTransactionStatusType status = PQtransactionStatus(conn_.get());
    if (status == PQTRANS_INTRANS || status == PQTRANS_INERROR) {
        spdlog::warn("[RelationalExecutor] Rolling back transaction left open by the statement");
        try {
            run_command("ROLLBACK");
        } catch (const std::exception& e) {
            spdlog::error("[RelationalExecutor] Rollback failed, dropping connection: {}", e.what());
            conn_.reset();
        }
    }
}

std::optional<int64_t> RelationalExecutor::estimate_rows(const std::string& sql) {
    // Read-only transaction so a data-modifying CTE can not take effect during the estimate
    run_command("BEGIN TRANSACTION READ ONLY");

    std::optional<int64_t> estimate;
    std::string failure;
    try {
        std::string count_sql = build_count_query(sql);
        sendAndWait(conn_.get(), count_sql.c_str());
        auto result = getTuplesResult(conn_.get());
        if (PQntuples(result.get()) > 0) {
            estimate = std::stoll(PQgetvalue(result.get(), 0, 0));
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    run_command("ROLLBACK");

    if (!failure.empty()) {
        if (is_timeout_error_text(failure)) {
            throw TimeoutError(failure);
        }
        spdlog::warn("[RelationalExecutor] Row estimate skipped: {}", failure);
    }
    return estimate;
}

ExecutionOutcome RelationalExecutor::execute(const std::string& text, const std::optional<std::string>& schema) {
    auto start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        PGconn* conn = ensure_connected();

        reset_session();

        if (schema && !schema->empty()) {
            char* escaped = PQescapeIdentifier(conn, schema->c_str(), schema->size());
            if (!escaped) {
                return ExecutionOutcome::failed(ErrorCategory::validation,
                                                "Invalid schema name: " + *schema);
            }
            std::string identifier(escaped);
            PQfreemem(escaped);
            run_command("SET search_path TO " + identifier + ", public");
        }

        if (config_.row_estimate_enabled && config_.max_result_rows > 0 && is_read_statement(text)) {
            auto estimate = estimate_rows(text);
            if (estimate) {
                auto violation = row_limit_violation(*estimate, config_.max_result_rows);
                if (violation) {
                    spdlog::warn("[RelationalExecutor] Rejected before execution: {} rows > {}",
                                 *estimate, config_.max_result_rows);
                    return ExecutionOutcome::failed(ErrorCategory::resource_limit, *violation);
                }
            }
        }

        spdlog::debug("[RelationalExecutor] Executing: {}", text.substr(0, 100));

        sendAndWait(conn, text.c_str());
        auto result = getLastResult(conn);
        rollback_open_transaction();

        std::string output;
        int64_t row_count = 0;
        const char* affected = PQcmdTuples(result.get());

        if (PQresultStatus(result.get()) == PGRES_TUPLES_OK && PQntuples(result.get()) > 0) {
            row_count = PQntuples(result.get());
            output = resultToJson(result.get()).dump(2);
        } else if (affected && *affected) {
            row_count = std::stoll(affected);
            output = std::string(affected) + " row(s) affected";
        } else {
            output = "Query executed successfully";
        }

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        spdlog::info("[RelationalExecutor] Query executed: rows={}, duration={}ms", row_count, duration_ms);

        return ExecutionOutcome::succeeded(std::move(output), row_count);

    } catch (const ConfigurationError& e) {
        spdlog::error("[RelationalExecutor] {}", e.what());
        return ExecutionOutcome::failed(ErrorCategory::configuration, e.what());
    } catch (const TimeoutError&) {
        spdlog::warn("[RelationalExecutor] Row estimate timed out after {}ms", config_.query_timeout_ms);
        return ExecutionOutcome::failed(ErrorCategory::timeout, query_timeout_message(config_.query_timeout_ms));
    } catch (const std::exception& e) {
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        std::string message = e.what();

        if (conn_ && PQstatus(conn_.get()) != CONNECTION_OK) {
            conn_.reset();
        } else {
            rollback_open_transaction();
        }

        if (is_timeout_error_text(message)) {
            spdlog::warn("[RelationalExecutor] Query timed out: duration={}ms, timeout={}ms",
                         duration_ms, config_.query_timeout_ms);
            return ExecutionOutcome::failed(ErrorCategory::timeout, query_timeout_message(config_.query_timeout_ms));
        }

        spdlog::error("[RelationalExecutor] Query failed after {}ms: {}", duration_ms, message);
        return ExecutionOutcome::failed(ErrorCategory::execution, message);
    }
}

} // namespace sluice

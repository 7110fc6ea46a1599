#pragma once

#include "sluice/async_database.hpp"
#include "sluice/config.hpp"
#include "sluice/executors/query_executor.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace sluice {

// True for statements whose first keyword is SELECT or WITH
bool is_read_statement(const std::string& sql);

// Wraps a read statement so it only counts the rows it would return
std::string build_count_query(const std::string& sql);

// Rejection message when estimated_rows exceeds max_rows; nullopt when within the limit
std::optional<std::string> row_limit_violation(int64_t estimated_rows, int64_t max_rows);

bool is_timeout_error_text(const std::string& message);

std::string query_timeout_message(int timeout_ms);

struct RelationalTarget {
    std::string host;
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;
    bool use_ssl = true;
    int connect_timeout_seconds = 10;

    std::string connection_string() const;
};

/**
 * RelationalExecutor - PostgreSQL target adapter
 *
 * Holds one lazily opened connection. Every execute() resets the session,
 * applies the timeouts and optional search_path, runs the row estimate for
 * read statements, then runs the text verbatim.
 */
class RelationalExecutor : public QueryExecutor {
private:
    RelationalTarget target_;
    ExecutionConfig config_;

    PGConnPtr conn_;
    std::mutex mutex_;

public:
    RelationalExecutor(RelationalTarget target, ExecutionConfig config);
    ~RelationalExecutor() override;

    ExecutionOutcome execute(const std::string& text, const std::optional<std::string>& schema) override;
    void close() override;

private:
    PGconn* ensure_connected();
    void run_command(const std::string& sql);
    void reset_session();
    void rollback_open_transaction();
    std::optional<int64_t> estimate_rows(const std::string& sql);
};

} // namespace sluice

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sluice {

// ============================================================================
// Execution Types
// Shared by the worker, the router, the executors and the stores
// ============================================================================

enum class DatabaseType { postgresql, mongodb };

enum class SubmissionType { query, script };

enum class RequestStatus { pending, approved, rejected, executed, failed, withdrawn };

enum class ErrorCategory { none, validation, timeout, configuration, resource_limit, execution, internal };

enum class NotificationKind { request_approved, execution_success, execution_failed };

std::string to_string(DatabaseType type);
std::string to_string(SubmissionType type);
std::string to_string(RequestStatus status);
std::string to_string(ErrorCategory category);
std::string to_string(NotificationKind kind);

// Parsers throw ValidationError on unknown values
DatabaseType parse_database_type(const std::string& value);
SubmissionType parse_submission_type(const std::string& value);
RequestStatus parse_request_status(const std::string& value);

// executed and failed are terminal: a request in either state is never run again
inline bool is_terminal_outcome(RequestStatus status) {
    return status == RequestStatus::executed || status == RequestStatus::failed;
}

struct ExecutionRequest {
    std::string id;
    std::string user_id;
    std::string user_email;
    DatabaseType database_type = DatabaseType::postgresql;
    std::string instance_id;
    std::string instance_name;
    std::string database_name;
    std::optional<std::string> schema_name;
    SubmissionType submission_type = SubmissionType::query;
    std::string query_content;
    std::string script_filename;
    std::string script_content;
    RequestStatus status = RequestStatus::pending;
    std::string approver_id;
    std::string execution_result;
    std::string execution_error;
    bool is_compressed = false;
    int64_t result_original_size = 0;
    std::optional<std::chrono::system_clock::time_point> executed_at;
};

struct DatabaseInstance {
    std::string id;
    std::string name;
    DatabaseType type = DatabaseType::postgresql;
    std::string host;
    int port = 0;
};

struct QueueJob {
    std::string id;              // queue row id
    std::string job_id;          // payload id, job_<millis>_<random>
    std::string channel_key;
    std::string request_id;
    std::string approver_id;
    int retry_count = 0;

    nlohmann::json to_payload() const;
    static QueueJob from_payload(const std::string& id, const nlohmann::json& payload);
};

struct ExecutionOutcome {
    bool success = false;
    std::string output;
    int64_t row_count = 0;
    std::string error;
    ErrorCategory category = ErrorCategory::none;
    bool compressed = false;
    int64_t original_size = 0;
    std::chrono::system_clock::time_point executed_at = std::chrono::system_clock::now();

    static ExecutionOutcome succeeded(std::string output, int64_t row_count = 0);
    static ExecutionOutcome failed(ErrorCategory category, std::string error);
};

// Plain connection data handed to sandboxed scripts. Never a live handle.
struct ConnectionDescriptor {
    DatabaseType type = DatabaseType::postgresql;
    std::string host;
    int port = 0;
    std::string database;
    std::string user;
    std::string password;
    std::string uri;

    nlohmann::json to_json() const;
};

// "<type>:<instance id>:<database name>"
std::string make_channel_key(DatabaseType type, const std::string& instance_id, const std::string& database_name);
std::string make_channel_key(const ExecutionRequest& request);

} // namespace sluice

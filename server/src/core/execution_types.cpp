#include "sluice/execution_types.hpp"
#include "sluice/errors.hpp"

namespace sluice {

std::string to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::postgresql: return "postgresql";
        case DatabaseType::mongodb: return "mongodb";
    }
    return "unknown";
}

std::string to_string(SubmissionType type) {
    switch (type) {
        case SubmissionType::query: return "query";
        case SubmissionType::script: return "script";
    }
    return "unknown";
}

std::string to_string(RequestStatus status) {
    switch (status) {
        case RequestStatus::pending: return "pending";
        case RequestStatus::approved: return "approved";
        case RequestStatus::rejected: return "rejected";
        case RequestStatus::executed: return "executed";
        case RequestStatus::failed: return "failed";
        case RequestStatus::withdrawn: return "withdrawn";
    }
    return "unknown";
}

std::string to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::none: return "none";
        case ErrorCategory::validation: return "validation";
        case ErrorCategory::timeout: return "timeout";
        case ErrorCategory::configuration: return "configuration";
        case ErrorCategory::resource_limit: return "resource_limit";
        case ErrorCategory::execution: return "execution";
        case ErrorCategory::internal: return "internal";
    }
    return "unknown";
}

std::string to_string(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::request_approved: return "REQUEST_APPROVED";
        case NotificationKind::execution_success: return "EXECUTION_SUCCESS";
        case NotificationKind::execution_failed: return "EXECUTION_FAILED";
    }
    return "UNKNOWN";
}

DatabaseType parse_database_type(const std::string& value) {
    if (value == "postgresql") return DatabaseType::postgresql;
    if (value == "mongodb") return DatabaseType::mongodb;
    throw ValidationError("Unknown database type: " + value);
}

SubmissionType parse_submission_type(const std::string& value) {
    if (value == "query") return SubmissionType::query;
    if (value == "script") return SubmissionType::script;
    throw ValidationError("Unknown submission type: " + value);
}

RequestStatus parse_request_status(const std::string& value) {
    if (value == "pending") return RequestStatus::pending;
    if (value == "approved") return RequestStatus::approved;
    if (value == "rejected") return RequestStatus::rejected;
    if (value == "executed") return RequestStatus::executed;
    if (value == "failed") return RequestStatus::failed;
    if (value == "withdrawn") return RequestStatus::withdrawn;
    throw ValidationError("Unknown request status: " + value);
}

nlohmann::json QueueJob::to_payload() const {
    return {
        {"jobId", job_id},
        {"queueKey", channel_key},
        {"requestId", request_id},
        {"approvedBy", approver_id}
    };
}

QueueJob QueueJob::from_payload(const std::string& id, const nlohmann::json& payload) {
    QueueJob job;
    job.id = id;
    job.job_id = payload.value("jobId", "");
    job.channel_key = payload.value("queueKey", "");
    job.request_id = payload.value("requestId", "");
    job.approver_id = payload.value("approvedBy", "");
    if (job.request_id.empty()) {
        throw ValidationError("Job " + id + " payload has no requestId");
    }
    return job;
}

ExecutionOutcome ExecutionOutcome::succeeded(std::string output, int64_t row_count) {
    ExecutionOutcome outcome;
    outcome.success = true;
    outcome.output = std::move(output);
    outcome.row_count = row_count;
    outcome.original_size = static_cast<int64_t>(outcome.output.size());
    return outcome;
}

ExecutionOutcome ExecutionOutcome::failed(ErrorCategory category, std::string error) {
    ExecutionOutcome outcome;
    outcome.success = false;
    outcome.category = category;
    outcome.error = std::move(error);
    return outcome;
}

nlohmann::json ConnectionDescriptor::to_json() const {
    nlohmann::json j = {
        {"type", to_string(type)},
        {"host", host},
        {"port", port},
        {"database", database},
        {"uri", uri}
    };
    if (!user.empty()) j["user"] = user;
    if (!password.empty()) j["password"] = password;
    return j;
}

std::string make_channel_key(DatabaseType type, const std::string& instance_id, const std::string& database_name) {
    return to_string(type) + ":" + instance_id + ":" + database_name;
}

std::string make_channel_key(const ExecutionRequest& request) {
    return make_channel_key(request.database_type, request.instance_id, request.database_name);
}

} // namespace sluice

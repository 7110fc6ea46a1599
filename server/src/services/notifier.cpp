#include "sluice/notifier.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sluice {

void LogNotifier::notify(NotificationKind kind,
                         const ExecutionRequest& request,
                         const std::string& executor_id,
                         const ExecutionOutcome* outcome,
                         const std::string& reason) {
    nlohmann::json record = {
        {"type", to_string(kind)},
        {"requestId", request.id},
        {"requester", request.user_email},
        {"instance", request.instance_name},
        {"database", request.database_name},
        {"submissionType", to_string(request.submission_type)},
        {"approvedBy", executor_id}
    };
    if (outcome) {
        record["success"] = outcome->success;
        record["rowCount"] = outcome->row_count;
        if (!outcome->success) {
            record["error"] = outcome->error;
        }
    }
    if (!reason.empty()) {
        record["reason"] = reason;
    }

    spdlog::info("[Notify] {}", record.dump());
}

} // namespace sluice

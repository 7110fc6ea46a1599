#pragma once

#include "sluice/execution_types.hpp"
#include <string>

namespace sluice {

// Fire-and-forget notifications; callers catch and log failures
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void notify(NotificationKind kind,
                        const ExecutionRequest& request,
                        const std::string& executor_id,
                        const ExecutionOutcome* outcome,
                        const std::string& reason) = 0;
};

// Emits one structured "[Notify]" record per notification
class LogNotifier : public Notifier {
public:
    void notify(NotificationKind kind,
                const ExecutionRequest& request,
                const std::string& executor_id,
                const ExecutionOutcome* outcome,
                const std::string& reason) override;
};

} // namespace sluice

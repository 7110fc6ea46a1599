#pragma once

#include "sluice/backend_pool.hpp"
#include "sluice/config.hpp"
#include "sluice/execution_types.hpp"
#include "sluice/request_store.hpp"
#include "sluice/sandbox/script_sandbox.hpp"
#include <memory>

namespace sluice {

// Turns one approved request into one outcome. Implementations never throw.
class RequestExecutor {
public:
    virtual ~RequestExecutor() = default;

    virtual ExecutionOutcome execute_request(const ExecutionRequest& request) = 0;
};

/**
 * ExecutionRouter - dispatches a request to its executor or the sandbox
 *
 * Queries run on the pooled executor for {type, instance, database}.
 * Scripts are validated and then run in the sandbox with connection
 * descriptors only. Outputs above the compression threshold are stored
 * gzip+base64 with the original size kept.
 */
class ExecutionRouter : public RequestExecutor {
public:
    ExecutionRouter(std::shared_ptr<InstanceDirectory> instances,
                    std::shared_ptr<BackendPool> backends,
                    std::shared_ptr<ScriptSandbox> sandbox,
                    TargetConfig target,
                    ExecutionConfig execution);

    ExecutionOutcome execute_request(const ExecutionRequest& request) override;

    // Connection data for scripts; the URI never embeds credentials
    ConnectionDescriptor describe_connection(const DatabaseInstance& instance,
                                             const std::string& database) const;

    // Compresses output above the threshold and records its original size
    ExecutionOutcome finalize(ExecutionOutcome outcome) const;

private:
    ExecutionOutcome execute_query(const ExecutionRequest& request);
    ExecutionOutcome execute_script(const ExecutionRequest& request);
    DatabaseInstance resolve_instance(const ExecutionRequest& request);

    std::shared_ptr<InstanceDirectory> instances_;
    std::shared_ptr<BackendPool> backends_;
    std::shared_ptr<ScriptSandbox> sandbox_;
    TargetConfig target_;
    ExecutionConfig execution_;
};

} // namespace sluice

#include "sluice/execution_router.hpp"
#include "sluice/compression.hpp"
#include "sluice/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace sluice {

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
    std::string joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += errors[i];
    }
    return joined;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

ExecutionRouter::ExecutionRouter(std::shared_ptr<InstanceDirectory> instances,
                                 std::shared_ptr<BackendPool> backends,
                                 std::shared_ptr<ScriptSandbox> sandbox,
                                 TargetConfig target,
                                 ExecutionConfig execution)
    : instances_(std::move(instances)),
      backends_(std::move(backends)),
      sandbox_(std::move(sandbox)),
      target_(std::move(target)),
      execution_(std::move(execution)) {}

ExecutionOutcome ExecutionRouter::execute_request(const ExecutionRequest& request) {
    auto start = std::chrono::steady_clock::now();
    ExecutionOutcome outcome;

    try {
        outcome = request.submission_type == SubmissionType::script
            ? execute_script(request)
            : execute_query(request);
    } catch (const ValidationError& e) {
        outcome = ExecutionOutcome::failed(ErrorCategory::validation, e.what());
    } catch (const ConfigurationError& e) {
        outcome = ExecutionOutcome::failed(ErrorCategory::configuration, e.what());
    } catch (const TimeoutError& e) {
        outcome = ExecutionOutcome::failed(ErrorCategory::timeout, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[Router] Unexpected error executing request {}: {}", request.id, e.what());
        outcome = ExecutionOutcome::failed(ErrorCategory::internal, e.what());
    }

    outcome = finalize(std::move(outcome));

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (outcome.success) {
        spdlog::info("[Router] Request {} executed ({}, {}): rows={}, size={}, compressed={}, duration={}ms",
                     request.id, to_string(request.submission_type), to_string(request.database_type),
                     outcome.row_count, format_bytes(outcome.original_size), outcome.compressed, duration_ms);
    } else {
        spdlog::info("[Router] Request {} failed ({}): {}",
                     request.id, to_string(outcome.category), outcome.error);
    }
    return outcome;
}

DatabaseInstance ExecutionRouter::resolve_instance(const ExecutionRequest& request) {
    auto instance = instances_->find_instance(request.instance_id);
    if (!instance) {
        throw ConfigurationError("Database instance not found: " + request.instance_id);
    }
    if (instance->type != request.database_type) {
        throw ConfigurationError("Database instance " + instance->name + " is not a " +
                                 to_string(request.database_type) + " instance");
    }
    return *instance;
}

ExecutionOutcome ExecutionRouter::execute_query(const ExecutionRequest& request) {
    if (is_blank(request.query_content)) {
        throw ValidationError("No query provided");
    }

    DatabaseInstance instance = resolve_instance(request);
    auto executor = backends_->get(instance, request.database_name);

    spdlog::debug("[Router] Running query for request {} on {}", request.id, make_channel_key(request));
    return executor->execute(request.query_content, request.schema_name);
}

ExecutionOutcome ExecutionRouter::execute_script(const ExecutionRequest& request) {
    if (is_blank(request.script_content)) {
        throw ValidationError("No script content provided");
    }

    ScriptValidation validation = sandbox_->validate(request.script_content);
    if (!validation.valid) {
        throw ValidationError("Script validation failed: " + join_errors(validation.errors));
    }

    DatabaseInstance instance = resolve_instance(request);

    ScriptEnvironment environment;
    environment.database_name = request.database_name;
    environment.connections.push_back(describe_connection(instance, request.database_name));

    spdlog::debug("[Router] Running script {} for request {}",
                  request.script_filename.empty() ? "<inline>" : request.script_filename, request.id);
    return sandbox_->execute(request.script_content, environment);
}

ConnectionDescriptor ExecutionRouter::describe_connection(const DatabaseInstance& instance,
                                                          const std::string& database) const {
    ConnectionDescriptor descriptor;
    descriptor.type = instance.type;
    descriptor.host = instance.host;
    descriptor.port = instance.port;
    descriptor.database = database;

    std::string authority = instance.host + ":" + std::to_string(instance.port);
    if (instance.type == DatabaseType::postgresql) {
        descriptor.user = target_.pg_user;
        descriptor.password = target_.pg_password;
        descriptor.uri = "postgresql://" + authority + "/" + database;
    } else {
        descriptor.uri = "mongodb://" + authority + "/" + database;
    }
    return descriptor;
}

ExecutionOutcome ExecutionRouter::finalize(ExecutionOutcome outcome) const {
    outcome.original_size = byte_size(outcome.output);
    outcome.compressed = false;

    if (!should_compress(outcome.output, execution_.compression_threshold_bytes)) {
        return outcome;
    }

    try {
        std::string compressed = compress_result(outcome.output);
        spdlog::info("[Router] Compressed result {} -> {}",
                     format_bytes(outcome.original_size), format_bytes(byte_size(compressed)));
        outcome.output = std::move(compressed);
        outcome.compressed = true;
    } catch (const std::exception& e) {
        spdlog::warn("[Router] Compression failed, storing uncompressed result: {}", e.what());
    }
    return outcome;
}

} // namespace sluice

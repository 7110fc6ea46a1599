#pragma once

#include "sluice/config.hpp"
#include "sluice/execution_types.hpp"
#include "sluice/executors/query_executor.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sluice {

using ExecutorFactory =
    std::function<std::shared_ptr<QueryExecutor>(const DatabaseInstance& instance, const std::string& database)>;

// Relational targets use TargetConfig credentials, document targets connect without auth
ExecutorFactory make_executor_factory(const TargetConfig& target, const ExecutionConfig& execution);

/**
 * BackendPool - one executor per target database
 *
 * Handles are created on first use and reused afterwards. Nothing is torn
 * down until close(), which the daemon calls during shutdown.
 */
class BackendPool {
public:
    explicit BackendPool(ExecutorFactory factory) : factory_(std::move(factory)) {}
    ~BackendPool();

    BackendPool(const BackendPool&) = delete;
    BackendPool& operator=(const BackendPool&) = delete;

    std::shared_ptr<QueryExecutor> get(const DatabaseInstance& instance, const std::string& database);

    void close();

    size_t size() const;

    static std::string pool_key(const DatabaseInstance& instance, const std::string& database);

private:
    ExecutorFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<QueryExecutor>> executors_;
    mutable std::mutex mutex_;
};

} // namespace sluice

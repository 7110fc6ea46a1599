#include "sluice/backend_pool.hpp"
#include "sluice/errors.hpp"
#include "sluice/executors/document_executor.hpp"
#include "sluice/executors/relational_executor.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace sluice {

ExecutorFactory make_executor_factory(const TargetConfig& target, const ExecutionConfig& execution) {
    return [target, execution](const DatabaseInstance& instance,
                               const std::string& database) -> std::shared_ptr<QueryExecutor> {
        if (instance.type == DatabaseType::mongodb) {
            return std::make_shared<DocumentExecutor>(instance.host, instance.port, database, execution);
        }

        RelationalTarget relational;
        relational.host = instance.host;
        relational.port = instance.port;
        relational.database = database;
        relational.user = target.pg_user;
        relational.password = target.pg_password;
        relational.use_ssl = target.pg_use_ssl;
        relational.connect_timeout_seconds = target.connect_timeout_seconds;
        return std::make_shared<RelationalExecutor>(relational, execution);
    };
}

BackendPool::~BackendPool() {
    close();
}

std::string BackendPool::pool_key(const DatabaseInstance& instance, const std::string& database) {
    return make_channel_key(instance.type, instance.id, database);
}

std::shared_ptr<QueryExecutor> BackendPool::get(const DatabaseInstance& instance, const std::string& database) {
    std::string key = pool_key(instance, database);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executors_.find(key);
    if (it != executors_.end()) {
        return it->second;
    }

    auto executor = factory_(instance, database);
    if (!executor) {
        throw ConfigurationError("No executor available for " + key);
    }
    executors_.emplace(key, executor);
    spdlog::info("[BackendPool] Created executor for {} ({} total)", key, executors_.size());
    return executor;
}

void BackendPool::close() {
    std::vector<std::shared_ptr<QueryExecutor>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : executors_) {
            closing.push_back(entry.second);
        }
        executors_.clear();
    }

    for (auto& executor : closing) {
        try {
            executor->close();
        } catch (const std::exception& e) {
            spdlog::warn("[BackendPool] Error closing executor: {}", e.what());
        }
    }
    if (!closing.empty()) {
        spdlog::info("[BackendPool] Closed {} executor(s)", closing.size());
    }
}

size_t BackendPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executors_.size();
}

} // namespace sluice

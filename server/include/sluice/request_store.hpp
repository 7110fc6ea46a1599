#pragma once

#include "sluice/async_database.hpp"
#include "sluice/execution_types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sluice {

// Read/write surface of the request workflow that the engine relies on
class RequestStore {
public:
    virtual ~RequestStore() = default;

    virtual std::optional<ExecutionRequest> get_request_by_id(const std::string& id) = 0;

    // Writes status (executed/failed) and outcome fields. Unknown ids return nullopt.
    virtual std::optional<ExecutionRequest> set_execution_outcome(const std::string& id,
                                                                  const ExecutionOutcome& outcome) = 0;
};

class InstanceDirectory {
public:
    virtual ~InstanceDirectory() = default;

    virtual std::optional<DatabaseInstance> find_instance(const std::string& id) = 0;
};

class PgRequestStore : public RequestStore {
public:
    explicit PgRequestStore(std::shared_ptr<AsyncDbPool> db_pool) : db_pool_(std::move(db_pool)) {}

    std::optional<ExecutionRequest> get_request_by_id(const std::string& id) override;
    std::optional<ExecutionRequest> set_execution_outcome(const std::string& id,
                                                          const ExecutionOutcome& outcome) override;

private:
    std::shared_ptr<AsyncDbPool> db_pool_;
};

class PgInstanceDirectory : public InstanceDirectory {
public:
    explicit PgInstanceDirectory(std::shared_ptr<AsyncDbPool> db_pool) : db_pool_(std::move(db_pool)) {}

    std::optional<DatabaseInstance> find_instance(const std::string& id) override;

private:
    std::shared_ptr<AsyncDbPool> db_pool_;
};

} // namespace sluice

#pragma once

#include "sluice/execution_types.hpp"
#include <optional>
#include <string>

namespace sluice {

/**
 * Runs one command against one target database.
 *
 * execute() never throws: connection problems, timeouts and query errors all
 * come back as a failed ExecutionOutcome with the matching category.
 */
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    virtual ExecutionOutcome execute(const std::string& text, const std::optional<std::string>& schema) = 0;

    virtual void close() = 0;
};

} // namespace sluice

#pragma once

#include "sluice/config.hpp"
#include "sluice/execution_types.hpp"
#include <string>
#include <vector>

namespace sluice {

struct ScriptValidation {
    bool valid = true;
    std::vector<std::string> errors;
};

// Pre-flight pattern screen. The sandbox isolation is the actual boundary.
class ScriptValidator {
public:
    static ScriptValidation validate(const std::string& script);
};

// Plain data visible to a script: DATABASE_NAME and DB_CONFIG
struct ScriptEnvironment {
    std::string database_name;
    std::vector<ConnectionDescriptor> connections;
};

class ScriptSandbox {
public:
    virtual ~ScriptSandbox() = default;

    // Never throws; every failure comes back as a categorized outcome
    virtual ExecutionOutcome execute(const std::string& script, const ScriptEnvironment& environment) = 0;

    virtual ScriptValidation validate(const std::string& script) const {
        return ScriptValidator::validate(script);
    }
};

/**
 * QuickJsSandbox - isolated JavaScript execution
 *
 * Every call gets its own JSRuntime with a memory ceiling, a stack limit and
 * an interrupt handler enforcing the wall-clock deadline. The global scope
 * holds only console.log, console.error, DB_CONFIG and DATABASE_NAME; the
 * std/os modules are never registered. The runtime is freed before execute()
 * returns, whatever the outcome.
 */
class QuickJsSandbox : public ScriptSandbox {
public:
    explicit QuickJsSandbox(SandboxConfig config) : config_(std::move(config)) {}

    ExecutionOutcome execute(const std::string& script, const ScriptEnvironment& environment) override;

    const SandboxConfig& config() const { return config_; }

private:
    SandboxConfig config_;
};

// DB_CONFIG value: the descriptor object for one connection, an array for several, null for none
nlohmann::json script_db_config(const ScriptEnvironment& environment);

} // namespace sluice

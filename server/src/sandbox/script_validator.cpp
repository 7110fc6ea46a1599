#include "sluice/sandbox/script_sandbox.hpp"
#include <regex>
#include <sstream>

namespace sluice {

namespace {

struct BlockedPattern {
    std::regex pattern;
    const char* message;
};

const std::vector<BlockedPattern>& blocked_patterns() {
    static const std::vector<BlockedPattern> patterns = {
        {std::regex(R"(\brequire\s*\()"), "require() is not allowed in sandboxed scripts"},
        {std::regex("child_process", std::regex::icase), "child_process module is not allowed"},
        {std::regex(R"(\bprocess\s*(\.|\[))"), "process access is not allowed"},
        {std::regex(R"((\bfs\s*\.|['"](node:)?fs(/promises)?['"]))"), "File system access is not allowed"},
        {std::regex(R"(\beval\s*\()"), "eval() is not allowed"},
        {std::regex(R"(\bFunction\s*\()"), "Function constructor is not allowed"},
        {std::regex(R"((['"](node:)?cluster['"]|\bcluster\s*\.))", std::regex::icase), "cluster module is not allowed"},
    };
    return patterns;
}

// import x from '...', import '...' at the start of a line, or import(...) anywhere
bool has_import(const std::string& script) {
    static const std::regex dynamic_import(R"(\bimport\s*\()");
    static const std::regex import_line(R"(^\s*import(\s+[\w$]|\s*[{*'"]))");
    if (std::regex_search(script, dynamic_import)) {
        return true;
    }
    std::istringstream lines(script);
    std::string line;
    while (std::getline(lines, line)) {
        if (std::regex_search(line, import_line)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

ScriptValidation ScriptValidator::validate(const std::string& script) {
    ScriptValidation result;

    if (has_import(script)) {
        result.errors.push_back("ES imports are not allowed in sandboxed scripts");
    }
    for (const auto& blocked : blocked_patterns()) {
        if (std::regex_search(script, blocked.pattern)) {
            result.errors.push_back(blocked.message);
        }
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace sluice

#include "sluice/logging.hpp"
#include <spdlog/spdlog.h>

namespace sluice {

void configure_logging(const LoggingConfig& config) {
    if (!config.enable_logging) {
        spdlog::set_level(spdlog::level::off);
        return;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if (config.log_format == "json") {
        if (config.log_timestamp) {
            spdlog::set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})");
        } else {
            spdlog::set_pattern(R"({"level":"%l","thread":%t,"message":"%v"})");
        }
    } else if (config.log_timestamp) {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } else {
        spdlog::set_pattern("[%l] %v");
    }
}

namespace audit {

void record(const std::string& category,
            const std::string& action,
            const std::string& outcome,
            const nlohmann::json& details) {
    nlohmann::json entry = {
        {"category", category},
        {"action", action},
        {"outcome", outcome}
    };
    if (details.is_object()) {
        for (auto it = details.begin(); it != details.end(); ++it) {
            entry[it.key()] = it.value();
        }
    }
    spdlog::info("[AUDIT] {}", entry.dump());
}

} // namespace audit

} // namespace sluice

#pragma once

#include "sluice/config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sluice {

// Applies level, pattern and on/off switch to the global spdlog logger
void configure_logging(const LoggingConfig& config);

namespace audit {

/**
 * Writes one "[AUDIT] {...}" line carrying category, action and outcome.
 * Extra keys in details are merged into the record.
 */
void record(const std::string& category,
            const std::string& action,
            const std::string& outcome,
            const nlohmann::json& details = nlohmann::json::object());

} // namespace audit

} // namespace sluice

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sluice {

/**
 * Parsed form of the document-store mini-language:
 *   db.<collection>.<method>(<json args>)
 *   db["<collection>"].<method>(<json args>)
 *
 * Nothing is evaluated. Arguments are parsed as a JSON array "[args]", or as
 * a single JSON value when that fails.
 */
struct DocumentQuery {
    std::string collection;
    std::string method;
    nlohmann::json args = nlohmann::json::array();

    // Throws ValidationError for malformed text, unsupported methods or missing required arguments
    static DocumentQuery parse(const std::string& text);

    // Argument at index, or fallback when absent or null
    nlohmann::json arg_or(size_t index, const nlohmann::json& fallback) const;
};

// Rejects operators that run code inside the database engine. Throws ValidationError.
void screen_document_query(const std::string& text);

} // namespace sluice

#include "sluice/executors/document_query.hpp"
#include "sluice/errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace sluice {

namespace {

const char* const BLOCKED_OPERATORS[] = {
    "$where",
    "$function",
    "$accumulator",
    "mapReduce",
    "$expr"
};

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool present(const nlohmann::json& args, size_t index) {
    return args.size() > index && !args[index].is_null();
}

// Methods with required leading arguments, in order
void check_required_args(const DocumentQuery& query) {
    const std::string& m = query.method;
    const auto& a = query.args;

    if (m == "find" || m == "findOne" || m == "aggregate" || m == "countDocuments") {
        return;
    }
    if (m == "insertOne") {
        if (!present(a, 0)) throw ValidationError("insertOne requires a document");
        return;
    }
    if (m == "insertMany") {
        if (!present(a, 0)) throw ValidationError("insertMany requires documents array");
        return;
    }
    if (m == "updateOne" || m == "updateMany") {
        if (!present(a, 0) || !present(a, 1)) throw ValidationError(m + " requires filter and update");
        return;
    }
    if (m == "deleteOne" || m == "deleteMany") {
        if (!present(a, 0)) throw ValidationError(m + " requires a filter");
        return;
    }
    throw ValidationError("Unsupported MongoDB method: " + m);
}

} // anonymous namespace

void screen_document_query(const std::string& text) {
    std::string upper = to_upper(text);
    for (const char* op : BLOCKED_OPERATORS) {
        if (upper.find(to_upper(op)) != std::string::npos) {
            throw ValidationError(std::string("Dangerous operator \"") + op + "\" is not allowed in queries");
        }
    }

    if (text.find("function(") != std::string::npos || text.find("function (") != std::string::npos) {
        throw ValidationError("JavaScript functions are not allowed in queries");
    }
}

DocumentQuery DocumentQuery::parse(const std::string& text) {
    // Only the head is matched with a regex; argument text can be large
    static const std::regex head_regex(
        R"(^db(?:\[["']([^\]"']+)["']\]|\.([^.(]+))\.(\w+)\($)");

    std::string trimmed = trim(text);

    // A bracketed name may contain '(', so the argument list starts after it
    size_t search_from = 0;
    if (trimmed.rfind("db[", 0) == 0 && trimmed.size() > 3 && (trimmed[3] == '"' || trimmed[3] == '\'')) {
        size_t name_end = trimmed.find_first_of("]\"'", 4);
        if (name_end != std::string::npos) search_from = name_end;
    }
    size_t open_paren = trimmed.find('(', search_from);
    std::smatch match;
    std::string head = open_paren == std::string::npos ? trimmed : trimmed.substr(0, open_paren + 1);

    if (open_paren == std::string::npos || trimmed.back() != ')' ||
        !std::regex_match(head, match, head_regex)) {
        throw ValidationError("Invalid MongoDB query format. Expected: db.collection.method({...}) "
                              "or db[\"collection\"].method({...})");
    }

    DocumentQuery query;
    query.collection = match[1].matched ? match[1].str() : match[2].str();
    query.method = match[3].str();

    std::string args_text = trim(trimmed.substr(open_paren + 1, trimmed.size() - open_paren - 2));
    if (!args_text.empty()) {
        auto parsed = nlohmann::json::parse("[" + args_text + "]", nullptr, false);
        if (parsed.is_discarded()) {
            auto single = nlohmann::json::parse(args_text, nullptr, false);
            if (single.is_discarded()) {
                throw ValidationError("Invalid query arguments. Must be valid JSON.");
            }
            parsed = nlohmann::json::array({single});
        }
        query.args = std::move(parsed);
    }

    check_required_args(query);
    return query;
}

nlohmann::json DocumentQuery::arg_or(size_t index, const nlohmann::json& fallback) const {
    if (present(args, index)) {
        return args[index];
    }
    return fallback;
}

} // namespace sluice

#include "sluice/executors/document_executor.hpp"
#include "sluice/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <vector>

namespace sluice {

namespace {

struct BsonDeleter {
    void operator()(bson_t* doc) const {
        if (doc) bson_destroy(doc);
    }
};
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;

struct CollectionDeleter {
    void operator()(mongoc_collection_t* coll) const {
        if (coll) mongoc_collection_destroy(coll);
    }
};
using CollectionPtr = std::unique_ptr<mongoc_collection_t, CollectionDeleter>;

struct CursorDeleter {
    void operator()(mongoc_cursor_t* cursor) const {
        if (cursor) mongoc_cursor_destroy(cursor);
    }
};
using CursorPtr = std::unique_ptr<mongoc_cursor_t, CursorDeleter>;

// Raised from inside run() so the caller can categorize driver errors
class MongoOperationError : public std::runtime_error {
public:
    MongoOperationError(const bson_error_t& error)
        : std::runtime_error(error.message), domain(error.domain), code(error.code) {}

    uint32_t domain;
    uint32_t code;
};

void init_driver() {
    static std::once_flag once;
    std::call_once(once, []() {
        mongoc_init();
    });
}

BsonPtr to_bson(const nlohmann::json& value) {
    std::string text = value.dump();
    bson_error_t error;
    bson_t* doc = bson_new_from_json(reinterpret_cast<const uint8_t*>(text.data()),
                                     static_cast<ssize_t>(text.size()), &error);
    if (!doc) {
        throw ValidationError(std::string("Invalid query arguments. ") + error.message);
    }
    return BsonPtr(doc);
}

nlohmann::json to_json(const bson_t* doc) {
    size_t length = 0;
    char* text = bson_as_relaxed_extended_json(doc, &length);
    if (!text) {
        throw std::runtime_error("Failed to convert BSON document to JSON");
    }
    nlohmann::json value = nlohmann::json::parse(std::string(text, length), nullptr, false);
    bson_free(text);
    if (value.is_discarded()) {
        throw std::runtime_error("Driver produced unreadable JSON");
    }
    return value;
}

nlohmann::json object_or_empty(const DocumentQuery& query, size_t index) {
    nlohmann::json value = query.arg_or(index, nlohmann::json::object());
    if (!value.is_object()) {
        throw ValidationError(query.method + " expects a JSON object argument");
    }
    return value;
}

nlohmann::json drain_cursor(mongoc_cursor_t* cursor) {
    nlohmann::json documents = nlohmann::json::array();
    const bson_t* doc;
    while (mongoc_cursor_next(cursor, &doc)) {
        documents.push_back(to_json(doc));
    }

    bson_error_t error;
    if (mongoc_cursor_error(cursor, &error)) {
        throw MongoOperationError(error);
    }
    return documents;
}

// Write replies carry counts as numbers; strip driver-internal fields
nlohmann::json write_result(const bson_t* reply) {
    nlohmann::json result = to_json(reply);
    result["acknowledged"] = true;
    result.erase("writeErrors");
    result.erase("writeConcernErrors");
    return result;
}

} // anonymous namespace

bool is_document_timeout(int error_code, const std::string& message) {
    return error_code == MONGO_MAX_TIME_EXPIRED_CODE ||
           message.find("exceeded time limit") != std::string::npos ||
           message.find("operation exceeded time limit") != std::string::npos;
}

DocumentExecutor::DocumentExecutor(std::string host, int port, std::string database, ExecutionConfig config)
    : host_(std::move(host)), port_(port), database_(std::move(database)), config_(std::move(config)) {
    init_driver();
}

DocumentExecutor::~DocumentExecutor() {
    close();
}

std::string DocumentExecutor::uri() const {
    return "mongodb://" + host_ + ":" + std::to_string(port_) + "/" + database_ +
           "?serverSelectionTimeoutMS=" + std::to_string(config_.mongo_server_selection_timeout_ms) +
           "&connectTimeoutMS=" + std::to_string(config_.mongo_server_selection_timeout_ms) +
           "&socketTimeoutMS=" + std::to_string(config_.mongo_operation_timeout_ms + 5000) +
           "&appname=sluice-executor";
}

void DocumentExecutor::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_) {
        spdlog::debug("[DocumentExecutor] Closing client for {}:{}/{}", host_, port_, database_);
        client_.reset();
    }
}

mongoc_client_t* DocumentExecutor::ensure_client() {
    if (client_) {
        return client_.get();
    }

    bson_error_t error;
    mongoc_uri_t* parsed = mongoc_uri_new_with_error(uri().c_str(), &error);
    if (!parsed) {
        throw ConfigurationError(std::string("Invalid MongoDB URI: ") + error.message);
    }
    mongoc_client_t* client = mongoc_client_new_from_uri(parsed);
    mongoc_uri_destroy(parsed);
    if (!client) {
        throw ConfigurationError("Failed to create MongoDB client for " + host_ + ":" + std::to_string(port_));
    }
    mongoc_client_set_error_api(client, MONGOC_ERROR_API_VERSION_2);

    client_.reset(client);
    spdlog::info("[DocumentExecutor] Client created for {}:{}/{}", host_, port_, database_);
    return client_.get();
}

nlohmann::json DocumentExecutor::run(const DocumentQuery& query) {
    mongoc_client_t* client = ensure_client();
    CollectionPtr coll(mongoc_client_get_collection(client, database_.c_str(), query.collection.c_str()));

    const std::string& method = query.method;
    bson_error_t error;
    nlohmann::json max_time = {{"maxTimeMS", config_.mongo_operation_timeout_ms}};

    if (method == "find" || method == "findOne") {
        auto filter = to_bson(object_or_empty(query, 0));
        nlohmann::json opts_json = max_time;
        if (method == "findOne") {
            opts_json["limit"] = 1;
        }
        auto opts = to_bson(opts_json);
        CursorPtr cursor(mongoc_collection_find_with_opts(coll.get(), filter.get(), opts.get(), nullptr));
        nlohmann::json documents = drain_cursor(cursor.get());
        if (method == "findOne") {
            return documents.empty() ? nlohmann::json(nullptr) : documents[0];
        }
        return documents;
    }

    if (method == "aggregate") {
        nlohmann::json pipeline = query.arg_or(0, nlohmann::json::array());
        if (!pipeline.is_array()) {
            throw ValidationError("aggregate expects a pipeline array");
        }
        auto pipeline_doc = to_bson({{"pipeline", pipeline}});
        auto opts = to_bson(max_time);
        CursorPtr cursor(mongoc_collection_aggregate(coll.get(), MONGOC_QUERY_NONE,
                                                     pipeline_doc.get(), opts.get(), nullptr));
        return drain_cursor(cursor.get());
    }

    if (method == "countDocuments") {
        auto filter = to_bson(object_or_empty(query, 0));
        auto opts = to_bson(max_time);
        int64_t count = mongoc_collection_count_documents(coll.get(), filter.get(), opts.get(),
                                                          nullptr, nullptr, &error);
        if (count < 0) {
            throw MongoOperationError(error);
        }
        return count;
    }

    bson_t reply;
    bool ok = false;

    if (method == "insertOne") {
        nlohmann::json document = object_or_empty(query, 0);
        if (!document.contains("_id")) {
            bson_oid_t oid;
            bson_oid_init(&oid, nullptr);
            char oid_text[25];
            bson_oid_to_string(&oid, oid_text);
            document["_id"] = {{"$oid", oid_text}};
        }
        auto doc = to_bson(document);
        ok = mongoc_collection_insert_one(coll.get(), doc.get(), nullptr, &reply, &error);
        if (ok) {
            bson_destroy(&reply);
            return {{"acknowledged", true}, {"insertedId", document["_id"]}};
        }
    } else if (method == "insertMany") {
        nlohmann::json documents = query.args[0];
        if (!documents.is_array() || documents.empty()) {
            throw ValidationError("insertMany requires documents array");
        }
        std::vector<BsonPtr> owned;
        std::vector<const bson_t*> docs;
        for (const auto& document : documents) {
            owned.push_back(to_bson(document));
            docs.push_back(owned.back().get());
        }
        ok = mongoc_collection_insert_many(coll.get(), docs.data(), docs.size(), nullptr, &reply, &error);
    } else if (method == "updateOne" || method == "updateMany") {
        auto filter = to_bson(object_or_empty(query, 0));
        auto update = to_bson(query.args[1]);
        ok = method == "updateOne"
            ? mongoc_collection_update_one(coll.get(), filter.get(), update.get(), nullptr, &reply, &error)
            : mongoc_collection_update_many(coll.get(), filter.get(), update.get(), nullptr, &reply, &error);
    } else if (method == "deleteOne" || method == "deleteMany") {
        auto filter = to_bson(object_or_empty(query, 0));
        ok = method == "deleteOne"
            ? mongoc_collection_delete_one(coll.get(), filter.get(), nullptr, &reply, &error)
            : mongoc_collection_delete_many(coll.get(), filter.get(), nullptr, &reply, &error);
    } else {
        throw ValidationError("Unsupported MongoDB method: " + method);
    }

    if (!ok) {
        bson_destroy(&reply);
        throw MongoOperationError(error);
    }
    nlohmann::json result = write_result(&reply);
    bson_destroy(&reply);
    return result;
}

ExecutionOutcome DocumentExecutor::execute(const std::string& text, const std::optional<std::string>&) {
    auto start = std::chrono::steady_clock::now();

    try {
        screen_document_query(text);
        DocumentQuery query = DocumentQuery::parse(text);

        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json result = run(query);

        int64_t row_count = result.is_array() ? static_cast<int64_t>(result.size()) : 1;
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        spdlog::info("[DocumentExecutor] {}.{} executed: rows={}, duration={}ms",
                     query.collection, query.method, row_count, duration_ms);

        return ExecutionOutcome::succeeded(result.dump(2), row_count);

    } catch (const ValidationError& e) {
        spdlog::warn("[DocumentExecutor] Rejected query: {}", e.what());
        return ExecutionOutcome::failed(ErrorCategory::validation, e.what());
    } catch (const ConfigurationError& e) {
        spdlog::error("[DocumentExecutor] {}", e.what());
        return ExecutionOutcome::failed(ErrorCategory::configuration, e.what());
    } catch (const MongoOperationError& e) {
        if (is_document_timeout(static_cast<int>(e.code), e.what())) {
            spdlog::warn("[DocumentExecutor] Operation timed out after {}ms", config_.mongo_operation_timeout_ms);
            return ExecutionOutcome::failed(ErrorCategory::timeout,
                "Query exceeded " + std::to_string(config_.mongo_operation_timeout_ms / 1000) +
                " second timeout. Please optimize your query or add filters to reduce execution time.");
        }
        if (e.domain == MONGOC_ERROR_SERVER_SELECTION) {
            spdlog::error("[DocumentExecutor] Server unavailable {}:{}: {}", host_, port_, e.what());
            return ExecutionOutcome::failed(ErrorCategory::configuration,
                                            "MongoDB server unavailable: " + std::string(e.what()));
        }
        spdlog::error("[DocumentExecutor] Query failed: {}", e.what());
        return ExecutionOutcome::failed(ErrorCategory::execution, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[DocumentExecutor] Query failed: {}", e.what());
        return ExecutionOutcome::failed(ErrorCategory::execution, e.what());
    }
}

} // namespace sluice

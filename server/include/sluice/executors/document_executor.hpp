#pragma once

#include "sluice/config.hpp"
#include "sluice/executors/document_query.hpp"
#include "sluice/executors/query_executor.hpp"
#include <mongoc/mongoc.h>
#include <memory>
#include <mutex>
#include <string>

namespace sluice {

struct MongoClientDeleter {
    void operator()(mongoc_client_t* client) const {
        if (client) mongoc_client_destroy(client);
    }
};
using MongoClientPtr = std::unique_ptr<mongoc_client_t, MongoClientDeleter>;

// MaxTimeMSExpired
constexpr int MONGO_MAX_TIME_EXPIRED_CODE = 50;

bool is_document_timeout(int error_code, const std::string& message);

/**
 * DocumentExecutor - MongoDB target adapter
 *
 * Screens and parses the mini-language, then runs the single supported
 * method on one lazily created client. Reads carry maxTimeMS; every socket
 * operation is bounded by socketTimeoutMS.
 */
class DocumentExecutor : public QueryExecutor {
private:
    std::string host_;
    int port_;
    std::string database_;
    ExecutionConfig config_;

    MongoClientPtr client_;
    std::mutex mutex_;

public:
    DocumentExecutor(std::string host, int port, std::string database, ExecutionConfig config);
    ~DocumentExecutor() override;

    ExecutionOutcome execute(const std::string& text, const std::optional<std::string>& schema) override;
    void close() override;

    std::string uri() const;

private:
    mongoc_client_t* ensure_client();
    nlohmann::json run(const DocumentQuery& query);
};

} // namespace sluice

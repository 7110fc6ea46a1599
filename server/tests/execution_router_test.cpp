/**
 * Execution Router Tests
 *
 * Dispatch by submission type, instance resolution, backend handle reuse,
 * script pre-flight validation and result compression.
 */

#include "sluice/compression.hpp"
#include "sluice/execution_router.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>

using namespace sluice;
using namespace sluice::testing;

namespace {

struct RouterHarness {
    std::shared_ptr<FakeInstanceDirectory> instances = std::make_shared<FakeInstanceDirectory>();
    std::shared_ptr<FakeSandbox> sandbox = std::make_shared<FakeSandbox>();
    std::shared_ptr<FakeQueryExecutor> executor = std::make_shared<FakeQueryExecutor>();
    std::vector<std::string> created;
    std::shared_ptr<BackendPool> backends;
    std::unique_ptr<ExecutionRouter> router;

    explicit RouterHarness(int compression_threshold = 1048576) {
        DatabaseInstance pg;
        pg.id = "inst-1";
        pg.name = "Primary";
        pg.type = DatabaseType::postgresql;
        pg.host = "pg.internal";
        pg.port = 5432;
        instances->put(pg);

        DatabaseInstance mongo;
        mongo.id = "inst-2";
        mongo.name = "Events";
        mongo.type = DatabaseType::mongodb;
        mongo.host = "mongo.internal";
        mongo.port = 27017;
        instances->put(mongo);

        backends = std::make_shared<BackendPool>(
            [this](const DatabaseInstance& instance, const std::string& database) -> std::shared_ptr<QueryExecutor> {
                created.push_back(BackendPool::pool_key(instance, database));
                return executor;
            });

        TargetConfig target;
        target.pg_user = "readonly";
        target.pg_password = "secret";

        ExecutionConfig execution;
        execution.compression_threshold_bytes = compression_threshold;

        router = std::make_unique<ExecutionRouter>(instances, backends, sandbox, target, execution);
    }
};

} // anonymous namespace

bool test_query_validation() {
    std::cout << "\n=== Test: Query Validation ===" << std::endl;

    RouterHarness h;
    auto request = make_request("r1");
    request.query_content = "   \n";

    auto outcome = h.router->execute_request(request);
    TEST_ASSERT(!outcome.success, "Blank query fails");
    TEST_ASSERT(outcome.category == ErrorCategory::validation, "Blank query is a validation error");
    TEST_ASSERT(outcome.error == "No query provided", "Message names the missing query");
    TEST_ASSERT(h.created.empty(), "No backend handle created");

    return true;
}

bool test_missing_instance() {
    std::cout << "\n=== Test: Missing Instance ===" << std::endl;

    RouterHarness h;
    auto request = make_request("r2", "inst-unknown");

    auto outcome = h.router->execute_request(request);
    TEST_ASSERT(outcome.category == ErrorCategory::configuration, "Unknown instance is a configuration error");
    TEST_ASSERT(outcome.error.find("inst-unknown") != std::string::npos, "Message names the instance");

    auto mismatched = make_request("r3", "inst-2");
    outcome = h.router->execute_request(mismatched);
    TEST_ASSERT(outcome.category == ErrorCategory::configuration, "Type mismatch is a configuration error");

    return true;
}

bool test_query_routing_and_reuse() {
    std::cout << "\n=== Test: Query Routing ===" << std::endl;

    RouterHarness h;
    h.executor->outcome = ExecutionOutcome::succeeded("[{\"n\": 1}]", 1);

    auto request = make_request("r4");
    request.query_content = "SELECT * FROM orders LIMIT 1";
    request.schema_name = std::string("sales");

    auto outcome = h.router->execute_request(request);
    TEST_ASSERT(outcome.success, "Query succeeds");
    TEST_ASSERT(outcome.output == "[{\"n\": 1}]", "Executor output returned");
    TEST_ASSERT(h.executor->texts.back() == "SELECT * FROM orders LIMIT 1", "Query text passed verbatim");
    TEST_ASSERT(h.executor->schemas.back() == "sales", "Schema passed through");
    TEST_ASSERT(outcome.original_size == static_cast<int64_t>(outcome.output.size()), "Original size recorded");

    h.router->execute_request(request);
    TEST_ASSERT(h.created.size() == 1, "Handle reused for the same database");
    TEST_ASSERT(h.created[0] == "postgresql:inst-1:orders", "Pool keyed by type, instance and database");

    auto other_db = make_request("r5", "inst-1", "billing");
    h.router->execute_request(other_db);
    TEST_ASSERT(h.created.size() == 2, "Different database gets its own handle");

    h.backends->close();
    TEST_ASSERT(h.executor->closed == 2, "close() tears every handle down");
    TEST_ASSERT(h.backends->size() == 0, "Pool empty after close");

    return true;
}

bool test_executor_failure_passes_through() {
    std::cout << "\n=== Test: Executor Failure ===" << std::endl;

    RouterHarness h;
    h.executor->outcome = ExecutionOutcome::failed(ErrorCategory::timeout,
        "Query exceeded 60 second timeout. Please optimize your query or add filters to reduce execution time.");

    auto outcome = h.router->execute_request(make_request("r6"));
    TEST_ASSERT(!outcome.success, "Failure returned");
    TEST_ASSERT(outcome.category == ErrorCategory::timeout, "Timeout category preserved");

    return true;
}

bool test_script_path() {
    std::cout << "\n=== Test: Script Path ===" << std::endl;

    RouterHarness h;
    auto request = make_request("r7");
    request.submission_type = SubmissionType::script;
    request.script_content = "console.log(DATABASE_NAME)";

    auto outcome = h.router->execute_request(request);
    TEST_ASSERT(outcome.success, "Script succeeds");
    TEST_ASSERT(h.sandbox->calls == 1, "Sandbox invoked once");
    TEST_ASSERT(h.created.empty(), "Scripts never touch pooled handles");

    const auto& env = h.sandbox->last_environment;
    TEST_ASSERT(env.database_name == "orders", "DATABASE_NAME is the request database");
    TEST_ASSERT(env.connections.size() == 1, "One connection descriptor");
    TEST_ASSERT(env.connections[0].host == "pg.internal" && env.connections[0].port == 5432,
                "Descriptor carries host and port");
    TEST_ASSERT(env.connections[0].user == "readonly", "Descriptor carries target user");
    TEST_ASSERT(env.connections[0].uri == "postgresql://pg.internal:5432/orders", "URI has no credentials");

    auto mongo = make_request("r8", "inst-2", "events");
    mongo.database_type = DatabaseType::mongodb;
    mongo.submission_type = SubmissionType::script;
    mongo.script_content = "console.log(1)";
    h.router->execute_request(mongo);
    TEST_ASSERT(h.sandbox->last_environment.connections[0].uri == "mongodb://mongo.internal:27017/events",
                "Document-store URI built from the instance");

    return true;
}

bool test_script_validation() {
    std::cout << "\n=== Test: Script Validation ===" << std::endl;

    RouterHarness h;
    auto request = make_request("r9");
    request.submission_type = SubmissionType::script;

    request.script_content = "";
    auto outcome = h.router->execute_request(request);
    TEST_ASSERT(outcome.category == ErrorCategory::validation, "Empty script is a validation error");
    TEST_ASSERT(outcome.error == "No script content provided", "Message names the missing script");

    request.script_content = "const fs = require('fs');\neval('1');";
    outcome = h.router->execute_request(request);
    TEST_ASSERT(outcome.category == ErrorCategory::validation, "Blocked pattern is a validation error");
    TEST_ASSERT(outcome.error.rfind("Script validation failed: ", 0) == 0, "Message has the validation prefix");
    TEST_ASSERT(outcome.error.find("require() is not allowed in sandboxed scripts") != std::string::npos,
                "require() reported");
    TEST_ASSERT(outcome.error.find("eval() is not allowed") != std::string::npos, "eval() reported");
    TEST_ASSERT(h.sandbox->calls == 0, "Sandbox not invoked");

    return true;
}

bool test_result_compression() {
    std::cout << "\n=== Test: Result Compression ===" << std::endl;

    RouterHarness h(64);

    std::string big_output;
    for (int i = 0; i < 200; ++i) {
        big_output += "{\"id\": " + std::to_string(i) + ", \"status\": \"active\"}\n";
    }
    h.executor->outcome = ExecutionOutcome::succeeded(big_output, 200);

    auto outcome = h.router->execute_request(make_request("r10"));
    TEST_ASSERT(outcome.success, "Large query succeeds");
    TEST_ASSERT(outcome.compressed, "Output above threshold is compressed");
    TEST_ASSERT(outcome.original_size == static_cast<int64_t>(big_output.size()), "Original size kept");
    TEST_ASSERT(outcome.output != big_output, "Stored output differs from raw output");
    TEST_ASSERT(decompress_result(outcome.output) == big_output, "Compressed output decompresses to the original");

    h.executor->outcome = ExecutionOutcome::succeeded(std::string(64, 'x'), 1);
    outcome = h.router->execute_request(make_request("r11"));
    TEST_ASSERT(!outcome.compressed, "Output exactly at the threshold stays uncompressed");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Execution Router Tests                               ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_query_validation();
    all_passed &= test_missing_instance();
    all_passed &= test_query_routing_and_reuse();
    all_passed &= test_executor_failure_passes_through();
    all_passed &= test_script_path();
    all_passed &= test_script_validation();
    all_passed &= test_result_compression();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}

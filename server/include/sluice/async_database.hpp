#pragma once

#include <libpq-fe.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace sluice {

// --- RAII Deleters for libpq ---

struct PGResultDeleter {
    void operator()(PGresult* res) const {
        if (res) PQclear(res);
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

struct PGConnDeleter {
    void operator()(PGconn* conn) const {
        if (conn) PQfinish(conn);
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

// Session parameters applied after every connect and reset
struct SessionSettings {
    int statement_timeout_ms = 30000;
    int lock_timeout_ms = 10000;
    int idle_in_transaction_timeout_ms = 30000;
    std::string search_path;   // empty keeps the server default
    int connect_timeout_ms = 10000;
};

// --- Helper Functions ---

/**
 * @brief Waits for socket to be ready for reading or writing using select().
 *
 * @param conn Active PostgreSQL connection
 * @param for_reading True to wait for read, false to wait for write
 * @param timeout_ms Upper bound on the wait; negative waits indefinitely
 * @throws std::runtime_error if socket is invalid, select() fails or the timeout elapses
 */
void waitForSocket(PGconn* conn, bool for_reading, int timeout_ms = -1);

/**
 * @brief Asynchronously establishes a PostgreSQL connection.
 *
 * Uses PQconnectStart/PQconnectPoll for non-blocking connection establishment
 * and sets the connection to non-blocking mode upon success.
 *
 * @throws std::runtime_error if connection fails
 */
PGConnPtr asyncConnect(const char* conn_str, const SessionSettings& settings);

/**
 * @brief Asynchronously resets a PostgreSQL connection and re-applies session settings.
 *
 * @return true if reset successful, false otherwise
 */
bool asyncReset(PGconn* conn, const SessionSettings& settings);

/**
 * @brief Sends a query asynchronously and waits until the result is ready.
 *
 * @throws std::runtime_error if query send or processing fails
 */
void sendAndWait(PGconn* conn, const char* query);

/**
 * @brief Sends a parameterized query asynchronously and waits for completion.
 *
 * @param sql SQL query string with $1, $2, etc. placeholders
 * @throws std::runtime_error if query send or processing fails
 */
void sendQueryParamsAsync(PGconn* conn, const std::string& sql, const std::vector<std::string>& params);

/**
 * @brief Retrieves and validates a command result (COMMAND_OK).
 * @throws std::runtime_error if result is invalid or not COMMAND_OK
 */
void getCommandResult(PGconn* conn);

/**
 * @brief Retrieves a command result for reading PQcmdTuples.
 * @throws std::runtime_error if result is invalid or not COMMAND_OK
 */
PGResultPtr getCommandResultPtr(PGconn* conn);

/**
 * @brief Retrieves and validates a tuple result (TUPLES_OK).
 * @throws std::runtime_error if result is invalid or not TUPLES_OK
 */
PGResultPtr getTuplesResult(PGconn* conn);

/**
 * @brief Consumes every pending result of a (possibly multi-statement) query
 * and returns the last one.
 *
 * Either COMMAND_OK or TUPLES_OK is accepted. The first error result
 * aborts with its message.
 *
 * @throws std::runtime_error on the first failing statement or if no result was produced
 */
PGResultPtr getLastResult(PGconn* conn);

/**
 * @brief Converts a tuple result into a JSON array of row objects.
 *
 * Booleans, integers, finite floating point and json/jsonb columns are mapped
 * to native JSON values. numeric, NaN/Infinity and everything else stay text.
 */
nlohmann::json resultToJson(const PGresult* result);

// --- Async Database Connection Pool ---

/**
 * @brief Thread-safe, asynchronous connection pool for libpq.
 *
 * Pre-allocates a fixed number of non-blocking PostgreSQL connections.
 * Connections are acquired with RAII wrappers that automatically return
 * them to the pool when destroyed.
 */
class AsyncDbPool {
public:
    /**
     * @throws std::invalid_argument if pool_size <= 0
     * @throws std::runtime_error if connection initialization fails
     */
    AsyncDbPool(std::string conn_str,
               int pool_size,
               SessionSettings settings = {},
               int acquisition_timeout_ms = 10000);

    ~AsyncDbPool();

    // Non-copyable, non-movable
    AsyncDbPool(const AsyncDbPool&) = delete;
    AsyncDbPool& operator=(const AsyncDbPool&) = delete;
    AsyncDbPool(AsyncDbPool&&) = delete;
    AsyncDbPool& operator=(AsyncDbPool&&) = delete;

    using PooledConnection = std::unique_ptr<PGconn, std::function<void(PGconn*)>>;

    /**
     * @brief Acquires a healthy connection from the pool.
     *
     * Blocks up to the acquisition timeout when every connection is in use.
     *
     * @throws std::runtime_error if the timeout elapses or no connection is healthy
     */
    PooledConnection acquire();

    size_t size() const { return all_connections_.size(); }


private:
    void release(PGconn* conn);
    bool ensureConnectionHealthy(PGconn* conn);

    std::string conn_str_;
    SessionSettings settings_;
    std::chrono::milliseconds acquisition_timeout_;

    // Owns all connections; PQfinish runs when the pool is destroyed
    std::vector<PGConnPtr> all_connections_;

    // Raw pointers to the idle connections
    std::queue<PGconn*> idle_connections_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

/**
 * @brief Applies schema.sql followed by every .sql file under migrations (lexical order)
 * from the given directory. Every file must be idempotent.
 *
 * @throws std::runtime_error if the base schema is missing or a statement fails
 */
void initialize_schema(AsyncDbPool& pool, const std::string& schema_dir);

} // namespace sluice

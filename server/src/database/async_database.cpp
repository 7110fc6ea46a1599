#include "sluice/async_database.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

// For select() system call (POSIX)
#include <sys/select.h>

namespace sluice {

namespace {

std::string session_statements(const SessionSettings& settings) {
    std::string sql =
        "SET statement_timeout = " + std::to_string(settings.statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(settings.lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " +
        std::to_string(settings.idle_in_transaction_timeout_ms) + ";";
    if (!settings.search_path.empty()) {
        sql += " SET search_path TO " + settings.search_path + ";";
    }
    return sql;
}

void drainResults(PGconn* conn) {
    PGresult* drain;
    while ((drain = PQgetResult(conn)) != nullptr) {
        PQclear(drain);
    }
}

// Runs the session SET commands on a freshly (re)established connection.
// Returns an empty string on success, the error otherwise.
std::string applySessionSettings(PGconn* conn, const SessionSettings& settings) {
    if (PQsetnonblocking(conn, 1) != 0) {
        return "Failed to set non-blocking mode: " + std::string(PQerrorMessage(conn));
    }

    PQsetClientEncoding(conn, "UTF8");

    std::string set_params = session_statements(settings);
    try {
        sendAndWait(conn, set_params.c_str());
    } catch (const std::exception& e) {
        return std::string("Failed to send connection parameters: ") + e.what();
    }

    PGresult* result;
    std::string error;
    while ((result = PQgetResult(conn)) != nullptr) {
        if (error.empty() && PQresultStatus(result) != PGRES_COMMAND_OK) {
            error = "Failed to set connection parameters: " + std::string(PQresultErrorMessage(result));
        }
        PQclear(result);
    }
    return error;
}

std::string read_sql_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open SQL file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> get_sql_files(const std::string& dir) {
    std::vector<std::string> files;
    if (!std::filesystem::exists(dir)) return files;

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".sql") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // anonymous namespace

// --- Socket polling ---

void waitForSocket(PGconn* conn, bool for_reading, int timeout_ms) {
    int sock_fd = PQsocket(conn);
    if (sock_fd < 0) {
        throw std::runtime_error("PQsocket returned invalid file descriptor.");
    }

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(sock_fd, &fds);

    struct timeval tv;
    struct timeval* limit = nullptr;
    if (timeout_ms >= 0) {
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        limit = &tv;
    }

    int ret = for_reading ? select(sock_fd + 1, &fds, nullptr, nullptr, limit)
                          : select(sock_fd + 1, nullptr, &fds, nullptr, limit);
    if (ret < 0) {
        throw std::runtime_error("select() failed: " + std::string(strerror(errno)));
    }
    if (ret == 0) {
        throw std::runtime_error("Timed out after " + std::to_string(timeout_ms) + "ms waiting for the server");
    }
}

// --- Connecting ---

namespace {

// Drives PQconnectPoll / PQresetPoll to completion, waiting on the socket in between
template <typename PollFn>
void poll_until_ready(PGconn* conn, PollFn poll, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        PostgresPollingStatusType status = poll(conn);
        if (status == PGRES_POLLING_OK) return;
        if (status == PGRES_POLLING_FAILED) {
            throw std::runtime_error(PQerrorMessage(conn));
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        waitForSocket(conn, status == PGRES_POLLING_READING, static_cast<int>(std::max<int64_t>(remaining, 0)));
    }
}

} // anonymous namespace

PGConnPtr asyncConnect(const char* conn_str, const SessionSettings& settings) {
    PGConnPtr conn(PQconnectStart(conn_str));
    if (!conn) {
        throw std::runtime_error("PQconnectStart failed to allocate connection.");
    }
    if (PQstatus(conn.get()) == CONNECTION_BAD) {
        throw std::runtime_error("PQconnectStart failed: " + std::string(PQerrorMessage(conn.get())));
    }

    try {
        poll_until_ready(conn.get(), PQconnectPoll, settings.connect_timeout_ms);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Async connection failed: ") + e.what());
    }

    std::string error = applySessionSettings(conn.get(), settings);
    if (!error.empty()) {
        throw std::runtime_error(error);
    }
    return conn;
}

bool asyncReset(PGconn* conn, const SessionSettings& settings) {
    if (!conn || PQresetStart(conn) == 0) {
        spdlog::error("[AsyncDbPool] Could not start connection reset");
        return false;
    }

    try {
        poll_until_ready(conn, PQresetPoll, settings.connect_timeout_ms);
    } catch (const std::exception& e) {
        spdlog::error("[AsyncDbPool] Reset failed: {}", e.what());
        return false;
    }

    std::string error = applySessionSettings(conn, settings);
    if (!error.empty()) {
        spdlog::error("[AsyncDbPool] Reset succeeded but {}", error);
        return false;
    }

    spdlog::info("[AsyncDbPool] Connection reset and session settings reapplied");
    return true;
}

// --- Sending ---

namespace {

void flush_outgoing(PGconn* conn) {
    int flushed;
    while ((flushed = PQflush(conn)) != 0) {
        if (flushed < 0) {
            throw std::runtime_error("PQflush failed: " + std::string(PQerrorMessage(conn)));
        }
        waitForSocket(conn, false);
    }
}

// Blocks on the socket until the whole reply is buffered
void read_reply(PGconn* conn) {
    do {
        waitForSocket(conn, true);
        if (!PQconsumeInput(conn)) {
            throw std::runtime_error("PQconsumeInput failed: " + std::string(PQerrorMessage(conn)));
        }
    } while (PQisBusy(conn));
}

void await_reply(PGconn* conn) {
    flush_outgoing(conn);
    read_reply(conn);
}

// Exactly one result of the expected status; anything else is drained and reported
PGResultPtr single_result(PGconn* conn, ExecStatusType expected, const char* what) {
    PGResultPtr result(PQgetResult(conn));
    if (!result) {
        throw std::runtime_error(std::string("Server returned no result for ") + what + ".");
    }
    if (PQresultStatus(result.get()) != expected) {
        std::string message = PQresultErrorMessage(result.get());
        drainResults(conn);
        throw std::runtime_error(std::string(what) + " failed: " + message);
    }
    PGResultPtr extra(PQgetResult(conn));
    if (extra) {
        drainResults(conn);
        throw std::runtime_error(std::string("Unexpected extra result after ") + what + ".");
    }
    return result;
}

} // anonymous namespace

void sendAndWait(PGconn* conn, const char* query) {
    if (!PQsendQuery(conn, query)) {
        throw std::runtime_error("PQsendQuery failed: " + std::string(PQerrorMessage(conn)));
    }
    await_reply(conn);
}

void sendQueryParamsAsync(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    if (!PQsendQueryParams(conn, sql.c_str(), static_cast<int>(values.size()),
                           nullptr, values.data(), nullptr, nullptr, 0)) {
        throw std::runtime_error("PQsendQueryParams failed: " + std::string(PQerrorMessage(conn)));
    }
    await_reply(conn);
}

// --- Results ---

void getCommandResult(PGconn* conn) {
    single_result(conn, PGRES_COMMAND_OK, "command");
}

PGResultPtr getCommandResultPtr(PGconn* conn) {
    return single_result(conn, PGRES_COMMAND_OK, "command");
}

PGResultPtr getTuplesResult(PGconn* conn) {
    return single_result(conn, PGRES_TUPLES_OK, "query");
}


PGResultPtr getLastResult(PGconn* conn) {
    PGResultPtr last;
    PGresult* raw;
    while ((raw = PQgetResult(conn)) != nullptr) {
        PGResultPtr current(raw);
        ExecStatusType status = PQresultStatus(raw);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
            std::string errMsg = PQresultErrorMessage(raw);
            while (!errMsg.empty() && (errMsg.back() == '\n' || errMsg.back() == ' ')) {
                errMsg.pop_back();
            }
            drainResults(conn);
            throw std::runtime_error(errMsg);
        }
        last = std::move(current);
    }
    if (!last) {
        throw std::runtime_error("Server returned no result.");
    }
    return last;
}

// --- Row conversion ---

nlohmann::json resultToJson(const PGresult* result) {
    nlohmann::json rows = nlohmann::json::array();
    if (!result) return rows;

    int num_rows = PQntuples(result);
    int num_fields = PQnfields(result);

    for (int row = 0; row < num_rows; ++row) {
        nlohmann::json json_row = nlohmann::json::object();

        for (int col = 0; col < num_fields; ++col) {
            const char* field_name = PQfname(result, col);
            if (!field_name) continue;

            if (PQgetisnull(result, row, col)) {
                json_row[field_name] = nullptr;
                continue;
            }

            std::string value = PQgetvalue(result, row, col);
            switch (PQftype(result, col)) {
                case 16: // bool
                    json_row[field_name] = (value == "t" || value == "true");
                    break;
                case 20: // int8
                case 21: // int2
                case 23: // int4
                    try {
                        json_row[field_name] = std::stoll(value);
                    } catch (const std::exception&) {
                        json_row[field_name] = value;
                    }
                    break;
                case 700:  // float4
                case 701:  // float8
                    // NaN and Infinity have no JSON number form
                    try {
                        double number = std::stod(value);
                        if (std::isfinite(number)) {
                            json_row[field_name] = number;
                        } else {
                            json_row[field_name] = value;
                        }
                    } catch (const std::exception&) {
                        json_row[field_name] = value;
                    }
                    break;
                case 1700: // numeric, arbitrary precision: kept as its exact text
                    json_row[field_name] = value;
                    break;
                case 114:  // json
                case 3802: // jsonb
                    json_row[field_name] = nlohmann::json::parse(value, nullptr, false);
                    if (json_row[field_name].is_discarded()) {
                        json_row[field_name] = value;
                    }
                    break;
                default:
                    json_row[field_name] = value;
                    break;
            }
        }

        rows.push_back(std::move(json_row));
    }

    return rows;
}

// --- AsyncDbPool Implementation ---

AsyncDbPool::AsyncDbPool(std::string conn_str,
                       int pool_size,
                       SessionSettings settings,
                       int acquisition_timeout_ms)
    : conn_str_(std::move(conn_str)),
      settings_(std::move(settings)),
      acquisition_timeout_(acquisition_timeout_ms) {

    if (pool_size <= 0) {
        throw std::invalid_argument("Pool size must be greater than 0");
    }

    spdlog::info("[AsyncDbPool] Initializing {} async connections...", pool_size);

    all_connections_.reserve(pool_size);

    for (int i = 0; i < pool_size; ++i) {
        try {
            auto conn = asyncConnect(conn_str_.c_str(), settings_);
            PGconn* raw_conn_ptr = conn.get();
            all_connections_.push_back(std::move(conn));
            idle_connections_.push(raw_conn_ptr);

            spdlog::debug("[AsyncDbPool] Connection {}/{} initialized", i + 1, pool_size);
        } catch (const std::exception& e) {
            spdlog::error("[AsyncDbPool] Failed to create connection {}/{}: {}",
                         i + 1, pool_size, e.what());
            throw;
        }
    }

    spdlog::info("[AsyncDbPool] Initialization complete. {} connections ready.",
                all_connections_.size());
}

AsyncDbPool::~AsyncDbPool() {
    spdlog::info("[AsyncDbPool] Shutting down pool with {} connections...",
                all_connections_.size());

    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (idle_connections_.size() != all_connections_.size()) {
            spdlog::warn("[AsyncDbPool] Waiting for {} connections to be returned...",
                        all_connections_.size() - idle_connections_.size());

            cv_.wait_for(lock, std::chrono::seconds(5), [this] {
                return idle_connections_.size() == all_connections_.size();
            });

            if (idle_connections_.size() != all_connections_.size()) {
                spdlog::error("[AsyncDbPool] {} connections still in use during shutdown!",
                            all_connections_.size() - idle_connections_.size());
            }
        }
    }

    spdlog::info("[AsyncDbPool] Shutdown complete.");
}

AsyncDbPool::PooledConnection AsyncDbPool::acquire() {
    // Each connection is tried at most once; when the DB is down they all fail fast
    const int max_attempts = static_cast<int>(all_connections_.size());
    int attempts = 0;

    while (attempts < max_attempts) {
        std::unique_lock<std::mutex> lock(mtx_);

        if (!cv_.wait_for(lock, acquisition_timeout_, [this] { return !idle_connections_.empty(); })) {
            spdlog::error("[AsyncDbPool] Timed out after {}ms waiting for a connection ({} in use)",
                         acquisition_timeout_.count(), all_connections_.size());
            throw std::runtime_error("Timed out waiting for a database connection from the pool");
        }

        PGconn* conn = idle_connections_.front();
        idle_connections_.pop();

        spdlog::debug("[AsyncDbPool] Connection acquired ({} remaining)",
                     idle_connections_.size());

        lock.unlock();

        if (ensureConnectionHealthy(conn)) {
            return PooledConnection(conn, [this](PGconn* returned_conn) {
                this->release(returned_conn);
            });
        }

        spdlog::debug("[AsyncDbPool] Connection health check failed (attempt {}/{}), trying next connection",
                     attempts + 1, max_attempts);
        release(conn);
        attempts++;
    }

    spdlog::error("[AsyncDbPool] Failed to acquire healthy connection after {} attempts. Database may be unavailable.",
                 max_attempts);
    throw std::runtime_error("Failed to acquire healthy database connection: all connections unhealthy. Database may be down.");
}

void AsyncDbPool::release(PGconn* conn) {
    if (!conn) return;

    // Pending results would make the next user fail with "another command is already in progress"
    drainResults(conn);

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection invalid on release, attempting async reset...");
        if (!asyncReset(conn, settings_)) {
            spdlog::error("[AsyncDbPool] Async connection reset failed, connection may be unusable");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        idle_connections_.push(conn);
        spdlog::debug("[AsyncDbPool] Connection released ({} available)",
                     idle_connections_.size());
    }

    cv_.notify_one();
}

// Round-trips SELECT 1; a connection that can not answer within 100ms is reset
bool AsyncDbPool::ensureConnectionHealthy(PGconn* conn) {
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection status not OK, resetting");
        return asyncReset(conn, settings_);
    }

    try {
        if (!PQsendQuery(conn, "SELECT 1")) {
            throw std::runtime_error(PQerrorMessage(conn));
        }
        flush_outgoing(conn);
        waitForSocket(conn, true, 100);
        read_reply(conn);
        single_result(conn, PGRES_TUPLES_OK, "health check");
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[AsyncDbPool] Health check failed ({}), resetting", e.what());
        drainResults(conn);
        return asyncReset(conn, settings_);
    }
}

// --- Schema initialization ---

void initialize_schema(AsyncDbPool& pool, const std::string& schema_dir) {
    std::string base_file = schema_dir + "/schema.sql";
    if (!std::filesystem::exists(base_file)) {
        throw std::runtime_error("Base schema file not found: " + base_file);
    }

    auto conn = pool.acquire();

    std::vector<std::string> files = {base_file};
    auto migrations = get_sql_files(schema_dir + "/migrations");
    files.insert(files.end(), migrations.begin(), migrations.end());

    for (const auto& file : files) {
        spdlog::debug("[Schema] Applying {}", file);
        std::string sql = read_sql_file(file);
        sendAndWait(conn.get(), sql.c_str());
        try {
            getLastResult(conn.get());
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to apply " + file + ": " + e.what());
        }
    }

    spdlog::info("[Schema] Applied base schema and {} migration(s)", migrations.size());
}

} // namespace sluice

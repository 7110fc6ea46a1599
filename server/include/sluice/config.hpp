#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace sluice {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

// Parse "1000,3000,10000" into {1000, 3000, 10000}. Non-numeric entries are skipped.
inline std::vector<int> parse_int_list(const std::string& csv) {
    std::vector<int> values;
    std::string remaining = csv;
    size_t pos = 0;
    while (true) {
        pos = remaining.find(',');
        std::string item = remaining.substr(0, pos);
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            try {
                values.push_back(std::stoi(item.substr(start, end - start + 1)));
            } catch (const std::exception&) {
                // Skip malformed entry
            }
        }
        if (pos == std::string::npos) break;
        remaining = remaining.substr(pos + 1);
    }
    return values;
}

struct WorkerConfig {
    std::string worker_id = "sluice-worker-1";
    std::string application_name = "sluice-worker";
    bool dev_mode = false;

    static WorkerConfig from_env() {
        WorkerConfig config;
        config.worker_id = get_env_string("WORKER_ID", "sluice-worker-1");
        config.application_name = get_env_string("APP_NAME", "sluice-worker");
        return config;
    }
};

// Metadata store: request rows, advisory locks and the durable job queue
struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "sluice";
    std::string schema_dir = "schema";

    // SSL configuration
    bool use_ssl = false;
    bool ssl_reject_unauthorized = true;

    // Pool configuration
    int pool_size = 10;
    int idle_timeout = 30000;             // 30 seconds
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds - timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema_dir = get_env_string("SLUICE_SCHEMA_DIR", "schema");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);
        config.ssl_reject_unauthorized = get_env_bool("PG_SSL_REJECT_UNAUTHORIZED", true);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        if (use_ssl) {
            conn_str += ssl_reject_unauthorized ? " sslmode=require" : " sslmode=prefer";
        } else {
            conn_str += " sslmode=disable";
        }

        // connect_timeout is in seconds; session timeouts are applied with SET after connecting
        conn_str += " connect_timeout=" + std::to_string(connection_timeout / 1000);

        return conn_str;
    }
};

// Credentials used when connecting to relational target instances
struct TargetConfig {
    std::string pg_user = "postgres";
    std::string pg_password = "password";
    bool pg_use_ssl = true;
    int connect_timeout_seconds = 10;

    static TargetConfig from_env() {
        TargetConfig config;
        config.pg_user = get_env_string("TARGET_PG_USER", "postgres");
        config.pg_password = get_env_string("TARGET_PG_PASSWORD", "password");
        config.pg_use_ssl = get_env_bool("TARGET_PG_SSL", true);
        config.connect_timeout_seconds = get_env_int("TARGET_CONNECT_TIMEOUT_SECONDS", 10);
        return config;
    }
};

struct ExecutionConfig {
    int query_timeout_ms = 60000;
    int mongo_operation_timeout_ms = 60000;
    int mongo_server_selection_timeout_ms = 10000;
    int max_result_rows = 10000;          // 0 disables the pre-flight row estimate
    bool row_estimate_enabled = true;
    int compression_threshold_bytes = 1048576;

    static ExecutionConfig from_env() {
        ExecutionConfig config;
        config.query_timeout_ms = get_env_int("QUERY_TIMEOUT_MS", 60000);
        config.mongo_operation_timeout_ms = get_env_int("MONGO_OPERATION_TIMEOUT_MS", 60000);
        config.mongo_server_selection_timeout_ms = get_env_int("MONGO_SERVER_SELECTION_TIMEOUT_MS", 10000);
        config.max_result_rows = get_env_int("MAX_RESULT_ROWS", 10000);
        config.row_estimate_enabled = get_env_bool("ROW_ESTIMATE_ENABLED", true);
        config.compression_threshold_bytes = get_env_int("COMPRESSION_THRESHOLD_BYTES", 1048576);
        return config;
    }
};

struct SandboxConfig {
    int timeout_ms = 30000;
    int max_memory_mb = 128;
    int max_stack_kb = 1024;

    static SandboxConfig from_env() {
        SandboxConfig config;
        config.timeout_ms = get_env_int("SCRIPT_TIMEOUT_MS", 30000);
        config.max_memory_mb = get_env_int("SCRIPT_MAX_MEMORY_MB", 128);
        config.max_stack_kb = get_env_int("SCRIPT_MAX_STACK_KB", 1024);
        return config;
    }
};

struct QueueConfig {
    std::string name = "query_execution";
    int worker_concurrency = 4;          // Jobs fetched per batch and run in parallel
    int poll_interval_ms = 1000;
    int max_retries = 3;
    std::vector<int> retry_backoff_ms = {1000, 3000, 10000};
    int job_timeout_ms = 300000;         // Active jobs older than this are expired by maintenance
    int lock_retry_delay_ms = 1000;      // Delay before a lock-contended job is offered again

    // Maintenance
    int archive_completed_after_seconds = 86400;
    int delete_after_days = 7;
    int maintenance_interval_seconds = 120;

    int shutdown_timeout_ms = 30000;

    static QueueConfig from_env() {
        QueueConfig config;
        config.name = get_env_string("QUEUE_NAME", "query_execution");
        config.worker_concurrency = get_env_int("WORKER_CONCURRENCY", 4);
        config.poll_interval_ms = get_env_int("QUEUE_POLL_INTERVAL_MS", 1000);
        config.max_retries = get_env_int("MAX_JOB_RETRIES", 3);
        auto backoff = parse_int_list(get_env_string("RETRY_BACKOFF_MS", "1000,3000,10000"));
        if (!backoff.empty()) {
            config.retry_backoff_ms = backoff;
        }
        config.job_timeout_ms = get_env_int("JOB_TIMEOUT_MS", 300000);
        config.lock_retry_delay_ms = get_env_int("LOCK_RETRY_DELAY_MS", 1000);
        config.archive_completed_after_seconds = get_env_int("ARCHIVE_COMPLETED_AFTER_SECONDS", 86400);
        config.delete_after_days = get_env_int("DELETE_AFTER_DAYS", 7);
        config.maintenance_interval_seconds = get_env_int("MAINTENANCE_INTERVAL_SECONDS", 120);
        config.shutdown_timeout_ms = get_env_int("SHUTDOWN_TIMEOUT_MS", 30000);
        return config;
    }

    // Backoff for the given attempt; the last entry repeats once the list is exhausted
    int retry_delay_for(int attempt) const {
        if (retry_backoff_ms.empty()) return 0;
        if (attempt < 0) attempt = 0;
        size_t index = static_cast<size_t>(attempt);
        if (index >= retry_backoff_ms.size()) index = retry_backoff_ms.size() - 1;
        return retry_backoff_ms[index];
    }
};

struct LoggingConfig {
    bool enable_logging = true;
    std::string log_level = "info";
    std::string log_format = "text";
    bool log_timestamp = true;

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.enable_logging = get_env_bool("ENABLE_LOGGING", true);
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_format = get_env_string("LOG_FORMAT", "text");
        config.log_timestamp = get_env_bool("LOG_TIMESTAMP", true);
        return config;
    }
};

struct Config {
    WorkerConfig worker;
    DatabaseConfig database;
    TargetConfig target;
    ExecutionConfig execution;
    SandboxConfig sandbox;
    QueueConfig queue;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.worker = WorkerConfig::from_env();
        config.database = DatabaseConfig::from_env();
        config.target = TargetConfig::from_env();
        config.execution = ExecutionConfig::from_env();
        config.sandbox = SandboxConfig::from_env();
        config.queue = QueueConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace sluice

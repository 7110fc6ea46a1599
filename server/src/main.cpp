#include "sluice/config.hpp"
#include "sluice/logging.hpp"
#include "sluice/worker_daemon.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

// Global daemon instance for signal handling
std::unique_ptr<sluice::WorkerDaemon> g_daemon;

void signal_handler(int) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --dev                        Enable development mode (debug logging)\n"
              << "  --enqueue REQUEST_ID         Queue an approved request and exit\n"
              << "  --approver ID                Approver recorded with --enqueue\n"
              << "  --help                       Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST                      Metadata store host (default: localhost)\n"
              << "  PG_PORT                      Metadata store port (default: 5432)\n"
              << "  PG_DB                        Metadata store database (default: postgres)\n"
              << "  PG_USER                      Metadata store user (default: postgres)\n"
              << "  PG_PASSWORD                  Metadata store password (default: postgres)\n"
              << "  DB_POOL_SIZE                 Metadata store pool size (default: 10)\n"
              << "  TARGET_PG_USER               User for relational targets (default: postgres)\n"
              << "  TARGET_PG_PASSWORD           Password for relational targets\n"
              << "  WORKER_CONCURRENCY           Jobs run in parallel (default: 4)\n"
              << "  QUERY_TIMEOUT_MS             Statement timeout (default: 60000)\n"
              << "  SCRIPT_TIMEOUT_MS            Script wall-clock timeout (default: 30000)\n"
              << "  SCRIPT_MAX_MEMORY_MB         Script memory ceiling (default: 128)\n"
              << "  MAX_RESULT_ROWS              Row estimate limit, 0 disables (default: 10000)\n"
              << "  LOG_LEVEL                    trace|debug|info|warn|error (default: info)\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    sluice::Config config = sluice::Config::load();

    std::string enqueue_id;
    std::string approver_id;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--dev") {
            config.worker.dev_mode = true;
            config.logging.log_level = "debug";
        } else if (arg == "--enqueue" && i + 1 < argc) {
            enqueue_id = argv[++i];
        } else if (arg == "--approver" && i + 1 < argc) {
            approver_id = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    sluice::configure_logging(config.logging);

    if (!enqueue_id.empty() && approver_id.empty()) {
        std::cerr << "--enqueue requires --approver" << std::endl;
        return 1;
    }

    try {
        g_daemon = std::make_unique<sluice::WorkerDaemon>(config);

        if (!enqueue_id.empty()) {
            g_daemon->initialize();
            auto job_id = g_daemon->enqueue_request(enqueue_id, approver_id);
            if (job_id) {
                std::cout << "Enqueued job " << *job_id << " for request " << enqueue_id << std::endl;
            } else {
                std::cout << "Request " << enqueue_id << " already has an outstanding job" << std::endl;
            }
            g_daemon.reset();
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        spdlog::info("🚀 Starting Sluice execution worker...");
        spdlog::info("📊 Configuration:");
        spdlog::info("   - Worker ID: {}", config.worker.worker_id);
        spdlog::info("   - Database: {}:{}/{}", config.database.host, config.database.port, config.database.database);
        spdlog::info("   - Pool Size: {}", config.database.pool_size);
        spdlog::info("   - Queue: {} (concurrency={}, poll={}ms)",
                     config.queue.name, config.queue.worker_concurrency, config.queue.poll_interval_ms);
        spdlog::info("   - Query Timeout: {}ms", config.execution.query_timeout_ms);
        spdlog::info("   - Max Result Rows: {}", config.execution.max_result_rows);
        spdlog::info("   - Script Limits: {}ms, {} MB", config.sandbox.timeout_ms, config.sandbox.max_memory_mb);
        spdlog::info("   - Dev Mode: {}", config.worker.dev_mode ? "enabled" : "disabled");

        g_daemon->initialize();
        spdlog::info("✅ Worker initialized successfully");

        // Blocks until SIGINT/SIGTERM
        g_daemon->run();
        g_daemon.reset();

    } catch (const std::exception& e) {
        spdlog::error("❌ Worker error: {}", e.what());
        g_daemon.reset();
        return 1;
    }

    return 0;
}

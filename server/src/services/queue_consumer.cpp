#include "sluice/queue_consumer.hpp"
#include "sluice/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <vector>

namespace sluice {

QueueConsumer::QueueConsumer(std::shared_ptr<JobQueue> queue, Handler handler, QueueConfig config,
                             Spawner spawner)
    : queue_(std::move(queue)), handler_(std::move(handler)), config_(std::move(config)),
      spawner_(std::move(spawner)) {
    if (config_.worker_concurrency <= 0) {
        throw std::invalid_argument("Worker concurrency must be greater than 0");
    }
    if (!spawner_) {
        spawner_ = [](std::function<void()> body) { return std::thread(std::move(body)); };
    }
}

QueueConsumer::~QueueConsumer() {
    stop_accepting();
    join();
}

void QueueConsumer::start() {
    if (accepting_) {
        spdlog::warn("[JobQueue] Consumer already running");
        return;
    }
    accepting_ = true;
    poll_thread_ = std::thread(&QueueConsumer::poll_loop, this);

    spdlog::info("[JobQueue] Consumer started: queue={}, batch_size={}, poll_interval={}ms",
                 config_.name, config_.worker_concurrency, config_.poll_interval_ms);
}

void QueueConsumer::stop_accepting() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        accepting_ = false;
    }
    wake_cv_.notify_all();
}

void QueueConsumer::join() {
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

void QueueConsumer::sleep_for(int ms) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return !accepting_.load(); });
}

void QueueConsumer::poll_loop() {
    while (accepting_) {
        std::vector<QueueJob> jobs;
        try {
            jobs = queue_->fetch(config_.worker_concurrency);
        } catch (const std::exception& e) {
            spdlog::error("[JobQueue] Fetch failed: {}", e.what());
            sleep_for(config_.poll_interval_ms);
            continue;
        }

        if (jobs.empty()) {
            sleep_for(config_.poll_interval_ms);
            continue;
        }

        run_batch(jobs);
    }
    spdlog::debug("[JobQueue] Polling stopped");
}

void QueueConsumer::run_batch(const std::vector<QueueJob>& jobs) {
    if (jobs.size() == 1) {
        handle_job(jobs.front());
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(jobs.size());
    try {
        for (const auto& job : jobs) {
            threads.push_back(spawner_([this, &job]() { handle_job(job); }));
        }
    } catch (const std::exception& e) {
        spdlog::error("[JobQueue] Could not start batch thread ({} of {} running): {}",
                      threads.size(), jobs.size(), e.what());
    }

    // Jobs that never got a thread go back to the queue untouched
    for (size_t i = threads.size(); i < jobs.size(); ++i) {
        try {
            queue_->defer(jobs[i], config_.poll_interval_ms);
        } catch (const std::exception& defer_error) {
            spdlog::error("[JobQueue] Failed to defer job {}: {}", jobs[i].id, defer_error.what());
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

void QueueConsumer::handle_job(const QueueJob& job) {
    try {
        handler_(job);
    } catch (const LockUnavailableError& e) {
        spdlog::info("[JobQueue] {}; job {} offered again in {}ms",
                     e.what(), job.id, config_.lock_retry_delay_ms);
        try {
            queue_->defer(job, config_.lock_retry_delay_ms);
        } catch (const std::exception& defer_error) {
            spdlog::error("[JobQueue] Failed to defer job {}: {}", job.id, defer_error.what());
        }
        return;
    } catch (const std::exception& e) {
        try {
            queue_->fail(job, e.what(), config_.retry_delay_for(job.retry_count));
        } catch (const std::exception& fail_error) {
            spdlog::error("[JobQueue] Failed to record failure of job {}: {}", job.id, fail_error.what());
        }
        return;
    }

    try {
        queue_->complete(job);
    } catch (const std::exception& e) {
        // The job stays active until maintenance expires it, then it is redelivered
        spdlog::error("[JobQueue] Failed to complete job {}: {}", job.id, e.what());
    }
}

} // namespace sluice

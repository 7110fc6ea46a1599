#pragma once

#include "sluice/config.hpp"
#include "sluice/job_queue.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace sluice {

/**
 * QueueConsumer - polls the job queue and runs each batch in parallel
 *
 * One polling thread fetches up to worker_concurrency jobs, runs the handler
 * for each on its own thread and waits for the whole batch before polling
 * again. Handler outcome decides the job's fate:
 *   returns normally          -> complete
 *   LockUnavailableError      -> defer (no retry consumed)
 *   any other std::exception  -> fail with the configured backoff
 */
class QueueConsumer {
public:
    using Handler = std::function<void(const QueueJob&)>;

    // Starts one batch thread; replaceable so thread exhaustion can be exercised
    using Spawner = std::function<std::thread(std::function<void()>)>;

    QueueConsumer(std::shared_ptr<JobQueue> queue, Handler handler, QueueConfig config,
                  Spawner spawner = nullptr);
    ~QueueConsumer();

    void start();

    // Stops fetching new batches; the batch in flight keeps running
    void stop_accepting();

    // Waits for the polling thread (and so the batch in flight) to finish
    void join();

    bool accepting() const { return accepting_; }

private:
    void poll_loop();
    void run_batch(const std::vector<QueueJob>& jobs);
    void handle_job(const QueueJob& job);
    void sleep_for(int ms);

    std::shared_ptr<JobQueue> queue_;
    Handler handler_;
    QueueConfig config_;
    Spawner spawner_;

    std::atomic<bool> accepting_{false};
    std::thread poll_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace sluice

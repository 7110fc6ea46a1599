#pragma once

#include "sluice/async_database.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sluice {

/**
 * Non-blocking mutual exclusion keyed by channel key.
 *
 * acquire() never waits for a contended lock: false means "try again later".
 */
class LockProvider {
public:
    virtual ~LockProvider() = default;

    virtual bool acquire(const std::string& channel_key) = 0;
    virtual void release(const std::string& channel_key) = 0;
    virtual bool is_held(const std::string& channel_key) const = 0;
    virtual void release_all() = 0;
    virtual size_t active_lock_count() const = 0;
};

// One dedicated metadata-store connection able to hold session-level advisory locks.
class AdvisoryLockSession {
public:
    virtual ~AdvisoryLockSession() = default;

    virtual bool try_lock(int64_t lock_id) = 0;
    virtual void unlock(int64_t lock_id) = 0;
};

class AdvisoryLockSource {
public:
    virtual ~AdvisoryLockSource() = default;

    // Throws when no session can be opened
    virtual std::unique_ptr<AdvisoryLockSession> open_session() = 0;
};

// Rolling 31-multiplier hash over the key bytes, masked into the positive bigint range
int64_t hash_channel_key(const std::string& key);

class NamedLockService : public LockProvider {
private:
    struct LockHandle {
        int64_t lock_id;
        std::unique_ptr<AdvisoryLockSession> session;
    };

    std::shared_ptr<AdvisoryLockSource> source_;
    std::unordered_map<std::string, LockHandle> active_locks_;
    mutable std::mutex mutex_;

public:
    explicit NamedLockService(std::shared_ptr<AdvisoryLockSource> source);
    ~NamedLockService() override;

    bool acquire(const std::string& channel_key) override;
    void release(const std::string& channel_key) override;
    bool is_held(const std::string& channel_key) const override;
    void release_all() override;
    size_t active_lock_count() const override;
};

// Sessions backed by connections taken from the metadata store pool
class PgAdvisoryLockSource : public AdvisoryLockSource {
public:
    explicit PgAdvisoryLockSource(std::shared_ptr<AsyncDbPool> db_pool) : db_pool_(std::move(db_pool)) {}

    std::unique_ptr<AdvisoryLockSession> open_session() override;

private:
    std::shared_ptr<AsyncDbPool> db_pool_;
};

} // namespace sluice

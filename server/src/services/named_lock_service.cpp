#include "sluice/named_lock_service.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace sluice {

namespace {

class PgAdvisoryLockSession : public AdvisoryLockSession {
public:
    explicit PgAdvisoryLockSession(AsyncDbPool::PooledConnection conn) : conn_(std::move(conn)) {}

    // The connection goes back to the pool; it must not carry a session lock with it
    ~PgAdvisoryLockSession() override {
        if (!locked_) return;
        try {
            sendAndWait(conn_.get(), "SELECT pg_advisory_unlock_all()");
            getTuplesResult(conn_.get());
        } catch (const std::exception& e) {
            spdlog::error("[LockService] Failed to clear advisory locks before returning connection: {}", e.what());
            PQreset(conn_.get());
        }
    }

    bool try_lock(int64_t lock_id) override {
        sendQueryParamsAsync(conn_.get(),
            "SELECT pg_try_advisory_lock($1::bigint)",
            {std::to_string(lock_id)});
        auto result = getTuplesResult(conn_.get());
        locked_ = PQntuples(result.get()) > 0 && std::string(PQgetvalue(result.get(), 0, 0)) == "t";
        return locked_;
    }

    void unlock(int64_t lock_id) override {
        sendQueryParamsAsync(conn_.get(),
            "SELECT pg_advisory_unlock($1::bigint)",
            {std::to_string(lock_id)});
        auto result = getTuplesResult(conn_.get());
        locked_ = false;
        if (PQntuples(result.get()) > 0 && std::string(PQgetvalue(result.get(), 0, 0)) != "t") {
            spdlog::warn("[LockService] Advisory lock {} was not held by this session", lock_id);
        }
    }

private:
    AsyncDbPool::PooledConnection conn_;
    bool locked_ = false;
};

} // anonymous namespace

int64_t hash_channel_key(const std::string& key) {
    constexpr uint64_t mask = 0x7FFFFFFFFFFFFFFFULL;
    uint64_t hash = 0;
    for (unsigned char c : key) {
        hash = ((hash << 5) - hash + c) & mask;
    }
    return static_cast<int64_t>(hash);
}

std::unique_ptr<AdvisoryLockSession> PgAdvisoryLockSource::open_session() {
    return std::make_unique<PgAdvisoryLockSession>(db_pool_->acquire());
}

NamedLockService::NamedLockService(std::shared_ptr<AdvisoryLockSource> source)
    : source_(std::move(source)) {
}

NamedLockService::~NamedLockService() {
    release_all();
}

bool NamedLockService::acquire(const std::string& channel_key) {
    if (is_held(channel_key)) {
        spdlog::debug("[LockService] Lock already held for {}", channel_key);
        return true;
    }

    int64_t lock_id = hash_channel_key(channel_key);
    std::unique_ptr<AdvisoryLockSession> session;

    try {
        session = source_->open_session();
        if (!session->try_lock(lock_id)) {
            spdlog::debug("[LockService] Lock busy for {} (id {})", channel_key, lock_id);
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("[LockService] Failed to acquire lock for {}: {}", channel_key, e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_locks_.emplace(channel_key, LockHandle{lock_id, std::move(session)});
    }
    spdlog::debug("[LockService] Acquired lock for {} (id {})", channel_key, lock_id);
    return true;
}

void NamedLockService::release(const std::string& channel_key) {
    LockHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_locks_.find(channel_key);
        if (it == active_locks_.end()) {
            return;
        }
        handle = std::move(it->second);
        active_locks_.erase(it);
    }

    try {
        handle.session->unlock(handle.lock_id);
        spdlog::debug("[LockService] Released lock for {}", channel_key);
    } catch (const std::exception& e) {
        // Session-level lock still goes away once the connection is reset or closed
        spdlog::error("[LockService] Failed to release lock for {}: {}", channel_key, e.what());
    }
}

bool NamedLockService::is_held(const std::string& channel_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_locks_.count(channel_key) > 0;
}

void NamedLockService::release_all() {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : active_locks_) {
            keys.push_back(entry.first);
        }
    }
    if (!keys.empty()) {
        spdlog::info("[LockService] Releasing {} held lock(s)", keys.size());
    }
    for (const auto& key : keys) {
        release(key);
    }
}

size_t NamedLockService::active_lock_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_locks_.size();
}

} // namespace sluice

// session_store.cpp
// Login session store guarded by a reader/writer lock, plus the expiry sweeper

#include "session_store.hpp"
#include "../lib/log.h"
#include <mbedtls/sha256.h>
#include <errno.h>
#include <stdio.h>
#include <atomic>

namespace xmlcompare {

static log_category_t* session_log() { return log_get_category("session"); }

static std::atomic<unsigned long> session_counter(0);

std::string sha256_hex(const std::string& input) {
    unsigned char hash[32];
    // 0 = SHA-256 (not SHA-224)
    if (mbedtls_sha256((const unsigned char*)input.data(), input.size(), hash, 0) != 0) {
        clog_error(session_log(), "sha256 computation failed");
        return std::string();
    }
    char hex[65];
    for (int i = 0; i < 32; i++) {
        snprintf(&hex[i * 2], 3, "%02x", hash[i]);
    }
    hex[64] = '\0';
    return std::string(hex);
}

// ============================================================================
// SessionStore
// ============================================================================

SessionStore::SessionStore(long ttl_seconds) : ttl_seconds_(ttl_seconds) {
    pthread_rwlock_init(&rwlock_, NULL);
}

SessionStore::~SessionStore() {
    pthread_rwlock_destroy(&rwlock_);
}

Session SessionStore::create(const std::string& url, const std::vector<std::string>& cookies) {
    Session session;
    session.url = url;
    session.cookies = cookies;
    session.created_at = time(NULL);
    session.expires_at = session.created_at + ttl_seconds_;

    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    char seed[96];
    snprintf(seed, sizeof(seed), "|%ld.%09ld|%lu|%lu", (long)ts.tv_sec, ts.tv_nsec,
             session_counter.fetch_add(1), (unsigned long)pthread_self());
    session.id = sha256_hex(url + seed);

    pthread_rwlock_wrlock(&rwlock_);
    sessions_[session.id] = session;
    size_t count = sessions_.size();
    pthread_rwlock_unlock(&rwlock_);

    clog_debug(session_log(), "created session %.8s... for %s (%zu active)",
               session.id.c_str(), url.c_str(), count);
    return session;
}

bool SessionStore::lookup(const std::string& id, Session& out) const {
    time_t now = time(NULL);
    bool found = false;

    pthread_rwlock_rdlock(&rwlock_);
    std::unordered_map<std::string, Session>::const_iterator it = sessions_.find(id);
    if (it != sessions_.end() && now < it->second.expires_at) {
        out = it->second;
        found = true;
    }
    pthread_rwlock_unlock(&rwlock_);

    if (!found) clog_debug(session_log(), "session lookup miss");
    return found;
}

bool SessionStore::remove(const std::string& id) {
    pthread_rwlock_wrlock(&rwlock_);
    bool removed = sessions_.erase(id) > 0;
    pthread_rwlock_unlock(&rwlock_);

    if (removed) clog_debug(session_log(), "removed session %.8s...", id.c_str());
    return removed;
}

size_t SessionStore::sweep_expired(time_t now) {
    size_t removed = 0;

    pthread_rwlock_wrlock(&rwlock_);
    for (std::unordered_map<std::string, Session>::iterator it = sessions_.begin();
         it != sessions_.end();) {
        if (now >= it->second.expires_at) {
            it = sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    pthread_rwlock_unlock(&rwlock_);

    if (removed > 0) clog_info(session_log(), "swept %zu expired sessions", removed);
    return removed;
}

size_t SessionStore::size() const {
    pthread_rwlock_rdlock(&rwlock_);
    size_t count = sessions_.size();
    pthread_rwlock_unlock(&rwlock_);
    return count;
}

// ============================================================================
// SessionSweeper
// ============================================================================

SessionSweeper::SessionSweeper(SessionStore& store, long interval_seconds)
    : store_(store), interval_seconds_(interval_seconds > 0 ? interval_seconds : 300),
      running_(false), stop_requested_(false) {
    pthread_mutex_init(&mutex_, NULL);
    pthread_cond_init(&cond_, NULL);
}

SessionSweeper::~SessionSweeper() {
    stop();
    pthread_cond_destroy(&cond_);
    pthread_mutex_destroy(&mutex_);
}

bool SessionSweeper::start() {
    if (running_) return true;
    stop_requested_ = false;
    if (pthread_create(&thread_, NULL, thread_main, this) != 0) {
        clog_error(session_log(), "failed to start session sweeper thread");
        return false;
    }
    running_ = true;
    clog_debug(session_log(), "session sweeper started (every %lds)", interval_seconds_);
    return true;
}

void SessionSweeper::stop() {
    if (!running_) return;

    pthread_mutex_lock(&mutex_);
    stop_requested_ = true;
    pthread_cond_signal(&cond_);
    pthread_mutex_unlock(&mutex_);

    pthread_join(thread_, NULL);
    running_ = false;
    clog_debug(session_log(), "session sweeper stopped");
}

void* SessionSweeper::thread_main(void* arg) {
    ((SessionSweeper*)arg)->run();
    return NULL;
}

void SessionSweeper::run() {
    pthread_mutex_lock(&mutex_);
    while (!stop_requested_) {
        struct timespec deadline;
        clock_gettime(CLOCK_REALTIME, &deadline);
        deadline.tv_sec += interval_seconds_;

        int rc = 0;
        while (!stop_requested_ && rc != ETIMEDOUT) {
            rc = pthread_cond_timedwait(&cond_, &mutex_, &deadline);
        }
        if (stop_requested_) break;

        pthread_mutex_unlock(&mutex_);
        store_.sweep_expired();
        pthread_mutex_lock(&mutex_);
    }
    pthread_mutex_unlock(&mutex_);
}

} // namespace xmlcompare

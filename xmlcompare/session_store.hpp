#pragma once
#ifndef XMLCOMPARE_SESSION_STORE_HPP
#define XMLCOMPARE_SESSION_STORE_HPP

#include "document_source.hpp"
#include <pthread.h>
#include <string>
#include <time.h>
#include <unordered_map>
#include <vector>

namespace xmlcompare {

struct Session {
    std::string id;                     // 64 hex chars
    std::string url;                    // login URL
    std::vector<std::string> cookies;   // "name=value" pairs
    time_t created_at;
    time_t expires_at;

    Session() : created_at(0), expires_at(0) {}

    AuthToken token() const {
        AuthToken t;
        t.cookies = cookies;
        t.expires_at = expires_at;
        return t;
    }
};

/**
 * Process-scoped store of login sessions.
 *
 * Lookups take the shared side of a reader/writer lock; create, remove and
 * sweep take the exclusive side. A session is visible until now >= expires_at.
 */
class SessionStore {
private:
    mutable pthread_rwlock_t rwlock_;
    std::unordered_map<std::string, Session> sessions_;
    long ttl_seconds_;

    SessionStore(const SessionStore&);
    SessionStore& operator=(const SessionStore&);

public:
    explicit SessionStore(long ttl_seconds = 3600);
    ~SessionStore();

    long ttl() const { return ttl_seconds_; }

    // Registers a new session expiring ttl seconds from now
    Session create(const std::string& url, const std::vector<std::string>& cookies);

    // False for unknown or expired ids
    bool lookup(const std::string& id, Session& out) const;

    // Logout; false if the id was not present
    bool remove(const std::string& id);

    // Drops every session expired at `now`; returns how many were removed
    size_t sweep_expired(time_t now);
    size_t sweep_expired() { return sweep_expired(time(NULL)); }

    size_t size() const;
};

/**
 * Background thread calling SessionStore::sweep_expired every interval.
 * stop() wakes the thread at once and joins it; the destructor stops.
 */
class SessionSweeper {
private:
    SessionStore& store_;
    long interval_seconds_;
    pthread_t thread_;
    pthread_mutex_t mutex_;
    pthread_cond_t cond_;
    bool running_;
    bool stop_requested_;

    static void* thread_main(void* arg);
    void run();

    SessionSweeper(const SessionSweeper&);
    SessionSweeper& operator=(const SessionSweeper&);

public:
    SessionSweeper(SessionStore& store, long interval_seconds = 300);
    ~SessionSweeper();

    bool start();
    void stop();
    bool running() const { return running_; }
};

// 64-char lowercase hex SHA-256 of an arbitrary seed string; "" on failure
std::string sha256_hex(const std::string& input);

} // namespace xmlcompare

#endif // XMLCOMPARE_SESSION_STORE_HPP

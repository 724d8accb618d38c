/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

#include "zikzi/log.hpp"
#include "zikzi/store.hpp"

namespace zikzi::internal {

/**
 * Redis-backed Store over a fixed pool of hiredis connections.
 * Records are hashes under key_prefix:
 *   user:<id>, username:<name> -> id, token:<id>, user_tokens:<user-id> (set),
 *   ip:<address>, job:<id>, jobs and jobs:user:<user-id> (zsets by created ms),
 *   jobs:status:<status> (sets).
 * User records are cached in-memory with TTL.
 */
class RedisStore : public zikzi::Store {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional
        std::string key_prefix = "zikzi:";
        int         pool_size  = 8;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
        int         cache_ttl_sec = 60;       // TTL for cached users
    };

    RedisStore(const Options& opt, std::shared_ptr<zikzi::Logger> log);
    ~RedisStore() override;

    // Connects the pool and PINGs once; false when Redis is unreachable.
    bool init();

    bool find_ip_registration(const std::string& ip, std::int64_t now,
                              IPRegistration& out) override;
    bool find_user_by_name(const std::string& username, User& out) override;
    std::vector<Token> active_tokens(const std::string& user_id) override;
    bool touch_token(const std::string& token_id, std::int64_t when) override;
    bool create_job(PrintJob& job) override;
    bool save_job(const PrintJob& job) override;
    bool find_job(const std::string& id, PrintJob& out) override;
    std::vector<PrintJob> recent_jobs(const std::string& user_id, std::size_t limit) override;
    std::size_t queued_job_count() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

private:
    using Args = std::vector<std::string>;
    using Fields = std::unordered_map<std::string, std::string>;
    struct ReplyDeleter { void operator()(redisReply* r) const { if (r) freeReplyObject(r); } };
    using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

    Options _opt;
    std::shared_ptr<zikzi::Logger> _log;

    // -------- connection pool --------
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };
    std::vector<RedisConn>  _pool;
    std::deque<size_t>      _free;
    std::mutex              _pool_mtx;
    std::condition_variable _pool_cv;

    // -------- user cache --------
    struct CacheEntry {
        User user;
        std::chrono::steady_clock::time_point expires;
    };
    std::mutex _cache_mtx;
    std::unordered_map<std::string, CacheEntry> _cache; // username -> user

    // Serializes read-check-write of job records within this process.
    std::mutex _job_mtx;

    bool connect_one(size_t idx);
    void close_one(size_t idx);
    bool auth_and_select(::redisContext* ctx);

    std::string key(const std::string& suffix) const { return _opt.key_prefix + suffix; }

    Reply command(::redisContext* ctx, const Args& args);
    // MULTI ... EXEC; true when every queued command succeeded.
    bool transaction(::redisContext* ctx, const std::vector<Args>& cmds);
    bool hgetall(::redisContext* ctx, const std::string& k, Fields& out);
    bool load_job(::redisContext* ctx, const std::string& id, PrintJob& out);

    static Args job_hset_args(const std::string& k, const PrintJob& job);
    static bool job_from_fields(const std::string& id, const Fields& f, PrintJob& out);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(RedisStore& s) : store(s) {}
        ~Slot() { release(); }
        bool acquire();
        void release();
        ::redisContext* ctx();     // ensure connected and return pointer
    private:
        RedisStore& store;
        size_t idx = (size_t)-1;
        bool   have = false;
    };
};

} // namespace zikzi::internal

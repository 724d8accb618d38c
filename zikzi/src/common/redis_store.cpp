/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/redis_store.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

#include <sys/time.h>

namespace zikzi::internal {

static std::int64_t to_i64(const std::string& s) {
    if (s.empty()) return 0;
    try {
        return std::stoll(s);
    } catch (const std::exception&) {
        return 0;
    }
}

static std::string field(const std::unordered_map<std::string, std::string>& f, const char* name) {
    auto it = f.find(name);
    return it == f.end() ? std::string() : it->second;
}

RedisStore::RedisStore(const Options& opt, std::shared_ptr<zikzi::Logger> log)
    : _opt(opt), _log(std::move(log))
{
    if (_opt.pool_size <= 0) _opt.pool_size = 1;
}

RedisStore::~RedisStore() {
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
}

/* ---------------- Pool ---------------- */

bool RedisStore::init() {
    _pool.resize(static_cast<size_t>(_opt.pool_size));

    // Pre-connect all slots (best effort)
    size_t connected = 0;
    for (size_t i = 0; i < _pool.size(); ++i) {
        if (connect_one(i)) ++connected;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _free.clear();
        for (size_t i = 0; i < _pool.size(); ++i) _free.push_back(i);
    }
    if (connected == 0) {
        _log->error("[STORE][redis] no connection to " + _opt.host + ":" + std::to_string(_opt.port));
        return false;
    }

    {
        Slot slot(*this);
        slot.acquire();
        ::redisContext* c = slot.ctx();
        if (!c) return false;
        Reply r = command(c, {"PING"});
        if (!r || r->type == REDIS_REPLY_ERROR) {
            _log->error("[STORE][redis] PING failed");
            return false;
        }
    }

    _log->info("[STORE] redis backend initialized: pool=" + std::to_string(_pool.size()) +
               " host=" + _opt.host + ":" + std::to_string(_opt.port) +
               " db=" + std::to_string(_opt.db) +
               " prefix=" + _opt.key_prefix +
               " cache_ttl=" + std::to_string(_opt.cache_ttl_sec) + "s");
    return true;
}

bool RedisStore::connect_one(size_t idx) {
    if (idx >= _pool.size()) return false;

    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            _log->error(std::string("[STORE][redis] connect error: ") + ctx->errstr);
            redisFree(ctx);
        } else {
            _log->error("[STORE][redis] connect error: NULL context");
        }
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        _log->warn("[STORE][redis] failed to set command timeout");
    }

    if (!auth_and_select(ctx)) {
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool RedisStore::auth_and_select(::redisContext* ctx) {
    if (!_opt.password.empty()) {
        Reply r = command(ctx, {"AUTH", _opt.password});
        if (!r) {
            _log->error("[STORE][redis] AUTH failed: no reply");
            return false;
        }
        if (r->type == REDIS_REPLY_ERROR) {
            _log->error(std::string("[STORE][redis] AUTH error: ") + (r->str ? r->str : ""));
            return false;
        }
    }
    if (_opt.db != 0) {
        Reply r = command(ctx, {"SELECT", std::to_string(_opt.db)});
        if (!r) {
            _log->error("[STORE][redis] SELECT failed: no reply");
            return false;
        }
        if (r->type == REDIS_REPLY_ERROR) {
            _log->error(std::string("[STORE][redis] SELECT error: ") + (r->str ? r->str : ""));
            return false;
        }
    }
    return true;
}

void RedisStore::close_one(size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

bool RedisStore::Slot::acquire() {
    if (have) return true;
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&]{ return !store._free.empty(); });
    idx = store._free.front();
    store._free.pop_front();
    have = true;
    return true;
}

void RedisStore::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(store._pool_mtx);
        store._free.push_back(idx);
    }
    store._pool_cv.notify_one();
    idx = (size_t)-1;
    have = false;
}

::redisContext* RedisStore::Slot::ctx() {
    // The slot is exclusively owned by this thread until release().
    auto& c = store._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        store.close_one(idx);
        (void)store.connect_one(idx);
    }
    return store._pool[idx].ctx;
}

/* ---------------- Command helpers ---------------- */

RedisStore::Reply RedisStore::command(::redisContext* ctx, const Args& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argl;
    argv.reserve(args.size());
    argl.reserve(args.size());
    for (const auto& a : args) {
        argv.push_back(a.data());
        argl.push_back(a.size());
    }
    auto* r = static_cast<redisReply*>(
        redisCommandArgv(ctx, static_cast<int>(args.size()), argv.data(), argl.data()));
    if (!r) {
        // Connection likely broken; next acquire will reconnect
        _log->error(std::string("[STORE][redis] ") + args[0] + " failed: " +
                    (ctx->err ? ctx->errstr : "no reply"));
    }
    return Reply(r);
}

bool RedisStore::transaction(::redisContext* ctx, const std::vector<Args>& cmds) {
    Reply m = command(ctx, {"MULTI"});
    if (!m || m->type == REDIS_REPLY_ERROR) return false;

    bool queued = true;
    for (const auto& c : cmds) {
        Reply q = command(ctx, c);
        if (!q) return false;
        if (q->type == REDIS_REPLY_ERROR) {
            _log->error(std::string("[STORE][redis] ") + c[0] + " rejected: " + (q->str ? q->str : ""));
            queued = false;
        }
    }
    if (!queued) {
        command(ctx, {"DISCARD"});
        return false;
    }

    Reply e = command(ctx, {"EXEC"});
    if (!e || e->type != REDIS_REPLY_ARRAY) return false;
    for (size_t i = 0; i < e->elements; ++i) {
        if (e->element[i]->type == REDIS_REPLY_ERROR) {
            _log->error(std::string("[STORE][redis] EXEC error: ") +
                        (e->element[i]->str ? e->element[i]->str : ""));
            return false;
        }
    }
    return true;
}

bool RedisStore::hgetall(::redisContext* ctx, const std::string& k, Fields& out) {
    Reply r = command(ctx, {"HGETALL", k});
    if (!r || r->type != REDIS_REPLY_ARRAY) return false;
    out.clear();
    for (size_t i = 0; i + 1 < r->elements; i += 2) {
        const redisReply* f = r->element[i];
        const redisReply* v = r->element[i + 1];
        if (f->type != REDIS_REPLY_STRING || v->type != REDIS_REPLY_STRING) continue;
        out[std::string(f->str, f->len)] = std::string(v->str, v->len);
    }
    return !out.empty();
}

/* ---------------- Users / tokens / IPs ---------------- */

bool RedisStore::find_ip_registration(const std::string& ip, std::int64_t now,
                                      IPRegistration& out)
{
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    Fields f;
    if (!hgetall(c, key("ip:" + ip), f)) return false;

    IPRegistration r;
    r.ip_address = ip;
    r.user_id    = field(f, "user_id");
    r.is_active  = field(f, "is_active") == "1";
    r.expires_at = to_i64(field(f, "expires_at"));
    if (r.user_id.empty() || !r.is_valid(now)) return false;
    out = r;
    return true;
}

bool RedisStore::find_user_by_name(const std::string& username, User& out) {
    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        auto it = _cache.find(username);
        if (it != _cache.end()) {
            if (std::chrono::steady_clock::now() < it->second.expires) {
                out = it->second.user;
                return true;
            }
            _cache.erase(it);
        }
    }

    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    Reply id = command(c, {"GET", key("username:" + username)});
    if (!id || id->type != REDIS_REPLY_STRING) return false;
    const std::string uid(id->str, id->len);

    Fields f;
    if (!hgetall(c, key("user:" + uid), f)) return false;

    User u;
    u.id                 = uid;
    u.username           = field(f, "username");
    u.password_hash      = field(f, "password_hash");
    u.digest_ha1         = field(f, "digest_ha1");
    u.allow_ipp_password = field(f, "allow_ipp_password") != "0";
    if (u.username != username) return false;

    {
        std::lock_guard<std::mutex> lk(_cache_mtx);
        _cache[username] = CacheEntry{
            u, std::chrono::steady_clock::now() + std::chrono::seconds(_opt.cache_ttl_sec)
        };
    }
    out = u;
    return true;
}

std::vector<Token> RedisStore::active_tokens(const std::string& user_id) {
    std::vector<Token> out;
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return out;

    Reply ids = command(c, {"SMEMBERS", key("user_tokens:" + user_id)});
    if (!ids || ids->type != REDIS_REPLY_ARRAY) return out;

    for (size_t i = 0; i < ids->elements; ++i) {
        const redisReply* e = ids->element[i];
        if (e->type != REDIS_REPLY_STRING) continue;
        const std::string tid(e->str, e->len);

        Fields f;
        if (!hgetall(c, key("token:" + tid), f)) continue;
        Token t;
        t.id           = tid;
        t.user_id      = field(f, "user_id");
        t.value        = field(f, "value");
        t.is_active    = field(f, "is_active") == "1";
        t.expires_at   = to_i64(field(f, "expires_at"));
        t.last_used_at = to_i64(field(f, "last_used_at"));
        t.last_used_ip = field(f, "last_used_ip");
        if (t.user_id == user_id && t.is_active && !t.value.empty()) out.push_back(std::move(t));
    }
    return out;
}

bool RedisStore::touch_token(const std::string& token_id, std::int64_t when) {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    // HSET on a missing hash would create a stray record
    Reply ex = command(c, {"EXISTS", key("token:" + token_id)});
    if (!ex || ex->type != REDIS_REPLY_INTEGER || ex->integer == 0) return false;

    Reply r = command(c, {"HSET", key("token:" + token_id), "last_used_at", std::to_string(when)});
    return r && r->type != REDIS_REPLY_ERROR;
}

/* ---------------- Jobs ---------------- */

RedisStore::Args RedisStore::job_hset_args(const std::string& k, const PrintJob& job) {
    return Args{
        "HSET", k,
        "user_id",        job.user_id,
        "source_ip",      job.source_ip,
        "hostname",       job.hostname,
        "document_name",  job.document_name,
        "app_name",       job.app_name,
        "os_version",     job.os_version,
        "original_file",  job.original_file,
        "pdf_file",       job.pdf_file,
        "thumbnail_file", job.thumbnail_file,
        "page_count",     std::to_string(job.page_count),
        "file_size",      std::to_string(job.file_size),
        "status",         to_string(job.status),
        "created_at_ms",  std::to_string(job.created_at_ms),
        "processed_at",   std::to_string(job.processed_at),
        "error",          job.error,
    };
}

bool RedisStore::job_from_fields(const std::string& id, const Fields& f, PrintJob& out) {
    PrintJob j;
    j.id = id;
    if (!parse_job_status(field(f, "status"), j.status)) return false;
    j.user_id        = field(f, "user_id");
    j.source_ip      = field(f, "source_ip");
    j.hostname       = field(f, "hostname");
    j.document_name  = field(f, "document_name");
    j.app_name       = field(f, "app_name");
    j.os_version     = field(f, "os_version");
    j.original_file  = field(f, "original_file");
    j.pdf_file       = field(f, "pdf_file");
    j.thumbnail_file = field(f, "thumbnail_file");
    j.page_count     = static_cast<int>(to_i64(field(f, "page_count")));
    j.file_size      = to_i64(field(f, "file_size"));
    j.created_at_ms  = to_i64(field(f, "created_at_ms"));
    j.processed_at   = to_i64(field(f, "processed_at"));
    j.error          = field(f, "error");
    out = std::move(j);
    return true;
}

bool RedisStore::load_job(::redisContext* ctx, const std::string& id, PrintJob& out) {
    Fields f;
    if (!hgetall(ctx, key("job:" + id), f)) return false;
    return job_from_fields(id, f, out);
}

bool RedisStore::create_job(PrintJob& job) {
    if (job.id.empty()) job.id = generate_short_id();
    if (job.created_at_ms == 0) job.created_at_ms = now_epoch_ms();

    std::lock_guard<std::mutex> jl(_job_mtx);
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    const std::string jk = key("job:" + job.id);
    Reply ex = command(c, {"EXISTS", jk});
    if (!ex || ex->type != REDIS_REPLY_INTEGER || ex->integer != 0) return false;

    const std::string score = std::to_string(job.created_at_ms);
    std::vector<Args> cmds;
    cmds.push_back(job_hset_args(jk, job));
    cmds.push_back({"ZADD", key("jobs"), score, job.id});
    if (!job.user_id.empty()) cmds.push_back({"ZADD", key("jobs:user:" + job.user_id), score, job.id});
    cmds.push_back({"SADD", key(std::string("jobs:status:") + to_string(job.status)), job.id});
    return transaction(c, cmds);
}

bool RedisStore::save_job(const PrintJob& job) {
    std::lock_guard<std::mutex> jl(_job_mtx);
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;

    PrintJob cur;
    if (!load_job(c, job.id, cur)) return false;
    if (is_terminal(cur.status)) return false;
    if (job.status != cur.status && !can_advance(cur.status, job.status)) return false;

    PrintJob next = job;
    next.created_at_ms = cur.created_at_ms;

    std::vector<Args> cmds;
    cmds.push_back(job_hset_args(key("job:" + job.id), next));
    if (next.status != cur.status) {
        cmds.push_back({"SREM", key(std::string("jobs:status:") + to_string(cur.status)), job.id});
        cmds.push_back({"SADD", key(std::string("jobs:status:") + to_string(next.status)), job.id});
    }
    return transaction(c, cmds);
}

bool RedisStore::find_job(const std::string& id, PrintJob& out) {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return false;
    return load_job(c, id, out);
}

std::vector<PrintJob> RedisStore::recent_jobs(const std::string& user_id, std::size_t limit) {
    std::vector<PrintJob> out;
    if (limit == 0) return out;

    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return out;

    const std::string zk = user_id.empty() ? key("jobs") : key("jobs:user:" + user_id);
    Reply ids = command(c, {"ZREVRANGE", zk, "0", std::to_string(limit - 1)});
    if (!ids || ids->type != REDIS_REPLY_ARRAY) return out;

    for (size_t i = 0; i < ids->elements; ++i) {
        const redisReply* e = ids->element[i];
        if (e->type != REDIS_REPLY_STRING) continue;
        PrintJob j;
        if (load_job(c, std::string(e->str, e->len), j)) out.push_back(std::move(j));
    }
    return out;
}

std::size_t RedisStore::queued_job_count() {
    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx();
    if (!c) return 0;

    std::size_t n = 0;
    for (JobStatus s : {JobStatus::Received, JobStatus::Processing}) {
        Reply r = command(c, {"SCARD", key(std::string("jobs:status:") + to_string(s))});
        if (r && r->type == REDIS_REPLY_INTEGER && r->integer > 0) n += static_cast<std::size_t>(r->integer);
    }
    return n;
}

} // namespace zikzi::internal

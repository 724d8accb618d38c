/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <string>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <thread>
#include <cstddef>

namespace zikzi::internal {

// Digest-auth nonces: nonce -> expiry. Process lifetime only.
// At most `max_entries` are held; under pressure the oldest are dropped.
class NonceCache {
public:
    using clock = std::chrono::steady_clock;

    explicit NonceCache(clock::duration ttl = std::chrono::minutes(5),
                        std::size_t max_entries = 10000);
    ~NonceCache();

    // 16 random bytes, hex encoded, valid for ttl. Empty on RNG failure.
    std::string generate();

    // Present and not yet expired.
    bool is_valid(const std::string& nonce) const;

    void invalidate(const std::string& nonce);

    // Drop expired entries; returns how many were removed.
    std::size_t sweep();

    std::size_t size() const;

    // Background sweep every `interval` until stop_sweeper() / destruction.
    void start_sweeper(clock::duration interval = std::chrono::minutes(1));
    void stop_sweeper();

    NonceCache(const NonceCache&) = delete;
    NonceCache& operator=(const NonceCache&) = delete;

private:
    const clock::duration _ttl;
    const std::size_t     _max;

    mutable std::shared_mutex _mtx;
    std::unordered_map<std::string, clock::time_point> _nonces;

    std::mutex              _gc_mtx;
    std::condition_variable _gc_cv;
    bool                    _gc_stop = false;
    std::thread             _gc_thread;

    void sweep_loop(clock::duration interval);
    void prune_locked(std::size_t target, clock::time_point now);
};

} // namespace zikzi::internal

/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/nonce_cache.hpp"
#include "zikzi/internal/utils.hpp"

#include <algorithm>
#include <vector>

namespace zikzi::internal {

NonceCache::NonceCache(clock::duration ttl, std::size_t max_entries)
    : _ttl(ttl), _max(max_entries > 0 ? max_entries : 1)
{
}

NonceCache::~NonceCache() {
    stop_sweeper();
}

std::string NonceCache::generate() {
    std::string nonce = random_hex(16);
    if (nonce.empty()) return nonce;

    const auto now = clock::now();
    std::unique_lock<std::shared_mutex> lk(_mtx);

    // pressure-based pruning
    if (_nonces.size() >= _max) {
        prune_locked(static_cast<std::size_t>(_max * 0.8), now);
    }
    _nonces[nonce] = now + _ttl;
    return nonce;
}

void NonceCache::prune_locked(std::size_t target, clock::time_point now) {
    for (auto it = _nonces.begin(); it != _nonces.end();) {
        if (now >= it->second) it = _nonces.erase(it);
        else ++it;
    }
    if (_nonces.size() <= target) return;

    // Same TTL for all entries: earliest expiry is oldest issue
    std::vector<clock::time_point> exp;
    exp.reserve(_nonces.size());
    for (const auto& kv : _nonces) exp.push_back(kv.second);
    const std::size_t drop = _nonces.size() - target;
    std::nth_element(exp.begin(), exp.begin() + static_cast<std::ptrdiff_t>(drop - 1), exp.end());
    const auto cutoff = exp[drop - 1];

    for (auto it = _nonces.begin(); it != _nonces.end() && _nonces.size() > target;) {
        if (it->second <= cutoff) it = _nonces.erase(it);
        else ++it;
    }
}

bool NonceCache::is_valid(const std::string& nonce) const {
    if (nonce.empty()) return false;
    std::shared_lock<std::shared_mutex> lk(_mtx);
    auto it = _nonces.find(nonce);
    if (it == _nonces.end()) return false;
    return clock::now() < it->second;
}

void NonceCache::invalidate(const std::string& nonce) {
    std::unique_lock<std::shared_mutex> lk(_mtx);
    _nonces.erase(nonce);
}

std::size_t NonceCache::sweep() {
    const auto now = clock::now();
    std::size_t removed = 0;
    std::unique_lock<std::shared_mutex> lk(_mtx);
    for (auto it = _nonces.begin(); it != _nonces.end();) {
        if (now >= it->second) { it = _nonces.erase(it); ++removed; }
        else ++it;
    }
    return removed;
}

std::size_t NonceCache::size() const {
    std::shared_lock<std::shared_mutex> lk(_mtx);
    return _nonces.size();
}

void NonceCache::start_sweeper(clock::duration interval) {
    std::lock_guard<std::mutex> lk(_gc_mtx);
    if (_gc_thread.joinable()) return;
    _gc_stop = false;
    _gc_thread = std::thread(&NonceCache::sweep_loop, this, interval);
}

void NonceCache::stop_sweeper() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(_gc_mtx);
        _gc_stop = true;
        t.swap(_gc_thread);
    }
    _gc_cv.notify_all();
    if (t.joinable()) t.join();
}

void NonceCache::sweep_loop(clock::duration interval) {
    std::unique_lock<std::mutex> lk(_gc_mtx);
    while (!_gc_stop) {
        if (_gc_cv.wait_for(lk, interval, [this] { return _gc_stop; })) break;
        lk.unlock();
        (void)sweep();
        lk.lock();
    }
}

} // namespace zikzi::internal

/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/utils.hpp"
#include "zikzi/internal/time.hpp"

#include <cctype>
#include <cstring>
#include <mutex>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace zikzi::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

bool ct_equal(const std::string& a, const std::string& b){
    if(a.size()!=b.size()) return false;
    if(a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    const std::size_t n = std::strlen(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(&s[0], s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)&b[0], (int)b.size()) != 1) return {};
    return bytes_to_hex((const unsigned char*)b.data(), b.size());
}

bool base64_decode(const std::string& in, std::string& out) {
    std::string s = in;
    trim_inplace(s);
    if (s.empty()) { out.clear(); return true; }
    if (s.size() % 4 != 0) return false;

    std::string buf;
    buf.resize(s.size() / 4 * 3);
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                                  reinterpret_cast<const unsigned char*>(s.data()),
                                  (int)s.size());
    if (n < 0) return false;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t pad = 0;
    if (s[s.size()-1] == '=') ++pad;
    if (s[s.size()-2] == '=') ++pad;
    buf.resize(static_cast<std::size_t>(n) - pad);
    out.swap(buf);
    return true;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::size_t p = 0;
    while (p <= s.size()) {
        std::size_t c = s.find(',', p);
        if (c == std::string::npos) c = s.size();
        std::string item = s.substr(p, c - p);
        trim_inplace(item);
        if (!item.empty()) out.push_back(item);
        p = c + 1;
    }
    return out;
}

namespace {
const char kBase62[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr std::int64_t kIdEpochMs = 1704067200000LL; // 2024-01-01T00:00:00Z

constexpr std::uint64_t kTailSpace = 62ULL * 62 * 62 * 62 * 62; // five base62 digits

std::mutex    g_id_mtx;
std::int64_t  g_id_last_ms = -1;
std::uint64_t g_id_base = 0;     // random start of the current millisecond
std::uint64_t g_id_counter = 0;

std::uint64_t random_u64() {
    unsigned char rb[8];
    if (RAND_bytes(rb, sizeof(rb)) != 1) return 0;
    std::uint64_t v = 0;
    for (unsigned char b : rb) v = (v << 8) | b;
    return v;
}
} // namespace

std::string generate_short_id() {
    std::int64_t now;
    std::uint64_t tail;
    {
        std::lock_guard<std::mutex> lk(g_id_mtx);
        now = now_epoch_ms() - kIdEpochMs;
        if (now == g_id_last_ms) {
            ++g_id_counter;
        } else {
            g_id_counter = 0;
            g_id_last_ms = now;
            g_id_base = random_u64() % kTailSpace;
        }
        // distinct within one millisecond; the time prefix separates the rest
        tail = (g_id_base + g_id_counter) % kTailSpace;
    }

    std::string id(12, '0');
    for (int i = 6; i >= 0; --i) {
        id[i] = kBase62[now % 62];
        now /= 62;
    }
    for (int i = 11; i >= 7; --i) {
        id[i] = kBase62[tail % 62];
        tail /= 62;
    }
    return id;
}

} // namespace zikzi::internal

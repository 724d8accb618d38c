/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace zikzi::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Constant-time equality (length is not secret)
bool ct_equal(const std::string& a, const std::string& b);

// Upper / lower
std::string lower_copy(std::string s);

bool starts_with(const std::string& s, const char* prefix);

// Securely wipe string contents
void secure_wipe(std::string& s);

// n random bytes from the OpenSSL CSPRNG, hex encoded (2n chars). Empty on RNG failure.
std::string random_hex(std::size_t n_bytes);

// Standard base64 (with padding). Returns false on malformed input.
bool base64_decode(const std::string& in, std::string& out);

// Split "a, b,c" on commas, trimming and dropping empty items.
std::vector<std::string> split_list(const std::string& s);

// 12-char base62 id: 7 chars of milliseconds since 2024-01-01 + 5 random chars.
std::string generate_short_id();

} // namespace zikzi::internal

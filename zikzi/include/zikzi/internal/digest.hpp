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
#include <unordered_map>

namespace zikzi::internal {

// MD5 as lowercase hex (OpenSSL EVP).
std::string md5_hex(const std::string& data);

// HA1 = MD5(username:realm:secret)
std::string digest_ha1(const std::string& username, const std::string& realm,
                       const std::string& secret);

// RFC 2617 response. qop "auth"/"auth-int" uses the nc/cnonce form,
// anything else the legacy MD5(HA1:nonce:HA2) form.
std::string digest_response(const std::string& ha1,
                            const std::string& nonce,
                            const std::string& nc,
                            const std::string& cnonce,
                            const std::string& qop,
                            const std::string& method,
                            const std::string& uri);

// Parse the part after "Digest ": key="value" or key=value pairs, comma separated.
// Quoted values may contain commas. Keys are lower-cased.
std::unordered_map<std::string, std::string> parse_digest_params(const std::string& s);

} // namespace zikzi::internal

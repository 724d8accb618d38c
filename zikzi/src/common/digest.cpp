/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/digest.hpp"
#include "zikzi/internal/utils.hpp"
#include <openssl/evp.h>

namespace zikzi::internal {

std::string md5_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_md5(), nullptr) != 1) {
        return {};
    }
    return bytes_to_hex(md, md_len);
}

std::string digest_ha1(const std::string& username, const std::string& realm,
                       const std::string& secret)
{
    return md5_hex(username + ":" + realm + ":" + secret);
}

std::string digest_response(const std::string& ha1,
                            const std::string& nonce,
                            const std::string& nc,
                            const std::string& cnonce,
                            const std::string& qop,
                            const std::string& method,
                            const std::string& uri)
{
    const std::string ha2 = md5_hex(method + ":" + uri);
    if (qop == "auth" || qop == "auth-int") {
        return md5_hex(ha1 + ":" + nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + ha2);
    }
    return md5_hex(ha1 + ":" + nonce + ":" + ha2);
}

std::unordered_map<std::string, std::string> parse_digest_params(const std::string& s) {
    std::unordered_map<std::string, std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && (s[i] == ' ' || s[i] == '\t' || s[i] == ',')) ++i;
        const std::size_t key_start = i;
        while (i < n && s[i] != '=' && s[i] != ',') ++i;
        std::string key = s.substr(key_start, i - key_start);
        trim_inplace(key);
        if (i >= n || s[i] == ',') continue;   // bare token without value
        ++i; // '='
        while (i < n && (s[i] == ' ' || s[i] == '\t')) ++i;

        std::string value;
        if (i < n && s[i] == '"') {
            ++i;
            while (i < n && s[i] != '"') {
                if (s[i] == '\\' && i + 1 < n) ++i;
                value.push_back(s[i++]);
            }
            if (i < n) ++i; // closing quote
        } else {
            const std::size_t v_start = i;
            while (i < n && s[i] != ',') ++i;
            value = s.substr(v_start, i - v_start);
            trim_inplace(value);
        }
        if (!key.empty()) out[lower_copy(key)] = value;
    }
    return out;
}

} // namespace zikzi::internal

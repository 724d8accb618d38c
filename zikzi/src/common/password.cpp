/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/password.hpp"
#include "zikzi/internal/utils.hpp"

#include <crypt.h>
#include <memory>
#include <openssl/crypto.h>

namespace zikzi::internal {

bool verify_password(const std::string& hash, const std::string& password) {
    if (hash.empty() || hash[0] != '$') return false;

    // crypt_data is large (~32 KiB); keep it off the connection thread stack.
    auto data = std::make_unique<crypt_data>();
    data->initialized = 0;
    const char* out = crypt_r(password.c_str(), hash.c_str(), data.get());
    if (!out || out[0] == '*') {
        OPENSSL_cleanse(data.get(), sizeof(crypt_data));
        return false;
    }
    const bool ok = ct_equal(std::string(out), hash);
    OPENSSL_cleanse(data.get(), sizeof(crypt_data));
    return ok;
}

} // namespace zikzi::internal

/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "zikzi/http_request.hpp"
#include "zikzi/log.hpp"
#include "zikzi/store.hpp"
#include "zikzi/types.hpp"
#include "zikzi/internal/nonce_cache.hpp"

namespace zikzi::internal {

/**
 * Resolves an IPP request to a user: IP registration first, then HTTP
 * Basic (password or token) or Digest (stored HA1 or per-token HA1).
 * must_challenge is set only when login auth is enabled and no credential
 * matched.
 */
class AuthResolver {
public:
    struct Options {
        bool        allow_ip = true;
        bool        allow_login = false;
        std::string realm = "zikzi";
    };

    AuthResolver(const Options& opt, zikzi::Store& store, NonceCache& nonces,
                 std::shared_ptr<zikzi::Logger> log);

    AuthResult resolve(const zikzi::HttpRequest& req, const std::string& client_ip);

    // Values for the two WWW-Authenticate headers (Basic, then Digest with a fresh nonce).
    std::vector<std::string> challenge_headers();

    const Options& options() const { return _opt; }

private:
    Options _opt;
    zikzi::Store& _store;
    NonceCache& _nonces;
    std::shared_ptr<zikzi::Logger> _log;

    bool check_basic(const std::string& b64, std::string& user_id);
    bool check_digest(const std::string& params, const std::string& method, std::string& user_id);

    // Active, non-expired tokens of a user.
    std::vector<Token> usable_tokens(const std::string& user_id);
};

} // namespace zikzi::internal

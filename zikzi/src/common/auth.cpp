/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/auth.hpp"
#include "zikzi/internal/digest.hpp"
#include "zikzi/internal/http_parser.hpp"
#include "zikzi/internal/password.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

namespace zikzi::internal {

AuthResolver::AuthResolver(const Options& opt, zikzi::Store& store, NonceCache& nonces,
                           std::shared_ptr<zikzi::Logger> log)
    : _opt(opt), _store(store), _nonces(nonces), _log(std::move(log))
{
}

AuthResult AuthResolver::resolve(const zikzi::HttpRequest& req, const std::string& client_ip) {
    AuthResult res;

    if (_opt.allow_ip) {
        IPRegistration reg;
        if (_store.find_ip_registration(client_ip, now_epoch(), reg)) {
            res.authenticated = true;
            res.user_id = reg.user_id;
            res.method = AuthMethod::Ip;
            return res;
        }
    }

    if (!_opt.allow_login) {
        res.reason = "no-method";
        return res;
    }

    const std::string authz = hdr_ci(req, "authorization");
    if (starts_with(authz, "Basic ")) {
        if (check_basic(authz.substr(6), res.user_id)) {
            res.authenticated = true;
            res.method = AuthMethod::Basic;
            return res;
        }
        res.reason = "basic-rejected";
    } else if (starts_with(authz, "Digest ")) {
        if (check_digest(authz.substr(7), req.method, res.user_id)) {
            res.authenticated = true;
            res.method = AuthMethod::Digest;
            return res;
        }
        res.reason = "digest-rejected";
    } else {
        res.reason = authz.empty() ? "no-credentials" : "unknown-scheme";
    }

    res.user_id.clear();
    res.must_challenge = true;
    return res;
}

std::vector<std::string> AuthResolver::challenge_headers() {
    const std::string nonce = _nonces.generate();
    if (nonce.empty()) _log->error("[AUTH] nonce generation failed");
    return {
        "Basic realm=\"" + _opt.realm + "\"",
        "Digest realm=\"" + _opt.realm + "\", nonce=\"" + nonce + "\", qop=\"auth\", algorithm=MD5",
    };
}

std::vector<Token> AuthResolver::usable_tokens(const std::string& user_id) {
    const std::int64_t now = now_epoch();
    std::vector<Token> out;
    for (auto& t : _store.active_tokens(user_id)) {
        if (t.is_valid(now)) out.push_back(std::move(t));
    }
    return out;
}

bool AuthResolver::check_basic(const std::string& b64, std::string& user_id) {
    std::string decoded;
    if (!base64_decode(b64, decoded)) return false;

    const auto colon = decoded.find(':');
    if (colon == std::string::npos) {
        secure_wipe(decoded);
        return false;
    }
    const std::string username = decoded.substr(0, colon);
    std::string credential = decoded.substr(colon + 1);
    secure_wipe(decoded);

    User user;
    if (!_store.find_user_by_name(username, user)) {
        _log->debug("[AUTH] basic: unknown user " + username);
        secure_wipe(credential);
        return false;
    }

    bool ok = false;
    if (!user.password_hash.empty() && user.allow_ipp_password &&
        verify_password(user.password_hash, credential))
    {
        _log->debug("[AUTH] basic: password accepted for " + username);
        ok = true;
    } else {
        for (const auto& t : usable_tokens(user.id)) {
            if (!t.value.empty() && ct_equal(t.value, credential)) {
                if (!_store.touch_token(t.id, now_epoch())) {
                    _log->warn("[AUTH] failed to update token last-used: " + t.id);
                }
                _log->debug("[AUTH] basic: token accepted for " + username);
                ok = true;
                break;
            }
        }
    }
    secure_wipe(credential);
    if (ok) user_id = user.id;
    return ok;
}

bool AuthResolver::check_digest(const std::string& params, const std::string& method,
                                std::string& user_id)
{
    auto p = parse_digest_params(params);
    const std::string& username = p["username"];
    const std::string& nonce    = p["nonce"];
    const std::string& uri      = p["uri"];
    const std::string& response = p["response"];

    if (nonce.empty() || !_nonces.is_valid(nonce)) {
        _log->debug("[AUTH] digest: invalid or expired nonce");
        return false;
    }
    if (response.empty()) return false;

    User user;
    if (!_store.find_user_by_name(username, user)) {
        _log->debug("[AUTH] digest: unknown user " + username);
        return false;
    }

    const std::string& nc     = p["nc"];
    const std::string& cnonce = p["cnonce"];
    const std::string& qop    = p["qop"];

    if (!user.digest_ha1.empty() && user.allow_ipp_password) {
        const std::string expected = digest_response(user.digest_ha1, nonce, nc, cnonce, qop, method, uri);
        if (ct_equal(expected, response)) {
            _log->debug("[AUTH] digest: password accepted for " + username);
            user_id = user.id;
            return true;
        }
    }

    for (const auto& t : usable_tokens(user.id)) {
        const std::string ha1 = digest_ha1(username, _opt.realm, t.value);
        const std::string expected = digest_response(ha1, nonce, nc, cnonce, qop, method, uri);
        if (ct_equal(expected, response)) {
            if (!_store.touch_token(t.id, now_epoch())) {
                _log->warn("[AUTH] failed to update token last-used: " + t.id);
            }
            _log->debug("[AUTH] digest: token accepted for " + username);
            user_id = user.id;
            return true;
        }
    }

    _log->debug("[AUTH] digest: no credential matched for " + username);
    return false;
}

} // namespace zikzi::internal

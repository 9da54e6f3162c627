/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include <cstdio>

#include <openssl/evp.h>

#include "kc1fsz-tools/md5/md5.h"

#include "SipError.h"
#include "SipUtil.h"
#include "SipMessage.h"
#include "DigestAuth.h"

using namespace std;

namespace sipwire {

static std::string toHex(const unsigned char* data, unsigned len) {
    static const char* digits = "0123456789abcdef";
    string result;
    for (unsigned i = 0; i < len; i++) {
        result += digits[(data[i] >> 4) & 0xf];
        result += digits[data[i] & 0xf];
    }
    return result;
}

static bool isSha256(const std::string& algorithm) {
    return iequals(algorithm, "SHA-256");
}

static bool isMd5(const std::string& algorithm) {
    return algorithm.empty() || iequals(algorithm, "MD5");
}

/**
 * @returns true if "auth" is one of the qop options
 */
static bool offersAuth(const std::string& qop) {
    for (const string& option : splitList(qop))
        if (iequals(option, "auth"))
            return true;
    return false;
}

DigestAuth::DigestAuth() {
}

void DigestAuth::setCredentials(const std::string& username, const std::string& password) {
    _username = username;
    _password = password;
}

void DigestAuth::reset() {
    _challenge = DigestChallenge();
    _haveChallenge = false;
    _nonceCount = 0;
}

int DigestAuth::parseChallenge(const std::string& value, DigestChallenge& ch) {

    string v = trim(value);
    size_t sp = v.find_first_of(" \t");
    if (sp == string::npos || !iequals(v.substr(0, sp), "Digest"))
        return SIP_ERR_UNSUPPORTED_CHALLENGE;

    ch = DigestChallenge();

    // The rest is a comma-separated list of name=value pairs, where
    // the values may be quoted (and may contain commas).
    for (const string& item : splitList(v.substr(sp + 1))) {
        size_t eq = item.find('=');
        if (eq == string::npos)
            continue;
        string name = trim(item.substr(0, eq));
        string val = unquote(item.substr(eq + 1));
        if (iequals(name, "realm"))
            ch.realm = val;
        else if (iequals(name, "nonce"))
            ch.nonce = val;
        else if (iequals(name, "opaque"))
            ch.opaque = val;
        else if (iequals(name, "algorithm"))
            ch.algorithm = val;
        else if (iequals(name, "qop"))
            ch.qop = val;
        else if (iequals(name, "stale"))
            ch.stale = iequals(val, "true");
    }

    if (ch.nonce.empty())
        return SIP_ERR_MALFORMED_MESSAGE;
    return SIP_OK;
}

bool DigestAuth::isSupported(const DigestChallenge& ch) {
    if (!isMd5(ch.algorithm) && !isSha256(ch.algorithm))
        return false;
    // qop is optional, but if it's there we need to be able to do "auth"
    if (!ch.qop.empty() && !offersAuth(ch.qop))
        return false;
    return true;
}

int DigestAuth::selectChallenge(const SipMessage& response, DigestChallenge& result) {

    bool proxy = response.getStatusCode() == 407;
    const char* headerName = proxy ? "Proxy-Authenticate" : "WWW-Authenticate";

    bool found = false;
    for (const string& value : response.getHeaderValues(headerName)) {
        DigestChallenge ch;
        if (parseChallenge(value, ch) != SIP_OK)
            continue;
        if (!isSupported(ch))
            continue;
        ch.proxy = proxy;
        // SHA-256 wins over anything else
        if (!found || (isSha256(ch.algorithm) && !isSha256(result.algorithm))) {
            result = ch;
            found = true;
        }
    }
    return found ? SIP_OK : SIP_ERR_UNSUPPORTED_CHALLENGE;
}

std::string DigestAuth::hash(const std::string& algorithm, const std::string& data) {
    if (isSha256(algorithm)) {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int outLen = 0;
        if (EVP_Digest(data.data(), data.size(), out, &outLen, EVP_sha256(), 0) != 1)
            return string();
        return toHex(out, outLen);
    } else {
        MD5_CTX ctx;
        MD5Init(&ctx);
        MD5Update(&ctx, (unsigned char*)data.data(), data.size());
        unsigned char out[16];
        MD5Final(out, &ctx);
        return toHex(out, 16);
    }
}

int DigestAuth::computeCredentials(const DigestChallenge& ch,
    const std::string& method, const std::string& uri,
    const std::string& username, const std::string& password,
    unsigned nonceCount, const std::string& cnonce,
    std::string& headerValue) {

    if (!isSupported(ch))
        return SIP_ERR_UNSUPPORTED_CHALLENGE;

    const string alg = isSha256(ch.algorithm) ? "SHA-256" : "MD5";
    const bool useQop = !ch.qop.empty();

    char nc[9];
    snprintf(nc, sizeof(nc), "%08x", nonceCount);

    string ha1 = hash(alg, username + ":" + ch.realm + ":" + password);
    string ha2 = hash(alg, method + ":" + uri);
    string response;
    if (useQop)
        response = hash(alg, ha1 + ":" + ch.nonce + ":" + nc + ":" + cnonce + ":auth:" + ha2);
    else
        response = hash(alg, ha1 + ":" + ch.nonce + ":" + ha2);

    headerValue = "Digest username=\"" + username + "\"";
    headerValue += ", realm=\"" + ch.realm + "\"";
    headerValue += ", nonce=\"" + ch.nonce + "\"";
    headerValue += ", uri=\"" + uri + "\"";
    headerValue += ", response=\"" + response + "\"";
    headerValue += ", algorithm=" + alg;
    if (!ch.opaque.empty())
        headerValue += ", opaque=\"" + ch.opaque + "\"";
    if (useQop) {
        headerValue += ", qop=auth";
        headerValue += ", nc=";
        headerValue += nc;
        headerValue += ", cnonce=\"" + cnonce + "\"";
    }
    return SIP_OK;
}

int DigestAuth::authorize(const SipMessage& challengeResponse, SipMessage& request) {

    DigestChallenge ch;
    int rc = selectChallenge(challengeResponse, ch);
    if (rc != SIP_OK)
        return rc;

    // A new nonce restarts the count
    if (!_haveChallenge || ch.nonce != _challenge.nonce)
        _nonceCount = 0;
    _challenge = ch;
    _haveChallenge = true;

    return _apply(request);
}

int DigestAuth::reauthorize(SipMessage& request) {
    if (!_haveChallenge)
        return SIP_ERR_NOT_FOUND;
    return _apply(request);
}

int DigestAuth::_apply(SipMessage& request) {
    _nonceCount++;
    string value;
    int rc = computeCredentials(_challenge, request.getMethod(), request.getRequestUri(),
        _username, _password, _nonceCount, randomHex(16), value);
    if (rc != SIP_OK)
        return rc;
    request.setHeader(_challenge.proxy ? "Proxy-Authorization" : "Authorization", value);
    return SIP_OK;
}

}

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
#pragma once

#include <string>

namespace sipwire {

class SipMessage;

/**
 * The interesting parts of a WWW-Authenticate or Proxy-Authenticate
 * header.
 */
struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string opaque;
    // Empty means MD5
    std::string algorithm;
    // The raw qop-options list, ex: "auth,auth-int"
    std::string qop;
    bool stale = false;
    // True if this came from a 407 (Proxy-Authenticate)
    bool proxy = false;
};

/**
 * Digest authentication (RFC 2617/7616 as used by RFC 3261). The static
 * functions are stateless. An instance belongs to exactly one account
 * or dialog and keeps track of the current nonce and nonce-count.
 */
class DigestAuth {
public:

    DigestAuth();

    void setCredentials(const std::string& username, const std::string& password);

    /**
     * Parses a single challenge header value.
     *
     * @returns SIP_OK, SIP_ERR_MALFORMED_MESSAGE if there is no nonce/realm,
     * or SIP_ERR_UNSUPPORTED_CHALLENGE if the scheme isn't Digest.
     */
    static int parseChallenge(const std::string& value, DigestChallenge& ch);

    /**
     * Looks through all of the challenges in a 401/407 response and picks the
     * strongest one that is supported (SHA-256 before MD5).
     *
     * @returns SIP_OK, or SIP_ERR_UNSUPPORTED_CHALLENGE if nothing usable
     * was offered.
     */
    static int selectChallenge(const SipMessage& response, DigestChallenge& ch);

    /**
     * @returns true if the algorithm/qop combination is implemented.
     */
    static bool isSupported(const DigestChallenge& ch);

    /**
     * Computes the value of an Authorization/Proxy-Authorization header.
     *
     * @param nonceCount Only used when qop=auth is in effect.
     * @param cnonce Only used when qop=auth is in effect.
     * @returns SIP_OK or SIP_ERR_UNSUPPORTED_CHALLENGE.
     */
    static int computeCredentials(const DigestChallenge& ch,
        const std::string& method, const std::string& uri,
        const std::string& username, const std::string& password,
        unsigned nonceCount, const std::string& cnonce,
        std::string& headerValue);

    /**
     * @returns The lower-case hex digest of the data using "MD5" or
     * "SHA-256".
     */
    static std::string hash(const std::string& algorithm, const std::string& data);

    /**
     * Takes a 401/407 response, remembers the challenge, and adds the
     * appropriate credentials header to the request. The nonce-count
     * starts over at 1 whenever the server issues a new nonce.
     *
     * @returns SIP_OK or SIP_ERR_UNSUPPORTED_CHALLENGE.
     */
    int authorize(const SipMessage& challengeResponse, SipMessage& request);

    /**
     * Adds credentials to a new request using the challenge that was
     * previously cached, bumping the nonce-count.
     *
     * @returns SIP_OK, or SIP_ERR_NOT_FOUND if no challenge has been seen.
     */
    int reauthorize(SipMessage& request);

    bool hasChallenge() const { return _haveChallenge; }
    unsigned getNonceCount() const { return _nonceCount; }
    const std::string& getNonce() const { return _challenge.nonce; }

    void reset();

private:

    int _apply(SipMessage& request);

    std::string _username;
    std::string _password;
    DigestChallenge _challenge;
    bool _haveChallenge = false;
    unsigned _nonceCount = 0;
};

}

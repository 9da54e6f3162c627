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

#include <cstdint>
#include <string>

#include "SipMessage.h"
#include "DigestAuth.h"

namespace kc1fsz {
    class Log;
    class Clock;
}

namespace sipwire {

class SignalingHost;

/**
 * The REGISTER lifecycle of one account, identified by (username, domain).
 * Instances live in a fixed table owned by the SignalingEngine and are
 * recycled using reset()/setup().
 *
 * Any event that isn't allowed in the current state is rejected with
 * SIP_ERR_ILLEGAL_TRANSITION and the state is left alone. Responses that
 * don't belong to the transaction currently in flight are treated the
 * same way.
 */
class Registration {
public:

    enum State {
        STATE_NONE,
        STATE_REGISTERING,
        STATE_REGISTERED,
        STATE_REFRESHING,
        STATE_UNREGISTERING,
        STATE_UNREGISTERED,
        STATE_FAILED
    };

    // Longer grants are treated as this so the refresh timer stays in range
    static const unsigned MAX_EXPIRES_SEC = 24 * 60 * 60;

    static const char* stateName(int state);

    Registration();

    /**
     * One-time initialization. Connects the registration to the outside world.
     */
    void init(kc1fsz::Log* log, kc1fsz::Clock* clock, SignalingHost* host) {
        _log = log;
        _clock = clock;
        _host = host;
    }

    void reset();

    void setup(const std::string& username, const std::string& password,
        const std::string& domain, const std::string& displayName,
        unsigned expiresSec);

    bool isActive() const { return _active; }

    bool matches(const std::string& username, const std::string& domain) const;

    /**
     * Sends the initial REGISTER. Allowed from None, Unregistered
     * and Failed.
     */
    int registerAccount();

    /**
     * Sends a REGISTER with Expires: 0. Allowed from Registered and
     * Refreshing.
     */
    int unregister();

    /**
     * Transaction callback for every REGISTER sent.
     */
    int onResponse(int handle, const SipMessage& response, int error);

    /**
     * Checks the refresh timer.
     */
    void tick();

    /**
     * The transport went away. Anything that was in progress or
     * established moves to Failed.
     */
    void transportDown();

    State getState() const { return _state; }
    const std::string& getUsername() const { return _username; }
    const std::string& getPassword() const { return _password; }
    const std::string& getDomain() const { return _domain; }
    const std::string& getDisplayName() const { return _displayName; }

    /**
     * @returns true if the account should be registered whenever the
     * transport is available (i.e. hasn't been explicitly unregistered).
     */
    bool isWanted() const { return _wanted; }
    void setWanted(bool wanted) { _wanted = wanted; }

    /**
     * @returns The reason for the last failure, human readable.
     */
    const std::string& getReason() const { return _reason; }
    int getLastError() const { return _lastError; }
    int getLastStatusCode() const { return _lastStatusCode; }

    unsigned getExpiresSec() const { return _grantedExpiresSec; }
    unsigned getRefreshIntervalSec() const { return _refreshIntervalSec; }
    uint32_t getRefreshAtMs() const { return _refreshAtMs; }
    const DigestAuth& getAuth() const { return _auth; }

private:

    int _sendRegister(unsigned expiresSec);
    int _send(const SipMessage& req);
    void _retryWithCredentials(const SipMessage& challenge);
    unsigned _grantedExpires(const SipMessage& response) const;
    unsigned _parseExpires(const SipMessage& response) const;
    void _setState(State s);
    void _fail(int error, int statusCode, const std::string& reason);
    int _illegal(const char* event);

    kc1fsz::Log* _log = 0;
    kc1fsz::Clock* _clock = 0;
    SignalingHost* _host = 0;

    bool _active = false;
    bool _wanted = false;
    State _state = State::STATE_NONE;

    std::string _username;
    std::string _password;
    std::string _domain;
    std::string _displayName;
    unsigned _requestedExpiresSec = 0;

    // These stay the same across all of the REGISTERs for the account
    std::string _callId;
    std::string _localTag;
    unsigned _cseq = 0;

    // The REGISTER currently in flight (if any)
    int _pendingHandle = 0;
    SipMessage _pendingRequest;
    bool _authRetried = false;
    DigestAuth _auth;

    unsigned _grantedExpiresSec = 0;
    unsigned _refreshIntervalSec = 0;
    bool _refreshArmed = false;
    uint32_t _refreshAtMs = 0;

    std::string _reason;
    int _lastError = 0;
    int _lastStatusCode = 0;
};

}

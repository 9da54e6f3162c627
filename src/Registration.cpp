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
#include <cstdlib>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "SipError.h"
#include "SipUtil.h"
#include "Config.h"
#include "SignalingHost.h"
#include "Registration.h"

using namespace std;

namespace sipwire {

const char* Registration::stateName(int state) {
    switch (state) {
        case STATE_NONE: return "None";
        case STATE_REGISTERING: return "Registering";
        case STATE_REGISTERED: return "Registered";
        case STATE_REFRESHING: return "Refreshing";
        case STATE_UNREGISTERING: return "Unregistering";
        case STATE_UNREGISTERED: return "Unregistered";
        case STATE_FAILED: return "Failed";
        default: return "Unknown";
    }
}

Registration::Registration() {
}

void Registration::reset() {
    _active = false;
    _wanted = false;
    _state = State::STATE_NONE;
    _username.clear();
    _password.clear();
    _domain.clear();
    _displayName.clear();
    _requestedExpiresSec = 0;
    _callId.clear();
    _localTag.clear();
    _cseq = 0;
    _pendingHandle = 0;
    _pendingRequest.clear();
    _authRetried = false;
    _auth.reset();
    _grantedExpiresSec = 0;
    _refreshIntervalSec = 0;
    _refreshArmed = false;
    _refreshAtMs = 0;
    _reason.clear();
    _lastError = 0;
    _lastStatusCode = 0;
}

void Registration::setup(const std::string& username, const std::string& password,
    const std::string& domain, const std::string& displayName, unsigned expiresSec) {
    reset();
    _active = true;
    _username = username;
    _password = password;
    _domain = domain;
    _displayName = displayName;
    _requestedExpiresSec = expiresSec;
    _callId = makeCallId();
    _localTag = makeTag();
    _auth.setCredentials(username, password);
}

bool Registration::matches(const std::string& username, const std::string& domain) const {
    return _active && _username == username && iequals(_domain, domain);
}

int Registration::registerAccount() {
    if (_state != STATE_NONE && _state != STATE_UNREGISTERED && _state != STATE_FAILED)
        return _illegal("register");
    _wanted = true;
    _authRetried = false;
    _reason.clear();
    _lastError = 0;
    _lastStatusCode = 0;
    _setState(STATE_REGISTERING);
    int rc = _sendRegister(_requestedExpiresSec);
    if (rc < 0) {
        _fail(rc, 0, "Unable to send REGISTER");
        return rc;
    }
    return SIP_OK;
}

int Registration::unregister() {
    if (_state != STATE_REGISTERED && _state != STATE_REFRESHING)
        return _illegal("unregister");
    // Anything still in flight for the refresh is no longer interesting
    if (_pendingHandle)
        _host->cancelTransaction(_pendingHandle);
    _wanted = false;
    _refreshArmed = false;
    _authRetried = false;
    _setState(STATE_UNREGISTERING);
    int rc = _sendRegister(0);
    if (rc < 0) {
        _fail(rc, 0, "Unable to send REGISTER");
        return rc;
    }
    return SIP_OK;
}

void Registration::tick() {
    if (_state == STATE_REGISTERED && _refreshArmed && _clock->isPast(_refreshAtMs)) {
        _log->info("Refreshing registration %s@%s", _username.c_str(), _domain.c_str());
        _refreshArmed = false;
        _authRetried = false;
        _setState(STATE_REFRESHING);
        int rc = _sendRegister(_requestedExpiresSec);
        if (rc < 0)
            _fail(rc, 0, "Unable to send REGISTER");
    }
}

void Registration::transportDown() {
    if (_pendingHandle) {
        _host->cancelTransaction(_pendingHandle);
        _pendingHandle = 0;
    }
    _refreshArmed = false;
    if (_state == STATE_REGISTERING || _state == STATE_REGISTERED ||
        _state == STATE_REFRESHING || _state == STATE_UNREGISTERING)
        _fail(SIP_ERR_TRANSPORT_DOWN, 0, "Transport down");
}

int Registration::onResponse(int handle, const SipMessage& response, int error) {

    if (handle == 0 || handle != _pendingHandle) {
        _log->info("Stale REGISTER response %d for %s@%s (state %s), ignored",
            response.getStatusCode(), _username.c_str(), _domain.c_str(),
            stateName(_state));
        return SIP_ERR_ILLEGAL_TRANSITION;
    }

    if (response.isProvisional())
        return SIP_OK;

    _pendingHandle = 0;
    const int code = response.getStatusCode();

    if (_state != STATE_REGISTERING && _state != STATE_REFRESHING &&
        _state != STATE_UNREGISTERING)
        return _illegal("response");

    if (error == SIP_ERR_TRANSACTION_TIMEOUT) {
        _fail(SIP_ERR_TRANSACTION_TIMEOUT, code, "Registration timed out");
        return SIP_OK;
    }

    if (response.isSuccess()) {
        if (_state == STATE_UNREGISTERING) {
            _grantedExpiresSec = 0;
            _refreshIntervalSec = 0;
            _setState(STATE_UNREGISTERED);
        } else if (!_wanted) {
            // Dropped while the REGISTER was in flight, take the binding away again
            _log->info("Account %s@%s no longer wanted, unregistering",
                _username.c_str(), _domain.c_str());
            _grantedExpiresSec = 0;
            _refreshIntervalSec = 0;
            _authRetried = false;
            _setState(STATE_UNREGISTERING);
            int rc = _sendRegister(0);
            if (rc < 0)
                _fail(rc, 0, "Unable to send REGISTER");
        } else {
            _grantedExpiresSec = _grantedExpires(response);
            _refreshIntervalSec = (_grantedExpiresSec * 9) / 10;
            _refreshAtMs = _clock->time() + _refreshIntervalSec * 1000;
            _refreshArmed = true;
            _log->info("Registered %s@%s for %u seconds, refresh in %u",
                _username.c_str(), _domain.c_str(), _grantedExpiresSec,
                _refreshIntervalSec);
            _setState(STATE_REGISTERED);
        }
        return SIP_OK;
    }

    if (code == 401 || code == 407) {
        if (_authRetried) {
            _fail(SIP_ERR_AUTHENTICATION_FAILED, code, "Authentication failed");
        } else {
            _retryWithCredentials(response);
        }
        return SIP_OK;
    }

    _fail(SIP_OK, code, to_string(code) + " " + response.getReason());
    return SIP_OK;
}

void Registration::_retryWithCredentials(const SipMessage& challenge) {

    _authRetried = true;

    // Same request, but a new transaction
    SipMessage retry = _pendingRequest;
    retry.setHeader("Via", _host->makeVia());
    retry.setHeader("CSeq", to_string(++_cseq) + " REGISTER");

    int rc = _auth.authorize(challenge, retry);
    if (rc != SIP_OK) {
        _fail(SIP_ERR_UNSUPPORTED_CHALLENGE, challenge.getStatusCode(),
            "Unsupported authentication challenge");
        return;
    }

    _log->info("Retrying REGISTER for %s@%s with credentials (nc=%u)",
        _username.c_str(), _domain.c_str(), _auth.getNonceCount());

    rc = _send(retry);
    if (rc < 0)
        _fail(rc, 0, "Unable to send REGISTER");
}

int Registration::_sendRegister(unsigned expiresSec) {

    const string aor = "sip:" + _username + "@" + _domain;

    SipMessage req = SipMessage::makeRequest("REGISTER", "sip:" + _domain);
    req.addHeader("Via", _host->makeVia());
    req.addHeader("Max-Forwards", "70");
    if (_displayName.empty())
        req.addHeader("From", "<" + aor + ">;tag=" + _localTag);
    else
        req.addHeader("From", "\"" + _displayName + "\" <" + aor + ">;tag=" + _localTag);
    req.addHeader("To", "<" + aor + ">");
    req.addHeader("Call-ID", _callId);
    req.addHeader("CSeq", to_string(++_cseq) + " REGISTER");
    req.addHeader("Contact", _host->makeContact(_username, _domain));
    req.addHeader("Expires", to_string(expiresSec));
    req.addHeader("Allow", ALLOWED_METHODS);

    // Once we've seen a challenge the credentials go out right away,
    // with the nonce-count moving forward.
    if (_auth.hasChallenge())
        _auth.reauthorize(req);

    return _send(req);
}

int Registration::_send(const SipMessage& req) {
    _pendingRequest = req;
    int handle = _host->sendRequest(req,
        [this](int h, const SipMessage& resp, int error) {
            onResponse(h, resp, error);
        },
        _host->getConfig().registrationTimeoutMs);
    if (handle < 0) {
        _pendingHandle = 0;
        return handle;
    }
    _pendingHandle = handle;
    return SIP_OK;
}

unsigned Registration::_grantedExpires(const SipMessage& response) const {
    unsigned e = _parseExpires(response);
    if (e > MAX_EXPIRES_SEC) {
        _log->info("Registrar granted %u seconds, using %u", e, MAX_EXPIRES_SEC);
        e = MAX_EXPIRES_SEC;
    }
    return e;
}

unsigned Registration::_parseExpires(const SipMessage& response) const {

    // The registrar may return all of the bindings for the AOR, so look
    // for the one that belongs to us.
    const string ourUri = extractUri(_host->makeContact(_username, _domain));
    const vector<string> contacts = response.getHeaderValues("Contact");
    for (const string& contact : contacts) {
        string expires;
        if ((contacts.size() == 1 || iequals(extractUri(contact), ourUri)) &&
            getHeaderParam(contact, "expires", expires) && !expires.empty()) {
            unsigned e = strtoul(expires.c_str(), 0, 10);
            if (e > 0)
                return e;
        }
    }

    string expires = response.getHeader("Expires");
    if (!expires.empty()) {
        unsigned e = strtoul(expires.c_str(), 0, 10);
        if (e > 0)
            return e;
    }

    return _requestedExpiresSec;
}

void Registration::_setState(State s) {
    if (s == _state)
        return;
    State old = _state;
    _state = s;
    _log->info("Registration %s@%s %s -> %s", _username.c_str(), _domain.c_str(),
        stateName(old), stateName(s));
    _host->registrationStateChanged(*this, old);
}

void Registration::_fail(int error, int statusCode, const std::string& reason) {
    _pendingHandle = 0;
    _refreshArmed = false;
    _lastError = error;
    _lastStatusCode = statusCode;
    _reason = reason;
    _log->error("Registration %s@%s failed: %s", _username.c_str(), _domain.c_str(),
        reason.c_str());
    _setState(STATE_FAILED);
}

int Registration::_illegal(const char* event) {
    _log->info("Registration %s@%s: %s not allowed in state %s", _username.c_str(),
        _domain.c_str(), event, stateName(_state));
    return SIP_ERR_ILLEGAL_TRANSITION;
}

}

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
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "SipError.h"
#include "SipUtil.h"
#include "Config.h"
#include "SignalingHost.h"
#include "CallDialog.h"

using namespace std;

namespace sipwire {

const char* CallDialog::stateName(int state) {
    switch (state) {
        case STATE_IDLE: return "Idle";
        case STATE_CALLING: return "Calling";
        case STATE_RINGING: return "Ringing";
        case STATE_CONNECTED: return "Connected";
        case STATE_ON_HOLD: return "OnHold";
        case STATE_TERMINATING: return "Terminating";
        case STATE_ENDED: return "Ended";
        case STATE_FAILED: return "Failed";
        default: return "Unknown";
    }
}

const char* CallDialog::endReasonName(int reason) {
    switch (reason) {
        case END_NONE: return "None";
        case END_NORMAL_CLEARING: return "NormalClearing";
        case END_USER_BUSY: return "UserBusy";
        case END_NO_ANSWER: return "NoAnswer";
        case END_CALL_REJECTED: return "CallRejected";
        case END_NETWORK_ERROR: return "NetworkError";
        case END_AUTHENTICATION_FAILED: return "AuthenticationFailed";
        case END_TIMEOUT: return "Timeout";
        default: return "Unknown";
    }
}

const char* CallDialog::directionName(int direction) {
    return direction == DIRECTION_INBOUND ? "Inbound" : "Outbound";
}

CallDialog::EndReason CallDialog::endReasonFor(int code) {
    if (code >= 200 && code < 300)
        return END_NORMAL_CLEARING;
    switch (code) {
        case 486:
        case 600:
            return END_USER_BUSY;
        case 408:
        case 480:
            return END_NO_ANSWER;
        case 403:
        case 603:
            return END_CALL_REJECTED;
        case 401:
        case 407:
            return END_AUTHENTICATION_FAILED;
        case 487:
            return END_NORMAL_CLEARING;
        default:
            return END_UNKNOWN;
    }
}

bool CallDialog::isValidDtmf(char d) {
    return (d >= '0' && d <= '9') || d == '*' || d == '#' || (d >= 'A' && d <= 'D');
}

CallDialog::CallDialog() {
}

void CallDialog::reset() {
    _active = false;
    _state = State::STATE_IDLE;
    _direction = Direction::DIRECTION_OUTBOUND;
    _callId.clear();
    _localTag.clear();
    _remoteTag.clear();
    _localUser.clear();
    _localDomain.clear();
    _localDisplayName.clear();
    _password.clear();
    _localParty.clear();
    _remoteParty.clear();
    _remoteUri.clear();
    _remoteTarget.clear();
    _remoteNumber.clear();
    _remoteDisplayName.clear();
    _routeSet.clear();
    _localCSeq = 0;
    _remoteCSeq = 0;
    _auth.reset();
    _localSdp.clear();
    _remoteSdp.clear();
    _invite.clear();
    _inviteHandle = 0;
    _inviteAuthRetried = false;
    _cancelHandle = 0;
    _bye.clear();
    _byeHandle = 0;
    _byeAuthRetried = false;
    _reinvite.clear();
    _reinviteHandle = 0;
    _reinviteAuthRetried = false;
    _reinviteHold = false;
    _reinviteSdp.clear();
    _infoHandle = 0;
    _infoDigit = 0;
    _dtmfQueue = std::queue<DtmfDigit>();
    _ack.clear();
    _haveAck = false;
    _noAnswerArmed = false;
    _noAnswerAtMs = 0;
    _awaitingAck = false;
    _ackDeadlineMs = 0;
    _terminatingDeadlineMs = 0;
    _transportDown = false;
    _transportDownAtMs = 0;
    _mediaAlive = false;
    _everConnected = false;
    _connectedAtMs = 0;
    _endedAtMs = 0;
    _endReason = EndReason::END_NONE;
    _reason.clear();
    _lastStatusCode = 0;
}

bool CallDialog::canReap() const {
    return _active && isTerminal() && _clock->isPast(_endedAtMs + LINGER_MS);
}

uint32_t CallDialog::getDurationMs() const {
    if (!_everConnected)
        return 0;
    uint32_t end = isTerminal() ? _endedAtMs : _clock->time();
    return end - _connectedAtMs;
}

// ----- Commands -------------------------------------------------------------

int CallDialog::makeCall(const std::string& user, const std::string& password,
    const std::string& domain, const std::string& displayName,
    const std::string& targetUri, const std::string& sdp) {

    if (_state != STATE_IDLE)
        return _illegal("makeCall");
    if (targetUri.empty())
        return SIP_ERR_INVALID_ARGUMENT;

    _active = true;
    _direction = DIRECTION_OUTBOUND;
    _localUser = user;
    _localDomain = domain;
    _localDisplayName = displayName;
    _password = password;
    _auth.setCredentials(user, password);
    _callId = makeCallId();
    _localTag = makeTag();
    _remoteUri = targetUri;
    _remoteTarget = targetUri;
    _remoteNumber = extractUser(targetUri);
    _localSdp = sdp;

    const string aor = "sip:" + user + "@" + domain;
    if (displayName.empty())
        _localParty = "<" + aor + ">;tag=" + _localTag;
    else
        _localParty = "\"" + displayName + "\" <" + aor + ">;tag=" + _localTag;

    _localCSeq = 1;
    SipMessage invite = SipMessage::makeRequest("INVITE", targetUri);
    invite.addHeader("Via", _host->makeVia());
    invite.addHeader("Max-Forwards", "70");
    invite.addHeader("From", _localParty);
    invite.addHeader("To", "<" + targetUri + ">");
    invite.addHeader("Call-ID", _callId);
    invite.addHeader("CSeq", to_string(_localCSeq) + " INVITE");
    invite.addHeader("Contact", _host->makeContact(user, domain));
    invite.addHeader("Allow", ALLOWED_METHODS);
    if (!sdp.empty())
        invite.setBody("application/sdp", sdp);
    _invite = invite;

    const unsigned callTimeoutMs = _host->getConfig().callTimeoutMs;
    if (callTimeoutMs) {
        _noAnswerArmed = true;
        _noAnswerAtMs = _clock->time() + callTimeoutMs;
    }

    _log->info("Calling %s from %s (Call-ID %s)", targetUri.c_str(), aor.c_str(),
        _callId.c_str());
    _setState(STATE_CALLING);

    int rc = _send(_invite, _inviteHandle);
    if (rc < 0) {
        _end(STATE_FAILED, END_NETWORK_ERROR, "Unable to send INVITE");
        return rc;
    }
    return SIP_OK;
}

int CallDialog::accept(const std::string& sdp) {
    if (_direction != DIRECTION_INBOUND || _state != STATE_RINGING)
        return _illegal("accept");
    _localSdp = sdp;
    _respond(_invite, 200, sdp.empty() ? string() : string("application/sdp"), sdp);
    _awaitingAck = true;
    _ackDeadlineMs = _clock->time() + ACK_TIMEOUT_MS;
    _everConnected = true;
    _connectedAtMs = _clock->time();
    _setState(STATE_CONNECTED);
    return SIP_OK;
}

int CallDialog::decline(bool busy) {
    if (_direction != DIRECTION_INBOUND || _state != STATE_RINGING)
        return _illegal("decline");
    const int code = busy ? 486 : 603;
    _respond(_invite, code);
    _end(STATE_ENDED, busy ? END_USER_BUSY : END_CALL_REJECTED, "Declined", code);
    return SIP_OK;
}

int CallDialog::hangup() {
    switch (_state) {
    case STATE_CALLING:
    case STATE_RINGING:
        if (_direction == DIRECTION_INBOUND)
            return decline(false);
        // No dialog exists yet so BYE isn't an option
        _noAnswerArmed = false;
        if (_endReason == END_NONE)
            _endReason = END_NORMAL_CLEARING;
        _sendCancel();
        _setState(STATE_TERMINATING);
        return SIP_OK;
    case STATE_CONNECTED:
    case STATE_ON_HOLD:
        _endReason = END_NORMAL_CLEARING;
        _sendBye();
        _setState(STATE_TERMINATING);
        return SIP_OK;
    default:
        return _illegal("hangup");
    }
}

int CallDialog::hold(const std::string& sdp) {
    if (_state != STATE_CONNECTED)
        return _illegal("hold");
    if (_reinviteHandle) {
        _log->info("Call %s: re-INVITE already pending", _callId.c_str());
        return SIP_ERR_ILLEGAL_TRANSITION;
    }
    return _sendReinvite(sdp, true);
}

int CallDialog::resume(const std::string& sdp) {
    if (_state != STATE_ON_HOLD)
        return _illegal("resume");
    if (_reinviteHandle) {
        _log->info("Call %s: re-INVITE already pending", _callId.c_str());
        return SIP_ERR_ILLEGAL_TRANSITION;
    }
    return _sendReinvite(sdp, false);
}

int CallDialog::sendDtmf(char digit, unsigned durationMs) {
    if (_state != STATE_CONNECTED && _state != STATE_ON_HOLD)
        return _illegal("sendDtmf");
    if (!isValidDtmf(digit))
        return SIP_ERR_INVALID_ARGUMENT;
    DtmfDigit d;
    d.digit = digit;
    d.durationMs = durationMs;
    if (d.durationMs == 0)
        d.durationMs = DEFAULT_DTMF_DURATION_MS;
    _dtmfQueue.push(d);
    if (_infoHandle == 0)
        _sendNextDtmf();
    return SIP_OK;
}

// ----- Inbound requests -----------------------------------------------------

int CallDialog::onInvite(const SipMessage& invite, const std::string& localUser,
    const std::string& localDomain) {

    if (_state != STATE_IDLE)
        return _illegal("INVITE");

    _active = true;
    _direction = DIRECTION_INBOUND;
    _invite = invite;
    _callId = invite.getCallId();
    _localTag = makeTag();
    _remoteTag = invite.getFromTag();
    _localUser = localUser;
    _localDomain = localDomain;
    _remoteParty = invite.getHeader("From");
    _localParty = invite.getHeader("To") + ";tag=" + _localTag;
    _remoteUri = extractUri(_remoteParty);
    _remoteNumber = extractUser(_remoteUri);
    _remoteDisplayName = extractDisplayName(_remoteParty);
    string contact = invite.getHeader("Contact");
    _remoteTarget = contact.empty() ? _remoteUri : extractUri(contact);
    // The UAS keeps the Record-Route order
    _routeSet = invite.getHeaderValues("Record-Route");
    _remoteCSeq = invite.getCSeqNumber();
    _remoteSdp = invite.getBody();

    _log->info("Incoming call from %s (%s) to %s, Call-ID %s", _remoteNumber.c_str(),
        _remoteDisplayName.c_str(), localUser.c_str(), _callId.c_str());

    _host->sendResponse(SipMessage::responseTo(invite, 100));
    _respond(invite, 180);
    _setState(STATE_RINGING);
    return SIP_OK;
}

void CallDialog::onRequest(const SipMessage& req) {

    const string& method = req.getMethod();

    if (method == "ACK") {
        if (_awaitingAck && req.getCSeqNumber() == _remoteCSeq) {
            _awaitingAck = false;
            if (!req.getBody().empty())
                _remoteSdp = req.getBody();
        }
        return;
    }

    if (method == "CANCEL") {
        if (isTerminal() || _state == STATE_IDLE) {
            _respond(req, 481);
        } else if (_direction == DIRECTION_INBOUND && _state == STATE_RINGING) {
            _respond(req, 200);
            _respond(_invite, 487);
            _end(STATE_ENDED, END_NORMAL_CLEARING, "Cancelled by caller", 487);
        } else {
            // Too late, the INVITE is already answered
            _respond(req, 200);
        }
        return;
    }

    if (method == "INVITE" && req.getToTag().empty()) {
        _log->info("Call %s: second INVITE without a To tag", _callId.c_str());
        _respond(req, 482);
        return;
    }

    if (_state == STATE_IDLE || isTerminal() ||
        (!_remoteTag.empty() && req.getFromTag() != _remoteTag)) {
        _respond(req, 481);
        return;
    }

    const unsigned cseq = req.getCSeqNumber();
    if (_remoteCSeq != 0 && cseq <= _remoteCSeq) {
        _log->info("Call %s: out of order %s CSeq %u (last %u)", _callId.c_str(),
            method.c_str(), cseq, _remoteCSeq);
        _respond(req, 500);
        return;
    }
    _remoteCSeq = cseq;

    if (method == "BYE") {
        _respond(req, 200);
        if (_direction == DIRECTION_INBOUND && _state == STATE_RINGING)
            _respond(_invite, 487);
        if (_state != STATE_TERMINATING)
            _setState(STATE_TERMINATING);
        _end(STATE_ENDED, END_NORMAL_CLEARING, "Remote hangup");
    }
    else if (method == "INVITE") {
        if (_state == STATE_TERMINATING) {
            _respond(req, 481);
            return;
        }
        if (_reinviteHandle || (_state != STATE_CONNECTED && _state != STATE_ON_HOLD)) {
            _respond(req, 491);
            return;
        }
        string contact = req.getHeader("Contact");
        if (!contact.empty())
            _remoteTarget = extractUri(contact);
        if (!req.getBody().empty())
            _remoteSdp = req.getBody();
        _respond(req, 200, _localSdp.empty() ? string() : string("application/sdp"),
            _localSdp);
        _awaitingAck = true;
        _ackDeadlineMs = _clock->time() + ACK_TIMEOUT_MS;
    }
    else if (method == "INFO") {
        _onInfo(req);
    }
    else if (method == "OPTIONS") {
        _respond(req, 200);
    }
    else {
        _respond(req, 501);
    }
}

void CallDialog::_onInfo(const SipMessage& req) {

    string type = req.getContentType();
    char digit = 0;
    unsigned durationMs = DEFAULT_DTMF_DURATION_MS;

    if (iequals(type, "application/dtmf-relay")) {
        istringstream in(req.getBody());
        string line;
        while (getline(in, line)) {
            size_t eq = line.find('=');
            if (eq == string::npos)
                continue;
            string name = trim(line.substr(0, eq));
            string value = trim(line.substr(eq + 1));
            if (iequals(name, "Signal") && !value.empty())
                digit = toupper((unsigned char)value[0]);
            else if (iequals(name, "Duration"))
                durationMs = strtoul(value.c_str(), 0, 10);
        }
    }
    else if (iequals(type, "application/dtmf")) {
        string value = trim(req.getBody());
        if (!value.empty())
            digit = toupper((unsigned char)value[0]);
    }

    _respond(req, 200);

    if (isValidDtmf(digit))
        _host->dtmfReceived(*this, digit, durationMs);
    else if (digit)
        _log->info("Call %s: ignoring DTMF %c", _callId.c_str(), digit);
}

void CallDialog::_respond(const SipMessage& req, int code, const std::string& contentType,
    const std::string& body) {
    SipMessage resp = SipMessage::responseTo(req, code, 0, _localTag);
    if (req.isMethod("INVITE") && code > 100 && code < 300)
        resp.addHeader("Contact", _host->makeContact(_localUser, _localDomain));
    if (code >= 200 && code < 300 && (req.isMethod("INVITE") || req.isMethod("OPTIONS")))
        resp.addHeader("Allow", ALLOWED_METHODS);
    if (!contentType.empty())
        resp.setBody(contentType, body);
    _host->sendResponse(resp);
}

// ----- Responses ------------------------------------------------------------

void CallDialog::onResponse(int handle, const SipMessage& response, int error) {
    if (handle == 0) {
        return;
    } else if (handle == _inviteHandle) {
        _inviteResponse(response, error);
    } else if (handle == _reinviteHandle) {
        _reinviteResponse(response, error);
    } else if (handle == _byeHandle) {
        _byeResponse(response, error);
    } else if (handle == _infoHandle) {
        _infoResponse(response, error);
    } else if (handle == _cancelHandle) {
        if (!response.isProvisional()) {
            _cancelHandle = 0;
            _log->info("Call %s: CANCEL got %d", _callId.c_str(), response.getStatusCode());
        }
    } else {
        _log->info("Call %s: stale %d for %s, ignored", _callId.c_str(),
            response.getStatusCode(), response.getCSeqMethod().c_str());
    }
}

void CallDialog::_inviteResponse(const SipMessage& response, int error) {

    const int code = response.getStatusCode();

    if (response.isProvisional()) {
        if (_state == STATE_CALLING && (code == 180 || code == 183)) {
            if (!response.getToTag().empty())
                _remoteTag = response.getToTag();
            _setState(STATE_RINGING);
        }
        return;
    }

    _inviteHandle = 0;
    _noAnswerArmed = false;

    if (error == SIP_ERR_TRANSACTION_TIMEOUT) {
        if (_state == STATE_TERMINATING)
            _end(STATE_ENDED, _endReason, "Cancelled");
        else
            _end(STATE_FAILED, END_TIMEOUT, "No response to INVITE", code);
        return;
    }

    if (response.isSuccess()) {
        _learnDialog(response);
        _sendAck(_invite.getCSeqNumber());
        if (_state == STATE_TERMINATING || isTerminal()) {
            // The answer crossed with our CANCEL (or we gave up on the call
            // some other way). The call is up now so it needs a BYE.
            _log->info("Call %s: answered after CANCEL, sending BYE", _callId.c_str());
            _sendBye();
            return;
        }
        _lastStatusCode = code;
        _everConnected = true;
        _connectedAtMs = _clock->time();
        _setState(STATE_CONNECTED);
        return;
    }

    if ((code == 401 || code == 407) && _state != STATE_TERMINATING && !isTerminal()) {
        if (_inviteAuthRetried) {
            _end(STATE_FAILED, END_AUTHENTICATION_FAILED, "Authentication failed", code);
        } else if (!_retryWithCredentials(response, _invite, _inviteHandle,
            _inviteAuthRetried)) {
            _end(STATE_FAILED, END_AUTHENTICATION_FAILED,
                "Unsupported authentication challenge", code);
        }
        return;
    }

    if (_state == STATE_TERMINATING) {
        _end(STATE_ENDED, _endReason, "Cancelled", code);
        return;
    }

    _end(STATE_FAILED, endReasonFor(code), to_string(code) + " " + response.getReason(),
        code);
}

void CallDialog::_reinviteResponse(const SipMessage& response, int error) {

    if (response.isProvisional())
        return;

    _reinviteHandle = 0;
    const int code = response.getStatusCode();

    // RFC 3261 section 14.1: the dialog is gone
    if (error == SIP_ERR_TRANSACTION_TIMEOUT || code == 408 || code == 481) {
        _log->error("Call %s: re-INVITE failed with %d, ending call", _callId.c_str(), code);
        if (_state == STATE_CONNECTED || _state == STATE_ON_HOLD) {
            _endReason = END_NETWORK_ERROR;
            _lastStatusCode = code;
            _sendBye();
            _setState(STATE_TERMINATING);
        }
        return;
    }

    if (response.isSuccess()) {
        _sendAck(_reinvite.getCSeqNumber());
        string contact = response.getHeader("Contact");
        if (!contact.empty())
            _remoteTarget = extractUri(contact);
        if (!response.getBody().empty())
            _remoteSdp = response.getBody();
        if (_state == STATE_CONNECTED || _state == STATE_ON_HOLD) {
            _localSdp = _reinviteSdp;
            _setState(_reinviteHold ? STATE_ON_HOLD : STATE_CONNECTED);
        }
        return;
    }

    if ((code == 401 || code == 407) && !_reinviteAuthRetried &&
        (_state == STATE_CONNECTED || _state == STATE_ON_HOLD)) {
        if (_retryWithCredentials(response, _reinvite, _reinviteHandle, _reinviteAuthRetried))
            return;
    }

    // Anything else leaves the call the way it was
    _lastStatusCode = code;
    _log->error("Call %s: %s rejected with %d", _callId.c_str(),
        _reinviteHold ? "hold" : "resume", code);
}

void CallDialog::_byeResponse(const SipMessage& response, int error) {

    if (response.isProvisional())
        return;

    _byeHandle = 0;
    const int code = response.getStatusCode();

    if (error == SIP_OK && (code == 401 || code == 407) && !_byeAuthRetried &&
        !isTerminal()) {
        if (_retryWithCredentials(response, _bye, _byeHandle, _byeAuthRetried))
            return;
    }

    _end(STATE_ENDED, _endReason, code >= 300 ? "BYE got " + to_string(code) : "Call ended",
        code >= 300 ? code : 0);
}

void CallDialog::_infoResponse(const SipMessage& response, int error) {

    if (response.isProvisional())
        return;

    _infoHandle = 0;
    const char digit = _infoDigit;
    _infoDigit = 0;

    const bool success = error == SIP_OK && response.isSuccess();
    if (!success)
        _log->info("Call %s: DTMF %c got %d", _callId.c_str(), digit,
            response.getStatusCode());
    _host->dtmfResult(*this, digit, success);

    if (!isTerminal())
        _sendNextDtmf();
}

void CallDialog::onStray2xx(const SipMessage& response) {
    if (_haveAck && response.isSuccess() && response.isMethod("INVITE") &&
        response.getCSeqNumber() == _ack.getCSeqNumber()) {
        _log->info("Call %s: 2xx retransmission, ACK again", _callId.c_str());
        _host->sendStateless(_ack);
    }
}

bool CallDialog::_retryWithCredentials(const SipMessage& challenge, SipMessage& request,
    int& handle, bool& retried) {

    retried = true;

    request.setHeader("Via", _host->makeVia());
    request.setHeader("CSeq", to_string(++_localCSeq) + " " + request.getMethod());
    // Whatever was on the previous attempt is replaced
    request.removeHeader("Authorization");
    request.removeHeader("Proxy-Authorization");

    if (_auth.authorize(challenge, request) != SIP_OK)
        return false;

    _log->info("Call %s: retrying %s with credentials", _callId.c_str(),
        request.getMethod().c_str());
    if (_send(request, handle) < 0)
        return false;
    return true;
}

void CallDialog::_learnDialog(const SipMessage& response) {
    string toTag = response.getToTag();
    if (!toTag.empty())
        _remoteTag = toTag;
    _remoteParty = response.getHeader("To");
    string contact = response.getHeader("Contact");
    if (!contact.empty())
        _remoteTarget = extractUri(contact);
    // The UAC uses the Record-Route in reverse order
    vector<string> rr = response.getHeaderValues("Record-Route");
    _routeSet.assign(rr.rbegin(), rr.rend());
    if (!response.getBody().empty())
        _remoteSdp = response.getBody();
}

// ----- Sending --------------------------------------------------------------

int CallDialog::_send(SipMessage& req, int& handle) {
    int h = _host->sendRequest(req,
        [this](int h, const SipMessage& resp, int error) {
            onResponse(h, resp, error);
        });
    if (h < 0) {
        _log->error("Call %s: unable to send %s (%s)", _callId.c_str(),
            req.getMethod().c_str(), errorName(h));
        handle = 0;
        return h;
    }
    handle = h;
    return SIP_OK;
}

SipMessage CallDialog::_makeInDialogRequest(const char* method) {
    SipMessage req = SipMessage::makeRequest(method,
        _remoteTarget.empty() ? _remoteUri : _remoteTarget);
    req.addHeader("Via", _host->makeVia());
    for (const string& route : _routeSet)
        req.addHeader("Route", route);
    req.addHeader("Max-Forwards", "70");
    req.addHeader("From", _localParty);
    req.addHeader("To", _remoteParty);
    req.addHeader("Call-ID", _callId);
    return req;
}

void CallDialog::_sendAck(unsigned cseq) {
    SipMessage ack = _makeInDialogRequest("ACK");
    ack.addHeader("CSeq", to_string(cseq) + " ACK");
    _ack = ack;
    _haveAck = true;
    _host->sendStateless(ack);
}

int CallDialog::_sendCancel() {
    // RFC 3261 section 9.1: same Request-URI, Call-ID, To, From, Route and
    // top Via (branch included) as the INVITE being cancelled.
    SipMessage cancel = SipMessage::makeRequest("CANCEL", _invite.getRequestUri());
    cancel.addHeader("Via", _invite.getTopVia());
    for (const string& route : _invite.getHeaderValues("Route"))
        cancel.addHeader("Route", route);
    cancel.addHeader("Max-Forwards", "70");
    cancel.addHeader("From", _invite.getHeader("From"));
    cancel.addHeader("To", _invite.getHeader("To"));
    cancel.addHeader("Call-ID", _callId);
    cancel.addHeader("CSeq", to_string(_invite.getCSeqNumber()) + " CANCEL");
    if (_inviteHandle)
        _host->cancelTransaction(_inviteHandle);
    return _send(cancel, _cancelHandle);
}

int CallDialog::_sendBye() {
    _bye = _makeInDialogRequest("BYE");
    _bye.addHeader("CSeq", to_string(++_localCSeq) + " BYE");
    _byeAuthRetried = false;
    return _send(_bye, _byeHandle);
}

int CallDialog::_sendReinvite(const std::string& sdp, bool hold) {
    _reinvite = _makeInDialogRequest("INVITE");
    _reinvite.addHeader("CSeq", to_string(++_localCSeq) + " INVITE");
    _reinvite.addHeader("Contact", _host->makeContact(_localUser, _localDomain));
    _reinvite.addHeader("Allow", ALLOWED_METHODS);
    if (!sdp.empty())
        _reinvite.setBody("application/sdp", sdp);
    _reinviteHold = hold;
    _reinviteSdp = sdp;
    _reinviteAuthRetried = false;
    _log->info("Call %s: sending %s", _callId.c_str(), hold ? "hold" : "resume");
    return _send(_reinvite, _reinviteHandle);
}

void CallDialog::_sendNextDtmf() {
    while (!_dtmfQueue.empty() && _infoHandle == 0) {
        DtmfDigit d = _dtmfQueue.front();
        _dtmfQueue.pop();
        char body[64];
        snprintf(body, sizeof(body), "Signal=%c\r\nDuration=%u\r\n", d.digit, d.durationMs);
        SipMessage info = _makeInDialogRequest("INFO");
        info.addHeader("CSeq", to_string(++_localCSeq) + " INFO");
        info.setBody("application/dtmf-relay", body);
        _infoDigit = d.digit;
        if (_send(info, _infoHandle) < 0) {
            _infoDigit = 0;
            _host->dtmfResult(*this, d.digit, false);
        }
    }
}

void CallDialog::_failDtmfQueue() {
    if (_infoHandle) {
        _infoHandle = 0;
        _host->dtmfResult(*this, _infoDigit, false);
        _infoDigit = 0;
    }
    while (!_dtmfQueue.empty()) {
        char digit = _dtmfQueue.front().digit;
        _dtmfQueue.pop();
        _host->dtmfResult(*this, digit, false);
    }
}

// ----- Timers and transport -------------------------------------------------

void CallDialog::tick() {

    if (!_active || isTerminal())
        return;

    if (_noAnswerArmed && (_state == STATE_CALLING || _state == STATE_RINGING) &&
        _clock->isPast(_noAnswerAtMs)) {
        _noAnswerArmed = false;
        _log->info("Call %s: no answer, cancelling", _callId.c_str());
        _endReason = END_NO_ANSWER;
        _sendCancel();
        _setState(STATE_TERMINATING);
    }

    if (_awaitingAck && _clock->isPast(_ackDeadlineMs)) {
        _awaitingAck = false;
        _log->error("Call %s: no ACK received", _callId.c_str());
        if (_state == STATE_CONNECTED || _state == STATE_ON_HOLD) {
            _endReason = END_NETWORK_ERROR;
            _sendBye();
            _setState(STATE_TERMINATING);
        }
    }

    if (_state == STATE_TERMINATING && _clock->isPast(_terminatingDeadlineMs)) {
        _log->info("Call %s: gave up waiting for the far end", _callId.c_str());
        _end(STATE_ENDED, _endReason, "Terminated without answer");
        return;
    }

    if (_transportDown && _state != STATE_IDLE &&
        _clock->isPast(_transportDownAtMs + _host->getConfig().callTransportGraceMs)) {
        if (!_mediaAlive)
            _end(STATE_FAILED, END_NETWORK_ERROR, "Transport down");
    }
}

void CallDialog::transportDown() {
    if (!_active || isTerminal() || _transportDown)
        return;
    _transportDown = true;
    _transportDownAtMs = _clock->time();
    _log->info("Call %s: transport down in state %s", _callId.c_str(), stateName(_state));
}

void CallDialog::transportUp() {
    _transportDown = false;
}

// ----- State ----------------------------------------------------------------

void CallDialog::_setState(State s) {
    if (s == _state)
        return;
    State old = _state;
    _state = s;
    if (s == STATE_TERMINATING)
        _terminatingDeadlineMs = _clock->time() + TERMINATING_TIMEOUT_MS;
    _log->info("Call %s %s -> %s", _callId.c_str(), stateName(old), stateName(s));
    _host->callStateChanged(*this, old);
}

void CallDialog::_end(State s, EndReason reason, const std::string& text, int statusCode) {
    if (isTerminal())
        return;
    _endReason = (reason == END_NONE) ? END_NORMAL_CLEARING : reason;
    _reason = text;
    if (statusCode)
        _lastStatusCode = statusCode;
    _noAnswerArmed = false;
    _awaitingAck = false;
    _endedAtMs = _clock->time();
    if (s == STATE_FAILED)
        _log->error("Call %s failed: %s", _callId.c_str(), text.c_str());
    _setState(s);
    _failDtmfQueue();
}

int CallDialog::_illegal(const char* event) {
    _log->info("Call %s: %s not allowed in state %s", _callId.c_str(), event,
        stateName(_state));
    return SIP_ERR_ILLEGAL_TRANSITION;
}

}

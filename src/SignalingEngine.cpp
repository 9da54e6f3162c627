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
#include <poll.h>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "SipError.h"
#include "SipUtil.h"
#include "SipMessage.h"
#include "EngineEvent.h"
#include "EngineEventConsumer.h"
#include "SignalingEngine.h"

using namespace std;

namespace sipwire {

SignalingEngine::SignalingEngine(kc1fsz::Log& log, kc1fsz::Clock& clock,
    WebSocketChannel& channel)
:   _log(log),
    _clock(clock),
    _transport(log, clock, channel),
    _tm(log, clock, [this](const SipMessage& msg) { _send(msg); }),
    _viaHost(randomHex(12) + ".invalid") {

    _config.setDefaults();
    _transport.configure(_config);
    _transport.setListener(this);

    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        _accounts[i].init(&_log, &_clock, this);
    for (unsigned i = 0; i < MAX_CALLS; i++)
        _calls[i].init(&_log, &_clock, this);
}

int SignalingEngine::configure(const Config& config) {

    _config = config;
    _transport.configure(_config);
    _tm.setRetransmit(_config.sipRetransmit);
    if (_config.transactionTimeoutMs)
        _tm.setTimeoutMs(_config.transactionTimeoutMs);
    _trace = _config.trace;

    string host, port, path;
    if (parseWebSocketUrl(_config.webSocketUrl, _secure, host, port, path) != 0) {
        _log.error("Invalid WebSocket URL '%s'", _config.webSocketUrl.c_str());
        return SIP_ERR_INVALID_ARGUMENT;
    }
    return SIP_OK;
}

int SignalingEngine::start() {
    for (const Config::Account& a : _config.accounts) {
        int rc = registerAccount(a.username, a.password, a.domain, a.displayName);
        if (rc < 0)
            _log.error("Unable to set up account %s (%s)", a.username.c_str(), errorName(rc));
    }
    return _transport.start();
}

void SignalingEngine::stop() {
    _transport.stop();
}

int SignalingEngine::forceReconnect() {
    _log.info("Reconnect requested");
    return _transport.reconnect();
}

// ----- Registration commands ------------------------------------------------

int SignalingEngine::registerAccount(const std::string& user, const std::string& password,
    const std::string& domain, const std::string& displayName) {

    string d = _resolveDomain(domain);
    if (user.empty() || d.empty())
        return SIP_ERR_INVALID_ARGUMENT;

    Registration* reg = _findRegistration(user, d);
    if (!reg) {
        reg = _allocRegistration();
        if (!reg) {
            _log.error("No room for account %s@%s", user.c_str(), d.c_str());
            return SIP_ERR_NO_CAPACITY;
        }
        reg->setup(user, password, d, displayName, _config.registrationExpiresSec);
    }

    if (!_transport.isConnected()) {
        _log.info("Account %s@%s will register when the transport is up",
            user.c_str(), d.c_str());
        reg->setWanted(true);
        return SIP_OK;
    }
    return reg->registerAccount();
}

int SignalingEngine::unregisterAccount(const std::string& user, const std::string& domain) {
    Registration* reg = _findRegistration(user, _resolveDomain(domain));
    if (!reg)
        return SIP_ERR_NOT_FOUND;
    int rc = reg->unregister();
    // Nothing to take down, just make sure it isn't registered again
    if (rc == SIP_ERR_ILLEGAL_TRANSITION) {
        if (reg->getState() == Registration::STATE_NONE ||
            reg->getState() == Registration::STATE_UNREGISTERED ||
            reg->getState() == Registration::STATE_FAILED)
            reg->setWanted(false);
    }
    return rc;
}

void SignalingEngine::applyAccounts(const std::vector<Config::Account>& accounts) {

    // Accounts that are no longer in the configuration
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++) {
        Registration& reg = _accounts[i];
        if (!reg.isActive())
            continue;
        bool keep = false;
        for (const Config::Account& a : accounts)
            if (reg.matches(a.username, _resolveDomain(a.domain)))
                keep = true;
        if (keep)
            continue;
        _log.info("Account %s@%s removed", reg.getUsername().c_str(),
            reg.getDomain().c_str());
        if (reg.getState() == Registration::STATE_REGISTERED ||
            reg.getState() == Registration::STATE_REFRESHING)
            reg.unregister();
        else if (reg.getState() != Registration::STATE_REGISTERING &&
                 reg.getState() != Registration::STATE_UNREGISTERING)
            reg.reset();
        else
            reg.setWanted(false);
    }

    // New accounts
    for (const Config::Account& a : accounts) {
        if (_findRegistration(a.username, _resolveDomain(a.domain)))
            continue;
        int rc = registerAccount(a.username, a.password, a.domain, a.displayName);
        if (rc < 0)
            _log.error("Unable to set up account %s (%s)", a.username.c_str(), errorName(rc));
    }
}

// ----- Call commands --------------------------------------------------------

int SignalingEngine::makeCall(const std::string& user, const std::string& domain,
    const std::string& target, const std::string& sdp, std::string& callId) {

    callId.clear();
    string d = _resolveDomain(domain);
    if (target.empty())
        return SIP_ERR_INVALID_ARGUMENT;
    Registration* reg = _findRegistration(user, d);
    if (!reg) {
        _log.error("Unknown account %s@%s", user.c_str(), d.c_str());
        return SIP_ERR_NOT_FOUND;
    }
    if (!_transport.isConnected())
        return SIP_ERR_TRANSPORT_DOWN;
    CallDialog* call = _allocCall();
    if (!call) {
        _log.error("No room for another call");
        return SIP_ERR_NO_CAPACITY;
    }
    int rc = call->makeCall(reg->getUsername(), reg->getPassword(), reg->getDomain(),
        reg->getDisplayName(), makeSipUri(target, d), sdp);
    if (call->isActive())
        callId = call->getCallId();
    return rc;
}

int SignalingEngine::acceptCall(const std::string& callId, const std::string& sdp) {
    CallDialog* call = _findCall(callId);
    return call ? call->accept(sdp) : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::declineCall(const std::string& callId, bool busy) {
    CallDialog* call = _findCall(callId);
    return call ? call->decline(busy) : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::hangup(const std::string& callId) {
    CallDialog* call = _findCall(callId);
    return call ? call->hangup() : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::hold(const std::string& callId, const std::string& sdp) {
    CallDialog* call = _findCall(callId);
    return call ? call->hold(sdp) : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::resume(const std::string& callId, const std::string& sdp) {
    CallDialog* call = _findCall(callId);
    return call ? call->resume(sdp) : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::sendDtmf(const std::string& callId, char digit, unsigned durationMs) {
    CallDialog* call = _findCall(callId);
    return call ? call->sendDtmf(digit, durationMs) : SIP_ERR_NOT_FOUND;
}

int SignalingEngine::sendDtmfSequence(const std::string& callId, const std::string& digits,
    unsigned durationMs) {
    CallDialog* call = _findCall(callId);
    if (!call)
        return SIP_ERR_NOT_FOUND;
    if (digits.empty())
        return SIP_ERR_INVALID_ARGUMENT;
    for (char c : digits)
        if (!CallDialog::isValidDtmf(c))
            return SIP_ERR_INVALID_ARGUMENT;
    for (char c : digits) {
        int rc = call->sendDtmf(c, durationMs);
        if (rc < 0)
            return rc;
    }
    return SIP_OK;
}

int SignalingEngine::setMediaAlive(const std::string& callId, bool alive) {
    CallDialog* call = _findCall(callId);
    if (!call)
        return SIP_ERR_NOT_FOUND;
    call->setMediaAlive(alive);
    return SIP_OK;
}

// ----- Queries --------------------------------------------------------------

const Registration* SignalingEngine::getRegistration(const std::string& user,
    const std::string& domain) const {
    string d = _resolveDomain(domain);
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (_accounts[i].isActive() && _accounts[i].matches(user, d))
            return &_accounts[i];
    return 0;
}

int SignalingEngine::getRegistrationState(const std::string& user,
    const std::string& domain) const {
    const Registration* reg = getRegistration(user, domain);
    return reg ? (int)reg->getState() : (int)SIP_ERR_NOT_FOUND;
}

const CallDialog* SignalingEngine::getCall(const std::string& callId) const {
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].belongsTo(callId))
            return &_calls[i];
    return 0;
}

int SignalingEngine::getCallState(const std::string& callId) const {
    const CallDialog* call = getCall(callId);
    return call ? (int)call->getState() : (int)SIP_ERR_NOT_FOUND;
}

std::vector<std::string> SignalingEngine::getActiveCalls() const {
    vector<string> result;
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].isActive() && !_calls[i].isTerminal())
            result.push_back(_calls[i].getCallId());
    return result;
}

// ----- Runnable2 ------------------------------------------------------------

int SignalingEngine::getPolls(pollfd* fds, unsigned fdsCapacity) {
    int fd = _transport.getWakeFd();
    if (fd < 0)
        return 0;
    if (fdsCapacity < 1)
        return -1;
    fds[0].fd = fd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    return 1;
}

bool SignalingEngine::run2() {

    bool worked = false;

    std::function<void()> fn;
    while (_posts.try_pop(fn)) {
        fn();
        worked = true;
    }

    if (_transport.poll())
        worked = true;

    _tm.poll();

    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (_accounts[i].isActive())
            _accounts[i].tick();
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].isActive())
            _calls[i].tick();

    _reap();

    return worked;
}

void SignalingEngine::tenSecTick() {
    if (_trace)
        _log.info("SIP rx %u tx %u malformed %u pending %u unmatched %u calls %u",
            _rxCount, _txCount, _malformedCount, _tm.getPendingCount(),
            _tm.getUnmatchedCount(), (unsigned)getActiveCalls().size());
}

// ----- SignalingHost --------------------------------------------------------

std::string SignalingEngine::makeVia() {
    string via("SIP/2.0/");
    via += _secure ? "WSS " : "WS ";
    via += _viaHost;
    via += ";branch=";
    via += makeBranch();
    return via;
}

std::string SignalingEngine::makeContact(const std::string& user, const std::string& domain) {
    string c("<sip:");
    c += user;
    c += "@";
    c += domain;
    c += ";transport=ws";
    for (auto it = _config.customContactParams.begin();
        it != _config.customContactParams.end(); it++) {
        c += ";";
        c += it->first;
        if (!it->second.empty()) {
            c += "=";
            c += it->second;
        }
    }
    c += ">";
    return c;
}

int SignalingEngine::sendRequest(const SipMessage& req, TransactionManager::Callback cb,
    uint32_t timeoutMs) {
    SipMessage msg(req);
    _addStandardHeaders(msg);
    return _tm.sendRequest(msg, cb, timeoutMs);
}

void SignalingEngine::cancelTransaction(int handle) {
    _tm.cancel(handle);
}

void SignalingEngine::sendStateless(const SipMessage& msg) {
    SipMessage m(msg);
    _addStandardHeaders(m);
    _send(m);
}

void SignalingEngine::sendResponse(const SipMessage& resp) {
    SipMessage m(resp);
    if (!m.hasHeader("Server") && !_config.userAgent.empty())
        m.setHeader("Server", _config.userAgent);
    _tm.onResponseSent(m);
    _send(m);
}

void SignalingEngine::registrationStateChanged(const Registration& reg, int oldState) {
    EngineEvent ev;
    ev.type = EngineEvent::REGISTRATION_STATE_CHANGED;
    ev.user = reg.getUsername();
    ev.domain = reg.getDomain();
    ev.state = reg.getState();
    ev.oldState = oldState;
    ev.statusCode = reg.getLastStatusCode();
    if (reg.getState() == Registration::STATE_FAILED)
        ev.reason = reg.getReason();
    _emit(ev);
}

void SignalingEngine::callStateChanged(const CallDialog& call, int oldState) {

    EngineEvent ev;
    ev.type = EngineEvent::CALL_STATE_CHANGED;
    ev.callId = call.getCallId();
    ev.user = call.getLocalUser();
    ev.domain = call.getLocalDomain();
    ev.state = call.getState();
    ev.oldState = oldState;
    ev.statusCode = call.getLastStatusCode();
    if (call.isTerminal()) {
        ev.endReason = call.getEndReason();
        ev.reason = call.getReason();
        ev.durationMs = call.getDurationMs();
    }
    _emit(ev);

    if (call.getDirection() == CallDialog::DIRECTION_INBOUND &&
        call.getState() == CallDialog::STATE_RINGING &&
        oldState == CallDialog::STATE_IDLE) {
        EngineEvent ic;
        ic.type = EngineEvent::INCOMING_CALL;
        ic.callId = call.getCallId();
        ic.user = call.getLocalUser();
        ic.domain = call.getLocalDomain();
        ic.callerNumber = call.getRemoteNumber();
        ic.callerName = call.getRemoteDisplayName();
        _emit(ic);
    }
}

void SignalingEngine::dtmfResult(const CallDialog& call, char digit, bool success) {
    EngineEvent ev;
    ev.type = EngineEvent::DTMF_RESULT;
    ev.callId = call.getCallId();
    ev.digit = digit;
    ev.success = success;
    _emit(ev);
}

void SignalingEngine::dtmfReceived(const CallDialog& call, char digit, unsigned durationMs) {
    EngineEvent ev;
    ev.type = EngineEvent::DTMF_RECEIVED;
    ev.callId = call.getCallId();
    ev.digit = digit;
    ev.durationMs = durationMs;
    _emit(ev);
}

// ----- TransportSession::Listener -------------------------------------------

void SignalingEngine::transportUp(bool reconnected) {

    EngineEvent ev;
    ev.type = EngineEvent::TRANSPORT_STATE_CHANGED;
    ev.up = true;
    _emit(ev);

    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].isActive())
            _calls[i].transportUp();

    // Everything that should be registered but isn't gets a fresh REGISTER
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++) {
        Registration& reg = _accounts[i];
        if (!reg.isActive() || !reg.isWanted())
            continue;
        if (reg.getState() == Registration::STATE_NONE ||
            reg.getState() == Registration::STATE_UNREGISTERED ||
            reg.getState() == Registration::STATE_FAILED) {
            if (reconnected)
                _log.info("Re-registering %s@%s", reg.getUsername().c_str(),
                    reg.getDomain().c_str());
            reg.registerAccount();
        }
    }
}

void SignalingEngine::transportDown(const std::string& reason) {

    EngineEvent ev;
    ev.type = EngineEvent::TRANSPORT_STATE_CHANGED;
    ev.up = false;
    ev.reason = reason;
    _emit(ev);

    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (_accounts[i].isActive())
            _accounts[i].transportDown();
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].isActive())
            _calls[i].transportDown();
}

void SignalingEngine::frameReceived(const std::string& frame) {

    _rxCount++;
    if (_trace)
        _log.info("SIP <<<\n%s", frame.c_str());

    SipMessage msg;
    if (msg.parse(frame) != SIP_OK) {
        _malformedCount++;
        _log.error("Malformed SIP message dropped (%u bytes)", (unsigned)frame.size());
        if (_trace)
            _log.infoDump("Malformed", (const uint8_t*)frame.data(), frame.size());
        return;
    }

    if (msg.isResponse())
        _onResponse(msg);
    else
        _onRequest(msg);
}

// ----- Private --------------------------------------------------------------

void SignalingEngine::_send(const SipMessage& msg) {
    string text = msg.build();
    _txCount++;
    if (_trace)
        _log.info("SIP >>>\n%s", text.c_str());
    int rc = _transport.send(text);
    if (rc < 0)
        _log.error("Unable to send %s (%s)",
            msg.isRequest() ? msg.getMethod().c_str() : "response", errorName(rc));
}

void SignalingEngine::_addStandardHeaders(SipMessage& msg) const {
    if (!msg.hasHeader("User-Agent") && !_config.userAgent.empty())
        msg.setHeader("User-Agent", _config.userAgent);
    for (auto it = _config.customSipHeaders.begin(); it != _config.customSipHeaders.end(); it++)
        if (!msg.hasHeader(it->first.c_str()))
            msg.addHeader(it->first.c_str(), it->second);
}

void SignalingEngine::_onResponse(const SipMessage& resp) {
    int rc = _tm.onResponseReceived(resp);
    // A 2xx that retransmits after its transaction is gone still needs
    // an ACK from the dialog.
    if (rc == SIP_ERR_NOT_FOUND && resp.isSuccess() && resp.getCSeqMethod() == "INVITE") {
        CallDialog* call = _findCall(resp.getCallId());
        if (call)
            call->onStray2xx(resp);
    }
}

void SignalingEngine::_onRequest(const SipMessage& req) {

    if (_tm.onRequestReceived(req))
        return;

    CallDialog* call = _findCall(req.getCallId());
    if (call) {
        call->onRequest(req);
        return;
    }

    if (req.isMethod("INVITE") && req.getToTag().empty()) {
        _onNewInvite(req);
        return;
    }

    if (req.isMethod("ACK"))
        return;
    else if (req.isMethod("OPTIONS"))
        _respondOutOfDialog(req, 200);
    else if (req.isMethod("BYE") || req.isMethod("CANCEL") || req.isMethod("INFO") ||
        !req.getToTag().empty())
        _respondOutOfDialog(req, 481);
    else
        _respondOutOfDialog(req, 501);
}

void SignalingEngine::_onNewInvite(const SipMessage& invite) {

    string user = extractUser(invite.getRequestUri());
    Registration* reg = _findRegistrationForUser(user);
    if (!reg) {
        _log.info("INVITE for unknown user '%s'", user.c_str());
        _respondOutOfDialog(invite, 404);
        return;
    }

    CallDialog* call = _allocCall();
    if (!call) {
        _log.info("No room for inbound call %s", invite.getCallId().c_str());
        _respondOutOfDialog(invite, 486);
        return;
    }

    int rc = call->onInvite(invite, reg->getUsername(), reg->getDomain());
    if (rc < 0)
        _log.error("Inbound call rejected (%s)", errorName(rc));
}

void SignalingEngine::_respondOutOfDialog(const SipMessage& req, int code) {
    SipMessage resp = SipMessage::responseTo(req, code, 0, makeTag());
    if (req.isMethod("OPTIONS") || code == 501) {
        resp.setHeader("Allow", ALLOWED_METHODS);
        resp.setHeader("Accept", "application/sdp");
    }
    sendResponse(resp);
}

void SignalingEngine::_emit(const EngineEvent& ev) {
    if (_trace)
        _log.info("Event %s", ev.toString().c_str());
    if (_sink)
        _sink->consume(ev);
}

void SignalingEngine::_reap() {
    for (unsigned i = 0; i < MAX_CALLS; i++) {
        if (_calls[i].isActive() && _calls[i].canReap()) {
            _log.info("Call %s released", _calls[i].getCallId().c_str());
            _calls[i].reset();
        }
    }
}

std::string SignalingEngine::_resolveDomain(const std::string& domain) const {
    return domain.empty() ? _config.defaultDomain : domain;
}

Registration* SignalingEngine::_findRegistration(const std::string& user,
    const std::string& domain) {
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (_accounts[i].isActive() && _accounts[i].matches(user, domain))
            return &_accounts[i];
    return 0;
}

Registration* SignalingEngine::_findRegistrationForUser(const std::string& user) {
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (_accounts[i].isActive() && _accounts[i].getUsername() == user)
            return &_accounts[i];
    return 0;
}

Registration* SignalingEngine::_allocRegistration() {
    for (unsigned i = 0; i < MAX_ACCOUNTS; i++)
        if (!_accounts[i].isActive())
            return &_accounts[i];
    return 0;
}

CallDialog* SignalingEngine::_findCall(const std::string& callId) {
    if (callId.empty())
        return 0;
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (_calls[i].belongsTo(callId))
            return &_calls[i];
    return 0;
}

CallDialog* SignalingEngine::_allocCall() {
    for (unsigned i = 0; i < MAX_CALLS; i++)
        if (!_calls[i].isActive())
            return &_calls[i];
    return 0;
}

}

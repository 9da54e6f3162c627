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
#include <functional>
#include <string>
#include <vector>

#include "kc1fsz-tools/threadsafequeue.h"

#include "sipwire/WebSocketChannel.h"

#include "Runnable2.h"
#include "Config.h"
#include "SignalingHost.h"
#include "TransactionManager.h"
#include "TransportSession.h"
#include "Registration.h"
#include "CallDialog.h"

namespace kc1fsz {
    class Log;
    class Clock;
}

namespace sipwire {

class EngineEventConsumer;
class EngineEvent;

/**
 * Ties everything together. Owns the transport, the transaction layer,
 * the registrations and the calls, and routes every inbound message to
 * the right place.
 *
 * All of the work happens inside of run2() on the EventLoop thread.
 * The command methods must be called from that same thread. Another
 * thread can get work onto the engine thread using post().
 *
 * Every state change is reported to the single EngineEventConsumer.
 */
class SignalingEngine : public Runnable2, public SignalingHost,
    public TransportSession::Listener {
public:

    static const unsigned MAX_ACCOUNTS = 8;
    static const unsigned MAX_CALLS = 8;

    SignalingEngine(kc1fsz::Log& log, kc1fsz::Clock& clock, WebSocketChannel& channel);

    void setSink(EngineEventConsumer* sink) { _sink = sink; }

    /**
     * Logs every SIP message in/out.
     */
    void setTrace(bool trace) { _trace = trace; }

    /**
     * Takes a copy of the configuration. Transport settings take effect
     * on the next connection attempt.
     *
     * @returns SIP_OK or SIP_ERR_INVALID_ARGUMENT if the WebSocket URL
     * isn't usable.
     */
    int configure(const Config& config);

    /**
     * Starts connecting. Accounts in the configuration are registered
     * as soon as the transport comes up.
     */
    int start();

    /**
     * Closes the transport. The state machines see this as a transport
     * failure.
     */
    void stop();

    /**
     * Drops the connection and reconnects immediately. Every account that
     * should be registered sends a fresh REGISTER once the transport is
     * back, and calls go through the usual grace period.
     */
    int forceReconnect();

    /**
     * Runs a function on the engine thread. Safe to call from any thread.
     */
    void post(std::function<void()> fn) { _posts.push(fn); }

    // ----- Registration commands --------------------------------------------

    /**
     * Creates the account (if needed) and starts registering. If the
     * transport isn't up yet the REGISTER goes out once it is.
     *
     * @param domain Blank means the default domain.
     */
    int registerAccount(const std::string& user, const std::string& password,
        const std::string& domain, const std::string& displayName = std::string());

    int unregisterAccount(const std::string& user, const std::string& domain);

    /**
     * Brings the set of accounts in line with a new configuration: new
     * accounts are registered and accounts that have disappeared are
     * unregistered.
     */
    void applyAccounts(const std::vector<Config::Account>& accounts);

    // ----- Call commands ----------------------------------------------------

    /**
     * Places an outbound call from a registered account.
     *
     * @param target "1234", "bob@example.com" or a full SIP URI.
     * @param callId Receives the Call-ID, which identifies the call in
     * all later commands and notifications.
     */
    int makeCall(const std::string& user, const std::string& domain,
        const std::string& target, const std::string& sdp, std::string& callId);

    int acceptCall(const std::string& callId, const std::string& sdp);
    int declineCall(const std::string& callId, bool busy = false);
    int hangup(const std::string& callId);
    int hold(const std::string& callId, const std::string& sdp);
    int resume(const std::string& callId, const std::string& sdp);
    int sendDtmf(const std::string& callId, char digit,
        unsigned durationMs = CallDialog::DEFAULT_DTMF_DURATION_MS);

    /**
     * Queues a whole string of digits. Nothing is queued if any of the
     * digits are invalid.
     */
    int sendDtmfSequence(const std::string& callId, const std::string& digits,
        unsigned durationMs = CallDialog::DEFAULT_DTMF_DURATION_MS);

    /**
     * Lets the media layer tell us that RTP is still flowing, which keeps
     * a call up through a signaling outage.
     */
    int setMediaAlive(const std::string& callId, bool alive);

    // ----- Queries ----------------------------------------------------------

    const Registration* getRegistration(const std::string& user, const std::string& domain) const;

    /**
     * @returns A Registration::State or SIP_ERR_NOT_FOUND.
     */
    int getRegistrationState(const std::string& user, const std::string& domain) const;

    const CallDialog* getCall(const std::string& callId) const;

    /**
     * @returns A CallDialog::State or SIP_ERR_NOT_FOUND.
     */
    int getCallState(const std::string& callId) const;

    /**
     * @returns The Call-IDs of the calls that haven't finished.
     */
    std::vector<std::string> getActiveCalls() const;

    const TransportSession& getTransport() const { return _transport; }
    const TransactionManager& getTransactionManager() const { return _tm; }
    const std::string& getViaHost() const { return _viaHost; }

    // ----- Runnable2 --------------------------------------------------------

    virtual int getPolls(pollfd* fds, unsigned fdsCapacity);
    virtual bool run2();
    virtual void tenSecTick();

    // ----- SignalingHost ----------------------------------------------------

    virtual const Config& getConfig() const { return _config; }
    virtual std::string makeVia();
    virtual std::string makeContact(const std::string& user, const std::string& domain);
    virtual int sendRequest(const SipMessage& req, TransactionManager::Callback cb,
        uint32_t timeoutMs = 0);
    virtual void cancelTransaction(int handle);
    virtual void sendStateless(const SipMessage& msg);
    virtual void sendResponse(const SipMessage& resp);
    virtual void registrationStateChanged(const Registration& reg, int oldState);
    virtual void callStateChanged(const CallDialog& call, int oldState);
    virtual void dtmfResult(const CallDialog& call, char digit, bool success);
    virtual void dtmfReceived(const CallDialog& call, char digit, unsigned durationMs);

    // ----- TransportSession::Listener ---------------------------------------

    virtual void transportUp(bool reconnected);
    virtual void transportDown(const std::string& reason);
    virtual void frameReceived(const std::string& frame);

private:

    void _send(const SipMessage& msg);
    void _addStandardHeaders(SipMessage& msg) const;
    void _onRequest(const SipMessage& req);
    void _onResponse(const SipMessage& resp);
    void _onNewInvite(const SipMessage& invite);
    void _respondOutOfDialog(const SipMessage& req, int code);
    void _emit(const EngineEvent& ev);
    void _reap();

    std::string _resolveDomain(const std::string& domain) const;
    Registration* _findRegistration(const std::string& user, const std::string& domain);
    Registration* _findRegistrationForUser(const std::string& user);
    Registration* _allocRegistration();
    CallDialog* _findCall(const std::string& callId);
    CallDialog* _allocCall();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    Config _config;
    TransportSession _transport;
    TransactionManager _tm;
    EngineEventConsumer* _sink = 0;
    bool _trace = false;
    bool _secure = false;

    // Stands in for our address in Via/Contact, a WebSocket client
    // doesn't have a reachable one (RFC 7118 section 5).
    std::string _viaHost;

    Registration _accounts[MAX_ACCOUNTS];
    CallDialog _calls[MAX_CALLS];

    kc1fsz::threadsafequeue<std::function<void()>> _posts;

    unsigned _rxCount = 0;
    unsigned _txCount = 0;
    unsigned _malformedCount = 0;
};

}

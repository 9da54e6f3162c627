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
#include <vector>
#include <queue>

#include "SipMessage.h"
#include "DigestAuth.h"

namespace kc1fsz {
    class Log;
    class Clock;
}

namespace sipwire {

class SignalingHost;

/**
 * One SIP dialog (i.e. one call), inbound or outbound. Instances live
 * in a fixed table owned by the SignalingEngine and are recycled
 * using reset().
 *
 * The dialog never talks to the network directly. Requests go out
 * through the host (and the TransactionManager behind it) and the
 * responses come back through onResponse().
 */
class CallDialog {
public:

    enum State {
        STATE_IDLE,
        STATE_CALLING,
        STATE_RINGING,
        STATE_CONNECTED,
        STATE_ON_HOLD,
        STATE_TERMINATING,
        STATE_ENDED,
        STATE_FAILED
    };

    enum Direction {
        DIRECTION_OUTBOUND,
        DIRECTION_INBOUND
    };

    enum EndReason {
        END_NONE,
        END_NORMAL_CLEARING,
        END_USER_BUSY,
        END_NO_ANSWER,
        END_CALL_REJECTED,
        END_NETWORK_ERROR,
        END_AUTHENTICATION_FAILED,
        END_TIMEOUT,
        END_UNKNOWN
    };

    static const unsigned DEFAULT_DTMF_DURATION_MS = 160;
    // How long a finished dialog hangs around to soak up retransmissions
    static const uint32_t LINGER_MS = 32000;
    // How long we wait for the final answer after a CANCEL/BYE
    static const uint32_t TERMINATING_TIMEOUT_MS = 32000;
    // How long we wait for the ACK after answering
    static const uint32_t ACK_TIMEOUT_MS = 32000;

    static const char* stateName(int state);
    static const char* endReasonName(int reason);
    static const char* directionName(int direction);

    /**
     * Maps a final SIP status code to the reason reported to the user.
     */
    static EndReason endReasonFor(int statusCode);

    static bool isValidDtmf(char digit);

    CallDialog();

    /**
     * One-time initialization. Connects the dialog to the outside world.
     */
    void init(kc1fsz::Log* log, kc1fsz::Clock* clock, SignalingHost* host) {
        _log = log;
        _clock = clock;
        _host = host;
    }

    void reset();

    bool isActive() const { return _active; }

    bool belongsTo(const std::string& callId) const {
        return _active && _callId == callId;
    }

    bool isTerminal() const {
        return _state == STATE_ENDED || _state == STATE_FAILED;
    }

    /**
     * @returns true when the dialog is finished and has lingered long
     * enough that the slot can be recycled.
     */
    bool canReap() const;

    // ----- Commands ---------------------------------------------------------

    /**
     * Starts an outbound call. The credentials are used if the INVITE
     * is challenged.
     */
    int makeCall(const std::string& user, const std::string& password,
        const std::string& domain, const std::string& displayName,
        const std::string& targetUri, const std::string& sdp);

    int accept(const std::string& sdp);

    /**
     * Rejects an inbound call that is ringing.
     *
     * @param busy 486 Busy Here if true, 603 Decline otherwise.
     */
    int decline(bool busy);

    /**
     * Ends the call in whatever way is appropriate for the current state:
     * CANCEL for an outbound call that hasn't been answered, a rejection
     * for an inbound call that hasn't been answered, or BYE.
     */
    int hangup();

    int hold(const std::string& sdp);
    int resume(const std::string& sdp);

    /**
     * Queues a DTMF digit to be sent using SIP INFO. Digits go out
     * one at a time and each one is reported via the host.
     */
    int sendDtmf(char digit, unsigned durationMs = DEFAULT_DTMF_DURATION_MS);

    /**
     * Tells the dialog whether the media path is still working on its
     * own. A call with live media survives a signaling transport outage.
     */
    void setMediaAlive(bool alive) { _mediaAlive = alive; }

    // ----- Events -----------------------------------------------------------

    /**
     * A new INVITE (no To tag) that should start this dialog. Sends
     * 100 Trying and 180 Ringing.
     */
    int onInvite(const SipMessage& invite, const std::string& localUser,
        const std::string& localDomain);

    /**
     * Any request that arrives for this dialog after it has started.
     */
    void onRequest(const SipMessage& req);

    /**
     * Transaction callback for every request that the dialog sends.
     */
    void onResponse(int handle, const SipMessage& response, int error);

    /**
     * A 2xx for our INVITE that the transaction layer had already
     * finished with. The far end didn't get our ACK, so send it again.
     */
    void onStray2xx(const SipMessage& response);

    /**
     * Timers: no-answer, ACK wait, transport grace, etc.
     */
    void tick();

    void transportDown();
    void transportUp();

    // ----- Queries ----------------------------------------------------------

    State getState() const { return _state; }
    Direction getDirection() const { return _direction; }
    const std::string& getCallId() const { return _callId; }
    const std::string& getLocalTag() const { return _localTag; }
    const std::string& getRemoteTag() const { return _remoteTag; }
    const std::string& getLocalUser() const { return _localUser; }
    const std::string& getLocalDomain() const { return _localDomain; }
    const std::string& getRemoteUri() const { return _remoteUri; }
    const std::string& getRemoteTarget() const { return _remoteTarget; }
    const std::string& getRemoteNumber() const { return _remoteNumber; }
    const std::string& getRemoteDisplayName() const { return _remoteDisplayName; }
    const std::string& getLocalSdp() const { return _localSdp; }
    const std::string& getRemoteSdp() const { return _remoteSdp; }
    const std::vector<std::string>& getRouteSet() const { return _routeSet; }
    unsigned getLocalCSeq() const { return _localCSeq; }
    unsigned getRemoteCSeq() const { return _remoteCSeq; }
    EndReason getEndReason() const { return _endReason; }
    const std::string& getReason() const { return _reason; }
    int getLastStatusCode() const { return _lastStatusCode; }
    bool isAwaitingAck() const { return _awaitingAck; }
    bool isMediaAlive() const { return _mediaAlive; }
    bool isReinvitePending() const { return _reinviteHandle != 0; }
    unsigned getDtmfQueueDepth() const { return _dtmfQueue.size(); }

    /**
     * @returns The time from answer to hangup, or zero if the call was
     * never connected.
     */
    uint32_t getDurationMs() const;

private:

    struct DtmfDigit {
        char digit;
        unsigned durationMs;
    };

    void _setState(State s);
    void _end(State s, EndReason reason, const std::string& text, int statusCode = 0);
    int _illegal(const char* event);

    int _send(SipMessage& req, int& handle);
    SipMessage _makeInDialogRequest(const char* method);
    void _sendAck(unsigned cseq);
    int _sendCancel();
    int _sendBye();
    int _sendReinvite(const std::string& sdp, bool hold);
    void _sendNextDtmf();
    void _failDtmfQueue();
    void _respond(const SipMessage& req, int code, const std::string& contentType = std::string(),
        const std::string& body = std::string());
    void _learnDialog(const SipMessage& response);

    void _inviteResponse(const SipMessage& response, int error);
    void _reinviteResponse(const SipMessage& response, int error);
    void _byeResponse(const SipMessage& response, int error);
    void _infoResponse(const SipMessage& response, int error);
    bool _retryWithCredentials(const SipMessage& challenge, SipMessage& request,
        int& handle, bool& retried);

    void _onInfo(const SipMessage& req);

    kc1fsz::Log* _log = 0;
    kc1fsz::Clock* _clock = 0;
    SignalingHost* _host = 0;

    bool _active = false;
    State _state = State::STATE_IDLE;
    Direction _direction = Direction::DIRECTION_OUTBOUND;

    // ----- Dialog identity --------------------------------------------------

    std::string _callId;
    std::string _localTag;
    std::string _remoteTag;
    std::string _localUser;
    std::string _localDomain;
    std::string _localDisplayName;
    std::string _password;
    // From/To header values as they are used on in-dialog requests,
    // including the tags.
    std::string _localParty;
    std::string _remoteParty;
    std::string _remoteUri;
    std::string _remoteTarget;
    std::string _remoteNumber;
    std::string _remoteDisplayName;
    std::vector<std::string> _routeSet;
    unsigned _localCSeq = 0;
    unsigned _remoteCSeq = 0;
    DigestAuth _auth;

    std::string _localSdp;
    std::string _remoteSdp;

    // ----- Transactions in flight -------------------------------------------

    // The original INVITE (outbound) or the INVITE that we received (inbound)
    SipMessage _invite;
    int _inviteHandle = 0;
    bool _inviteAuthRetried = false;
    int _cancelHandle = 0;

    SipMessage _bye;
    int _byeHandle = 0;
    bool _byeAuthRetried = false;

    SipMessage _reinvite;
    int _reinviteHandle = 0;
    bool _reinviteAuthRetried = false;
    bool _reinviteHold = false;
    std::string _reinviteSdp;

    int _infoHandle = 0;
    char _infoDigit = 0;
    std::queue<DtmfDigit> _dtmfQueue;

    // The last ACK sent for a 2xx, kept so it can be sent again
    SipMessage _ack;
    bool _haveAck = false;

    // ----- Timers -----------------------------------------------------------

    bool _noAnswerArmed = false;
    uint32_t _noAnswerAtMs = 0;
    bool _awaitingAck = false;
    uint32_t _ackDeadlineMs = 0;
    uint32_t _terminatingDeadlineMs = 0;
    bool _transportDown = false;
    uint32_t _transportDownAtMs = 0;
    bool _mediaAlive = false;

    bool _everConnected = false;
    uint32_t _connectedAtMs = 0;
    uint32_t _endedAtMs = 0;

    EndReason _endReason = EndReason::END_NONE;
    std::string _reason;
    int _lastStatusCode = 0;
};

}

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

#include "SipMessage.h"

namespace kc1fsz {
    class Log;
    class Clock;
}

namespace sipwire {

/**
 * Correlates outbound requests with their responses. A client transaction
 * is identified by the branch parameter of the top Via plus the CSeq
 * method.
 *
 * Retransmission (RFC 3261 timers A/E) is optional since a WebSocket
 * stream already guarantees delivery. The overall timeout is always
 * enforced: a transaction that doesn't see a final response in time
 * completes with a synthetic 408 and SIP_ERR_TRANSACTION_TIMEOUT.
 *
 * The manager also remembers the last response sent for each inbound
 * request so that retransmitted requests can be answered without bothering
 * the state machines.
 */
class TransactionManager {
public:

    /**
     * Called for every provisional and final response matched to a
     * transaction. The error is SIP_OK, or SIP_ERR_TRANSACTION_TIMEOUT
     * along with a synthetic 408 response.
     */
    typedef std::function<void(int handle, const SipMessage& response, int error)> Callback;

    static const uint32_t T1_MS = 500;
    static const uint32_t T2_MS = 4000;

    /**
     * @param sender Used to put a message onto the transport.
     */
    TransactionManager(kc1fsz::Log& log, kc1fsz::Clock& clock,
        std::function<void(const SipMessage&)> sender);

    /**
     * Turns SIP-level retransmission on/off. Should be off when the
     * transport is reliable.
     */
    void setRetransmit(bool on) { _retransmit = on; }
    void setTimeoutMs(uint32_t ms) { _timeoutMs = ms; }

    /**
     * Once an INVITE gets a provisional response the deadline is pushed
     * out by this amount (the far end might ring for a while).
     */
    void setProvisionalTimeoutMs(uint32_t ms) { _provisionalTimeoutMs = ms; }

    /**
     * Registers a client transaction and sends the request.
     *
     * @param timeoutMs Overrides the default timeout if non-zero.
     * @returns A positive handle, SIP_ERR_INVALID_ARGUMENT if the request
     * has no branch (or is an ACK), or SIP_ERR_NO_CAPACITY.
     */
    int sendRequest(const SipMessage& request, Callback cb, uint32_t timeoutMs = 0);

    /**
     * Matches the response to a client transaction and fires the callback.
     * A non-2xx final response to an INVITE is acknowledged here.
     *
     * @returns SIP_OK if matched, SIP_ERR_NOT_FOUND if the response
     * doesn't belong to any transaction (logged and dropped).
     */
    int onResponseReceived(const SipMessage& response);

    /**
     * Looks at an inbound request before it is dispatched.
     *
     * @returns true if the request is a retransmission (or an ACK for a
     * non-2xx final response) that has been fully handled here.
     */
    bool onRequestReceived(const SipMessage& request);

    /**
     * Must be called for every response sent so that it can be replayed
     * if the request is retransmitted.
     */
    void onResponseSent(const SipMessage& response);

    /**
     * Marks the transaction as cancelled. This is advisory only: a final
     * response that shows up later is still delivered to the callback.
     */
    void cancel(int handle);

    bool isCancelled(int handle) const;
    bool isPending(int handle) const;

    /**
     * Takes care of retransmissions and timeouts. Should be called
     * frequently.
     */
    void poll();

    /**
     * Drops everything without firing any callbacks.
     */
    void reset();

    unsigned getPendingCount() const;
    unsigned getRetransmitCount() const { return _retransmitCount; }
    unsigned getUnmatchedCount() const { return _unmatchedCount; }

private:

    struct ClientTransaction {
        bool active = false;
        int handle = 0;
        SipMessage request;
        std::string branch;
        std::string method;
        Callback cb;
        uint32_t deadlineMs = 0;
        bool retransmitArmed = false;
        uint32_t nextRetransmitMs = 0;
        uint32_t retransmitIntervalMs = 0;
        bool proceeding = false;
        bool cancelled = false;
    };

    struct ServerTransaction {
        bool active = false;
        std::string branch;
        std::string method;
        bool haveResponse = false;
        SipMessage lastResponse;
        uint32_t expireMs = 0;
    };

    ClientTransaction* _findClient(int handle);
    const ClientTransaction* _findClient(int handle) const;
    ServerTransaction* _findServer(const std::string& branch, const std::string& method);
    void _sendAckForNon2xx(const ClientTransaction& t, const SipMessage& response);

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    std::function<void(const SipMessage&)> _sender;

    bool _retransmit = false;
    uint32_t _timeoutMs = 64 * T1_MS;
    uint32_t _provisionalTimeoutMs = 180 * 1000;

    static const unsigned MAX_CLIENT = 32;
    ClientTransaction _client[MAX_CLIENT];
    static const unsigned MAX_SERVER = 32;
    ServerTransaction _server[MAX_SERVER];

    int _nextHandle = 1;
    unsigned _retransmitCount = 0;
    unsigned _unmatchedCount = 0;
};

}

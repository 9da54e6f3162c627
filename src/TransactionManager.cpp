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
#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "SipError.h"
#include "SipUtil.h"
#include "TransactionManager.h"

using namespace std;

namespace sipwire {

TransactionManager::TransactionManager(kc1fsz::Log& log, kc1fsz::Clock& clock,
    std::function<void(const SipMessage&)> sender)
:   _log(log),
    _clock(clock),
    _sender(sender) {
}

void TransactionManager::reset() {
    for (unsigned i = 0; i < MAX_CLIENT; i++)
        _client[i] = ClientTransaction();
    for (unsigned i = 0; i < MAX_SERVER; i++)
        _server[i] = ServerTransaction();
}

int TransactionManager::sendRequest(const SipMessage& request, Callback cb,
    uint32_t timeoutMs) {

    string branch = request.getBranch();
    string method = request.getMethod();
    if (branch.empty() || !request.isRequest() || method == "ACK") {
        _log.error("Request can't be tracked (branch=%s method=%s)",
            branch.c_str(), method.c_str());
        return SIP_ERR_INVALID_ARGUMENT;
    }

    // Look for a duplicate and a free slot at the same time
    int freeIx = -1;
    for (unsigned i = 0; i < MAX_CLIENT; i++) {
        if (_client[i].active) {
            if (_client[i].branch == branch && _client[i].method == method) {
                _log.error("Duplicate transaction %s %s", method.c_str(), branch.c_str());
                return SIP_ERR_INVALID_ARGUMENT;
            }
        } else if (freeIx == -1) {
            freeIx = i;
        }
    }
    if (freeIx == -1) {
        _log.error("No transactions available");
        return SIP_ERR_NO_CAPACITY;
    }

    ClientTransaction& t = _client[freeIx];
    t = ClientTransaction();
    t.active = true;
    t.handle = _nextHandle++;
    t.request = request;
    t.branch = branch;
    t.method = method;
    t.cb = cb;
    t.deadlineMs = _clock.time() + (timeoutMs ? timeoutMs : _timeoutMs);
    if (_retransmit) {
        t.retransmitArmed = true;
        t.retransmitIntervalMs = T1_MS;
        t.nextRetransmitMs = _clock.time() + T1_MS;
    }

    _sender(request);
    return t.handle;
}

int TransactionManager::onResponseReceived(const SipMessage& response) {

    string branch = response.getBranch();
    string method = response.getCSeqMethod();

    ClientTransaction* t = 0;
    for (unsigned i = 0; i < MAX_CLIENT; i++) {
        if (_client[i].active && _client[i].branch == branch &&
            _client[i].method == method) {
            t = &(_client[i]);
            break;
        }
    }

    if (!t) {
        _unmatchedCount++;
        _log.info("Unmatched response %d for %s (branch %s), dropped",
            response.getStatusCode(), method.c_str(), branch.c_str());
        return SIP_ERR_NOT_FOUND;
    }

    const int handle = t->handle;

    if (response.isProvisional()) {
        t->proceeding = true;
        if (method == "INVITE") {
            // The far end has the INVITE, no need to keep sending it
            t->retransmitArmed = false;
            t->deadlineMs = _clock.time() + _provisionalTimeoutMs;
        } else if (t->retransmitArmed) {
            t->retransmitIntervalMs = T2_MS;
        }
        // Take a copy in case the callback starts another transaction
        Callback cb = t->cb;
        if (cb)
            cb(handle, response, SIP_OK);
        return SIP_OK;
    }

    if (method == "INVITE" && !response.isSuccess())
        _sendAckForNon2xx(*t, response);

    // The transaction is finished. The slot is released before the callback
    // runs since the callback may well start a new transaction.
    Callback cb = t->cb;
    *t = ClientTransaction();
    if (cb)
        cb(handle, response, SIP_OK);
    return SIP_OK;
}

void TransactionManager::_sendAckForNon2xx(const ClientTransaction& t,
    const SipMessage& response) {
    // RFC 3261 section 17.1.1.3: same Request-URI, top Via, From, Call-ID,
    // and Route as the INVITE, To from the response.
    const SipMessage& invite = t.request;
    SipMessage ack = SipMessage::makeRequest("ACK", invite.getRequestUri());
    ack.addHeader("Via", invite.getTopVia());
    for (const string& route : invite.getHeaderValues("Route"))
        ack.addHeader("Route", route);
    ack.addHeader("Max-Forwards", "70");
    ack.addHeader("From", invite.getHeader("From"));
    ack.addHeader("To", response.getHeader("To"));
    ack.addHeader("Call-ID", invite.getCallId());
    ack.addHeader("CSeq", to_string(invite.getCSeqNumber()) + " ACK");
    _sender(ack);
}

bool TransactionManager::onRequestReceived(const SipMessage& request) {

    string branch = request.getBranch();
    if (branch.empty())
        return false;

    if (request.isMethod("ACK")) {
        // An ACK to a non-2xx final response shares the INVITE branch
        ServerTransaction* s = _findServer(branch, "INVITE");
        if (s && s->haveResponse && s->lastResponse.getStatusCode() >= 300)
            return true;
        return false;
    }

    ServerTransaction* s = _findServer(branch, request.getMethod());
    if (s) {
        if (s->haveResponse) {
            _log.info("Retransmitted %s, replaying %d", request.getMethod().c_str(),
                s->lastResponse.getStatusCode());
            _sender(s->lastResponse);
        } else {
            _log.info("Retransmitted %s, still working on it", request.getMethod().c_str());
        }
        return true;
    }

    // New request, start tracking it
    for (unsigned i = 0; i < MAX_SERVER; i++) {
        if (!_server[i].active) {
            _server[i] = ServerTransaction();
            _server[i].active = true;
            _server[i].branch = branch;
            _server[i].method = request.getMethod();
            _server[i].expireMs = _clock.time() + _timeoutMs;
            return false;
        }
    }

    _log.info("Server transaction table full, not tracking %s", request.getMethod().c_str());
    return false;
}

void TransactionManager::onResponseSent(const SipMessage& response) {
    ServerTransaction* s = _findServer(response.getBranch(), response.getCSeqMethod());
    if (!s)
        return;
    s->lastResponse = response;
    s->haveResponse = true;
    // A final response starts the clock on the cleanup
    if (!response.isProvisional())
        s->expireMs = _clock.time() + 64 * T1_MS;
    // An INVITE can stay open a long time while ringing
    else
        s->expireMs = _clock.time() + _provisionalTimeoutMs;
}

void TransactionManager::cancel(int handle) {
    ClientTransaction* t = _findClient(handle);
    if (t)
        t->cancelled = true;
}

bool TransactionManager::isCancelled(int handle) const {
    const ClientTransaction* t = _findClient(handle);
    return t && t->cancelled;
}

bool TransactionManager::isPending(int handle) const {
    return _findClient(handle) != 0;
}

unsigned TransactionManager::getPendingCount() const {
    unsigned count = 0;
    for (unsigned i = 0; i < MAX_CLIENT; i++)
        if (_client[i].active)
            count++;
    return count;
}

void TransactionManager::poll() {

    for (unsigned i = 0; i < MAX_CLIENT; i++) {

        if (!_client[i].active)
            continue;

        ClientTransaction& t = _client[i];

        if (_clock.isPast(t.deadlineMs)) {
            _log.info("Transaction timeout %s (branch %s)", t.method.c_str(),
                t.branch.c_str());
            SipMessage timeout = SipMessage::responseTo(t.request, 408, "Request Timeout");
            Callback cb = t.cb;
            int handle = t.handle;
            t = ClientTransaction();
            if (cb)
                cb(handle, timeout, SIP_ERR_TRANSACTION_TIMEOUT);
            continue;
        }

        if (t.retransmitArmed && _clock.isPast(t.nextRetransmitMs)) {
            _sender(t.request);
            _retransmitCount++;
            // Exponential backoff, capped
            t.retransmitIntervalMs *= 2;
            if (t.retransmitIntervalMs > T2_MS)
                t.retransmitIntervalMs = T2_MS;
            t.nextRetransmitMs = _clock.time() + t.retransmitIntervalMs;
        }
    }

    for (unsigned i = 0; i < MAX_SERVER; i++) {
        if (_server[i].active && _clock.isPast(_server[i].expireMs))
            _server[i] = ServerTransaction();
    }
}

TransactionManager::ClientTransaction* TransactionManager::_findClient(int handle) {
    for (unsigned i = 0; i < MAX_CLIENT; i++)
        if (_client[i].active && _client[i].handle == handle)
            return &(_client[i]);
    return 0;
}

const TransactionManager::ClientTransaction* TransactionManager::_findClient(int handle) const {
    for (unsigned i = 0; i < MAX_CLIENT; i++)
        if (_client[i].active && _client[i].handle == handle)
            return &(_client[i]);
    return 0;
}

TransactionManager::ServerTransaction* TransactionManager::_findServer(
    const std::string& branch, const std::string& method) {
    for (unsigned i = 0; i < MAX_SERVER; i++)
        if (_server[i].active && _server[i].branch == branch &&
            _server[i].method == method)
            return &(_server[i]);
    return 0;
}

}

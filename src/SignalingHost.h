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

#include "TransactionManager.h"

namespace sipwire {

class Config;
class SipMessage;
class Registration;
class CallDialog;

/**
 * The services that the coordinator provides to the per-account and
 * per-call state machines. The state machines never talk to each other,
 * everything that crosses between them goes through here.
 */
class SignalingHost {
public:

    virtual ~SignalingHost() { }

    virtual const Config& getConfig() const = 0;

    /**
     * @returns A complete Via header value with a brand new branch.
     */
    virtual std::string makeVia() = 0;

    /**
     * @returns A Contact header value for the local user.
     */
    virtual std::string makeContact(const std::string& user, const std::string& domain) = 0;

    /**
     * Hands a request to the transaction layer. The standard headers
     * (User-Agent and any configured custom headers) are added.
     *
     * @returns A positive transaction handle or a negative error.
     */
    virtual int sendRequest(const SipMessage& req, TransactionManager::Callback cb,
        uint32_t timeoutMs = 0) = 0;

    /**
     * Advisory cancellation of a pending client transaction.
     */
    virtual void cancelTransaction(int handle) = 0;

    /**
     * Sends something that isn't tracked by a transaction (i.e. an ACK
     * for a 2xx).
     */
    virtual void sendStateless(const SipMessage& msg) = 0;

    virtual void sendResponse(const SipMessage& resp) = 0;

    // ----- Notifications ----------------------------------------------------

    virtual void registrationStateChanged(const Registration& reg, int oldState) = 0;
    virtual void callStateChanged(const CallDialog& call, int oldState) = 0;
    virtual void dtmfResult(const CallDialog& call, char digit, bool success) = 0;
    virtual void dtmfReceived(const CallDialog& call, char digit, unsigned durationMs) = 0;
};

}

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

namespace sipwire {

/**
 * A notification from the signaling engine to the application. Only
 * the fields that apply to the type are filled in.
 */
class EngineEvent {
public:

    enum Type {
        NONE,
        // user, domain, state, oldState, reason, statusCode
        REGISTRATION_STATE_CHANGED,
        // callId, state, oldState, endReason, reason, statusCode, durationMs
        CALL_STATE_CHANGED,
        // callId, user, domain, callerNumber, callerName
        INCOMING_CALL,
        // callId, digit, success
        DTMF_RESULT,
        // callId, digit, durationMs
        DTMF_RECEIVED,
        // up, reason
        TRANSPORT_STATE_CHANGED
    };

    static const char* typeName(int type);

    Type type = Type::NONE;

    std::string user;
    std::string domain;
    std::string callId;
    int state = 0;
    int oldState = 0;
    std::string reason;
    int statusCode = 0;
    int endReason = 0;
    uint32_t durationMs = 0;

    std::string callerNumber;
    std::string callerName;

    char digit = 0;
    bool success = false;

    bool up = false;

    /**
     * @returns A one-line human readable description, for logging.
     */
    std::string toString() const;
};

}

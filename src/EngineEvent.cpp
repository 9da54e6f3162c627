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

#include "Registration.h"
#include "CallDialog.h"
#include "EngineEvent.h"

using namespace std;

namespace sipwire {

const char* EngineEvent::typeName(int type) {
    switch (type) {
        case NONE: return "None";
        case REGISTRATION_STATE_CHANGED: return "RegistrationStateChanged";
        case CALL_STATE_CHANGED: return "CallStateChanged";
        case INCOMING_CALL: return "IncomingCall";
        case DTMF_RESULT: return "DtmfResult";
        case DTMF_RECEIVED: return "DtmfReceived";
        case TRANSPORT_STATE_CHANGED: return "TransportStateChanged";
        default: return "Unknown";
    }
}

std::string EngineEvent::toString() const {
    char buf[512];
    switch (type) {
    case REGISTRATION_STATE_CHANGED:
        snprintf(buf, sizeof(buf), "%s %s@%s %s -> %s %s", typeName(type),
            user.c_str(), domain.c_str(), Registration::stateName(oldState),
            Registration::stateName(state), reason.c_str());
        break;
    case CALL_STATE_CHANGED:
        snprintf(buf, sizeof(buf), "%s %s %s -> %s (%s, %u ms) %s", typeName(type),
            callId.c_str(), CallDialog::stateName(oldState), CallDialog::stateName(state),
            CallDialog::endReasonName(endReason), (unsigned)durationMs, reason.c_str());
        break;
    case INCOMING_CALL:
        snprintf(buf, sizeof(buf), "%s %s from %s \"%s\" to %s@%s", typeName(type),
            callId.c_str(), callerNumber.c_str(), callerName.c_str(),
            user.c_str(), domain.c_str());
        break;
    case DTMF_RESULT:
        snprintf(buf, sizeof(buf), "%s %s %c %s", typeName(type), callId.c_str(),
            digit, success ? "OK" : "FAILED");
        break;
    case DTMF_RECEIVED:
        snprintf(buf, sizeof(buf), "%s %s %c %u ms", typeName(type), callId.c_str(),
            digit, (unsigned)durationMs);
        break;
    case TRANSPORT_STATE_CHANGED:
        snprintf(buf, sizeof(buf), "%s %s %s", typeName(type), up ? "UP" : "DOWN",
            reason.c_str());
        break;
    default:
        snprintf(buf, sizeof(buf), "%s", typeName(type));
        break;
    }
    return string(buf);
}

}

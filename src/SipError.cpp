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
#include "SipError.h"

namespace sipwire {

const char* errorName(int code) {
    switch (code) {
        case SIP_OK: return "OK";
        case SIP_ERR_MALFORMED_MESSAGE: return "MalformedMessage";
        case SIP_ERR_UNSUPPORTED_CHALLENGE: return "UnsupportedChallenge";
        case SIP_ERR_AUTHENTICATION_FAILED: return "AuthenticationFailed";
        case SIP_ERR_TRANSACTION_TIMEOUT: return "TransactionTimeout";
        case SIP_ERR_ILLEGAL_TRANSITION: return "IllegalTransition";
        case SIP_ERR_TRANSPORT_DOWN: return "TransportDown";
        case SIP_ERR_NO_CAPACITY: return "NoCapacity";
        case SIP_ERR_NOT_FOUND: return "NotFound";
        case SIP_ERR_INVALID_ARGUMENT: return "InvalidArgument";
        default: return "Unknown";
    }
}

}

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

namespace sipwire {

/**
 * Status codes returned throughout the engine. Zero is success and
 * everything else is negative.
 */
enum SipError {
    SIP_OK = 0,
    // Start-line unparsable, mandatory header missing, or bad Content-Length
    SIP_ERR_MALFORMED_MESSAGE = -1,
    // The algorithm/qop combination offered by the server isn't implemented
    SIP_ERR_UNSUPPORTED_CHALLENGE = -2,
    // Credentials were rejected after the one authenticated retry
    SIP_ERR_AUTHENTICATION_FAILED = -3,
    SIP_ERR_TRANSACTION_TIMEOUT = -4,
    // State machine misuse, or a duplicate/late network event
    SIP_ERR_ILLEGAL_TRANSITION = -5,
    SIP_ERR_TRANSPORT_DOWN = -6,
    SIP_ERR_NO_CAPACITY = -7,
    SIP_ERR_NOT_FOUND = -8,
    SIP_ERR_INVALID_ARGUMENT = -9
};

/**
 * @returns A printable name for one of the codes above.
 */
const char* errorName(int code);

}

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
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sipwire {

class Config {
public:

    struct Account {
        std::string username;
        std::string password;
        // Blank means the default domain
        std::string domain;
        std::string displayName;
    };

    Config() { }

    // ----- Transport --------------------------------------------------------

    std::string defaultDomain;
    // ws:// or wss://
    std::string webSocketUrl;
    std::string webSocketSubProtocol;
    std::string userAgent;
    unsigned pingIntervalMs = 0;
    // How long we wait for a pong (or any traffic) after a ping
    unsigned pongTimeoutMs = 0;
    unsigned webSocketConnectTimeoutMs = 0;
    unsigned reconnectDelayMs = 0;
    // The ceiling on the exponential backoff
    unsigned maxReconnectBackoffMs = 0;
    // Zero means keep trying forever
    unsigned maxReconnectAttempts = 0;
    bool exponentialBackoff = true;

    // ----- SIP --------------------------------------------------------------

    unsigned registrationExpiresSec = 0;
    unsigned registrationTimeoutMs = 0;
    unsigned transactionTimeoutMs = 0;
    // SIP-level retransmission, only needed for unreliable transports
    bool sipRetransmit = false;
    // Outbound calls that aren't answered in this time are cancelled
    unsigned callTimeoutMs = 0;
    // How long a call can survive without the signaling transport
    unsigned callTransportGraceMs = 0;
    // Added to every outbound request
    std::map<std::string, std::string> customSipHeaders;
    // Appended to the Contact URI
    std::map<std::string, std::string> customContactParams;

    std::vector<Account> accounts;
    bool trace = false;

    void setDefaults();

    nlohmann::json toJson() const;

    /**
     * Fields that are missing from the document keep their current
     * values.
     *
     * @returns 0 on success, -1 if the document has the wrong shape.
     */
    int fromJson(const nlohmann::json& j);
};

}

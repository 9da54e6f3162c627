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
#include "Config.h"

#ifndef SIPWIRE_VERSION
#define SIPWIRE_VERSION "1.0"
#endif

using namespace std;
using json = nlohmann::json;

namespace sipwire {

void Config::setDefaults() {
    defaultDomain = "";
    webSocketUrl = "";
    webSocketSubProtocol = "sip";
    userAgent = "sipwire/" SIPWIRE_VERSION;
    pingIntervalMs = 30 * 1000;
    pongTimeoutMs = 10 * 1000;
    webSocketConnectTimeoutMs = 5 * 1000;
    reconnectDelayMs = 2 * 1000;
    maxReconnectBackoffMs = 60 * 1000;
    maxReconnectAttempts = 0;
    exponentialBackoff = true;
    registrationExpiresSec = 3600;
    registrationTimeoutMs = 10 * 1000;
    transactionTimeoutMs = 32 * 1000;
    sipRetransmit = false;
    callTimeoutMs = 30 * 1000;
    callTransportGraceMs = 30 * 1000;
    customSipHeaders.clear();
    customContactParams.clear();
    accounts.clear();
    trace = false;
}

json Config::toJson() const {
    json o;
    o["defaultDomain"] = defaultDomain;
    o["webSocketUrl"] = webSocketUrl;
    o["webSocketSubProtocol"] = webSocketSubProtocol;
    o["userAgent"] = userAgent;
    o["pingIntervalMs"] = pingIntervalMs;
    o["pongTimeoutMs"] = pongTimeoutMs;
    o["webSocketConnectTimeoutMs"] = webSocketConnectTimeoutMs;
    o["reconnectDelayMs"] = reconnectDelayMs;
    o["maxReconnectBackoffMs"] = maxReconnectBackoffMs;
    o["maxReconnectAttempts"] = maxReconnectAttempts;
    o["exponentialBackoff"] = exponentialBackoff;
    o["registrationExpiresSec"] = registrationExpiresSec;
    o["registrationTimeoutMs"] = registrationTimeoutMs;
    o["transactionTimeoutMs"] = transactionTimeoutMs;
    o["sipRetransmit"] = sipRetransmit;
    o["callTimeoutMs"] = callTimeoutMs;
    o["callTransportGraceMs"] = callTransportGraceMs;
    o["customSipHeaders"] = customSipHeaders;
    o["customContactParams"] = customContactParams;
    json a = json::array();
    for (const Account& account : accounts) {
        json e;
        e["username"] = account.username;
        e["password"] = account.password;
        e["domain"] = account.domain;
        e["displayName"] = account.displayName;
        a.push_back(e);
    }
    o["accounts"] = a;
    o["trace"] = trace;
    return o;
}

int Config::fromJson(const json& o) {
    if (!o.is_object())
        return -1;
    try {
        defaultDomain = o.value("defaultDomain", defaultDomain);
        webSocketUrl = o.value("webSocketUrl", webSocketUrl);
        webSocketSubProtocol = o.value("webSocketSubProtocol", webSocketSubProtocol);
        userAgent = o.value("userAgent", userAgent);
        pingIntervalMs = o.value("pingIntervalMs", pingIntervalMs);
        pongTimeoutMs = o.value("pongTimeoutMs", pongTimeoutMs);
        webSocketConnectTimeoutMs = o.value("webSocketConnectTimeoutMs", webSocketConnectTimeoutMs);
        reconnectDelayMs = o.value("reconnectDelayMs", reconnectDelayMs);
        maxReconnectBackoffMs = o.value("maxReconnectBackoffMs", maxReconnectBackoffMs);
        maxReconnectAttempts = o.value("maxReconnectAttempts", maxReconnectAttempts);
        exponentialBackoff = o.value("exponentialBackoff", exponentialBackoff);
        registrationExpiresSec = o.value("registrationExpiresSec", registrationExpiresSec);
        registrationTimeoutMs = o.value("registrationTimeoutMs", registrationTimeoutMs);
        transactionTimeoutMs = o.value("transactionTimeoutMs", transactionTimeoutMs);
        sipRetransmit = o.value("sipRetransmit", sipRetransmit);
        callTimeoutMs = o.value("callTimeoutMs", callTimeoutMs);
        callTransportGraceMs = o.value("callTransportGraceMs", callTransportGraceMs);
        if (o.contains("customSipHeaders"))
            customSipHeaders = o["customSipHeaders"].get<map<string, string>>();
        if (o.contains("customContactParams"))
            customContactParams = o["customContactParams"].get<map<string, string>>();
        if (o.contains("accounts")) {
            accounts.clear();
            for (const json& e : o["accounts"]) {
                Account account;
                account.username = e.at("username").get<string>();
                account.password = e.value("password", string());
                account.domain = e.value("domain", string());
                account.displayName = e.value("displayName", string());
                accounts.push_back(account);
            }
        }
        trace = o.value("trace", trace);
    } catch (json::exception&) {
        return -1;
    }
    return 0;
}

}

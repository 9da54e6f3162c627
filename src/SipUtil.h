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

#include <string>
#include <vector>

namespace sipwire {

/**
 * The magic cookie that starts every RFC 3261 branch parameter.
 */
extern const char* BRANCH_COOKIE;

/**
 * The methods we are prepared to handle, in Allow header format.
 */
extern const char* ALLOWED_METHODS;

bool iequals(const std::string& a, const std::string& b);
bool iequals(const char* a, const char* b);

std::string trim(const std::string& s);

/**
 * Removes surrounding double quotes (if any) and un-escapes the content.
 */
std::string unquote(const std::string& s);

/**
 * Splits a header value on commas, ignoring commas that are inside of
 * double quotes or angle brackets. Each piece is trimmed.
 */
std::vector<std::string> splitList(const std::string& value);

/**
 * Pulls a parameter out of a header value like:
 *
 *   "Bob" <sip:bob@example.com>;tag=a6c85cf;expires=60
 *
 * Parameters inside of the angle brackets (i.e. URI parameters) are
 * not considered.
 *
 * @returns true if the parameter was present. A flag parameter with no
 * value (ex: ;lr) returns true with an empty value.
 */
bool getHeaderParam(const std::string& value, const char* name, std::string& result);

/**
 * Convenience version of the above that returns an empty string when
 * the parameter is missing.
 */
std::string getHeaderParam(const std::string& value, const char* name);

/**
 * @returns The URI part of a name-addr (inside of the brackets) or
 * addr-spec (up to the first header parameter).
 */
std::string extractUri(const std::string& nameAddr);

/**
 * @returns The quoted or token display name in front of a name-addr,
 * or an empty string.
 */
std::string extractDisplayName(const std::string& nameAddr);

/**
 * @returns The user part of a SIP URI (sip:user@host:port;params).
 */
std::string extractUser(const std::string& uri);

/**
 * @returns The host[:port] part of a SIP URI.
 */
std::string extractHost(const std::string& uri);

/**
 * Turns "bob", "bob@example.com" or "sip:bob@example.com" into a
 * full SIP URI, using the default domain when needed.
 */
std::string makeSipUri(const std::string& target, const std::string& defaultDomain);

/**
 * @returns A random string of lower-case hex digits.
 */
std::string randomHex(unsigned len);

std::string makeBranch();
std::string makeTag();
std::string makeCallId();

/**
 * @returns The standard reason phrase for a status code.
 */
const char* reasonPhrase(int code);

/**
 * Breaks down a URL like wss://sip.example.com:8443/ws.
 *
 * @returns 0 on success, -1 if the URL isn't a ws:// or wss:// URL.
 */
int parseWebSocketUrl(const std::string& url, bool& secure, std::string& host,
    std::string& port, std::string& path);

}

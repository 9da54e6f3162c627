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
#include <strings.h>
#include <cctype>
#include <random>

#include "SipUtil.h"

using namespace std;

namespace sipwire {

const char* BRANCH_COOKIE = "z9hG4bK";
const char* ALLOWED_METHODS = "INVITE, ACK, CANCEL, BYE, OPTIONS, INFO";

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && strcasecmp(a.c_str(), b.c_str()) == 0;
}

bool iequals(const char* a, const char* b) {
    return strcasecmp(a, b) == 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t'))
        start++;
    size_t end = s.size();
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
        s[end - 1] == '\r' || s[end - 1] == '\n'))
        end--;
    return s.substr(start, end - start);
}

std::string unquote(const std::string& s) {
    string t = trim(s);
    if (t.size() < 2 || t.front() != '"' || t.back() != '"')
        return t;
    string result;
    for (size_t i = 1; i < t.size() - 1; i++) {
        if (t[i] == '\\' && i + 1 < t.size() - 1)
            i++;
        result += t[i];
    }
    return result;
}

std::vector<std::string> splitList(const std::string& value) {
    vector<string> result;
    bool inQuote = false;
    int angle = 0;
    string current;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (inQuote) {
            current += c;
            if (c == '\\' && i + 1 < value.size())
                current += value[++i];
            else if (c == '"')
                inQuote = false;
        }
        else if (c == '"') {
            inQuote = true;
            current += c;
        }
        else if (c == '<') {
            angle++;
            current += c;
        }
        else if (c == '>') {
            if (angle > 0)
                angle--;
            current += c;
        }
        else if (c == ',' && angle == 0) {
            string t = trim(current);
            if (!t.empty())
                result.push_back(t);
            current.clear();
        }
        else {
            current += c;
        }
    }
    string t = trim(current);
    if (!t.empty())
        result.push_back(t);
    return result;
}

/**
 * @returns The position in the header value where the header parameters
 * start (i.e. the first semicolon that is outside of the URI), or npos.
 */
static size_t findParamStart(const std::string& value) {
    bool inQuote = false;
    bool inAngle = false;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (inQuote) {
            if (c == '\\')
                i++;
            else if (c == '"')
                inQuote = false;
        }
        else if (c == '"')
            inQuote = true;
        else if (c == '<')
            inAngle = true;
        else if (c == '>')
            inAngle = false;
        else if (c == ';' && !inAngle)
            return i;
    }
    return string::npos;
}

bool getHeaderParam(const std::string& value, const char* name, std::string& result) {

    size_t p = findParamStart(value);
    if (p == string::npos)
        return false;

    // Walk across the ;name=value pieces, paying attention to quoted
    // values that might contain semicolons.
    while (p < value.size()) {
        // Skip the semicolon
        p++;
        size_t end = p;
        bool inQuote = false;
        while (end < value.size()) {
            char c = value[end];
            if (inQuote) {
                if (c == '\\')
                    end++;
                else if (c == '"')
                    inQuote = false;
            }
            else if (c == '"')
                inQuote = true;
            else if (c == ';')
                break;
            end++;
        }
        string piece = value.substr(p, end - p);
        size_t eq = piece.find('=');
        string pName = trim(eq == string::npos ? piece : piece.substr(0, eq));
        if (iequals(pName, name)) {
            result = (eq == string::npos) ? string() : unquote(piece.substr(eq + 1));
            return true;
        }
        p = end;
    }
    return false;
}

std::string getHeaderParam(const std::string& value, const char* name) {
    string result;
    getHeaderParam(value, name, result);
    return result;
}

std::string extractUri(const std::string& nameAddr) {
    size_t lt = nameAddr.find('<');
    if (lt != string::npos) {
        size_t gt = nameAddr.find('>', lt);
        if (gt == string::npos)
            return trim(nameAddr.substr(lt + 1));
        return trim(nameAddr.substr(lt + 1, gt - lt - 1));
    }
    size_t p = findParamStart(nameAddr);
    return trim(p == string::npos ? nameAddr : nameAddr.substr(0, p));
}

std::string extractDisplayName(const std::string& nameAddr) {
    size_t lt = nameAddr.find('<');
    if (lt == string::npos)
        return string();
    return unquote(nameAddr.substr(0, lt));
}

static size_t skipScheme(const std::string& uri) {
    size_t colon = uri.find(':');
    if (colon == string::npos)
        return 0;
    string scheme = uri.substr(0, colon);
    if (iequals(scheme, "sip") || iequals(scheme, "sips") || iequals(scheme, "tel"))
        return colon + 1;
    return 0;
}

std::string extractUser(const std::string& uri) {
    size_t start = skipScheme(uri);
    size_t at = uri.find('@', start);
    if (at == string::npos) {
        // Things like tel:+15551234 have no host part
        if (start >= 4 && iequals(uri.substr(0, 4), "tel:")) {
            size_t semi = uri.find(';', start);
            return uri.substr(start, semi == string::npos ? string::npos : semi - start);
        }
        return string();
    }
    string user = uri.substr(start, at - start);
    // Drop any password
    size_t colon = user.find(':');
    if (colon != string::npos)
        user = user.substr(0, colon);
    return user;
}

std::string extractHost(const std::string& uri) {
    size_t start = skipScheme(uri);
    size_t at = uri.find('@', start);
    if (at != string::npos)
        start = at + 1;
    size_t end = uri.find_first_of(";?>", start);
    return uri.substr(start, end == string::npos ? string::npos : end - start);
}

std::string makeSipUri(const std::string& target, const std::string& defaultDomain) {
    string t = trim(target);
    if (skipScheme(t) > 0)
        return t;
    if (t.find('@') != string::npos)
        return "sip:" + t;
    return "sip:" + t + "@" + defaultDomain;
}

std::string randomHex(unsigned len) {
    static thread_local std::mt19937 gen(std::random_device{}());
    static const char* digits = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    string result;
    for (unsigned i = 0; i < len; i++)
        result += digits[dist(gen)];
    return result;
}

std::string makeBranch() {
    return string(BRANCH_COOKIE) + randomHex(16);
}

std::string makeTag() {
    return randomHex(10);
}

std::string makeCallId() {
    return randomHex(24);
}

const char* reasonPhrase(int code) {
    switch (code) {
        case 100: return "Trying";
        case 180: return "Ringing";
        case 181: return "Call Is Being Forwarded";
        case 182: return "Queued";
        case 183: return "Session Progress";
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 415: return "Unsupported Media Type";
        case 480: return "Temporarily Unavailable";
        case 481: return "Call/Transaction Does Not Exist";
        case 482: return "Loop Detected";
        case 486: return "Busy Here";
        case 487: return "Request Terminated";
        case 488: return "Not Acceptable Here";
        case 491: return "Request Pending";
        case 500: return "Server Internal Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 600: return "Busy Everywhere";
        case 603: return "Decline";
        default: return "Unknown";
    }
}

int parseWebSocketUrl(const std::string& url, bool& secure, std::string& host,
    std::string& port, std::string& path) {

    string rest;
    if (url.size() > 6 && iequals(url.substr(0, 6), "wss://")) {
        secure = true;
        rest = url.substr(6);
    } else if (url.size() > 5 && iequals(url.substr(0, 5), "ws://")) {
        secure = false;
        rest = url.substr(5);
    } else {
        return -1;
    }

    size_t slash = rest.find('/');
    string authority = rest.substr(0, slash);
    path = (slash == string::npos) ? "/" : rest.substr(slash);

    // IPv6 literal, ex: [::1]:8080
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == string::npos)
            return -1;
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            port = authority.substr(close + 2);
        else
            port.clear();
    } else {
        size_t colon = authority.find(':');
        host = authority.substr(0, colon);
        port = (colon == string::npos) ? string() : authority.substr(colon + 1);
    }

    if (host.empty())
        return -1;
    if (port.empty())
        port = secure ? "443" : "80";
    for (char c : port)
        if (!isdigit((unsigned char)c))
            return -1;
    return 0;
}

}

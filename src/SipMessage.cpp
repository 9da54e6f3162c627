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
#include <cctype>
#include <cstdlib>
#include <cstring>

#include "SipError.h"
#include "SipUtil.h"
#include "SipMessage.h"

using namespace std;

namespace sipwire {

// Compact forms from RFC 3261 section 7.3.3 and later extensions
static const char* COMPACT_FORMS[][2] = {
    { "i", "Call-ID" },
    { "m", "Contact" },
    { "e", "Content-Encoding" },
    { "l", "Content-Length" },
    { "c", "Content-Type" },
    { "f", "From" },
    { "s", "Subject" },
    { "k", "Supported" },
    { "t", "To" },
    { "v", "Via" },
    { "o", "Event" },
    { "r", "Refer-To" },
    { "u", "Allow-Events" },
    { 0, 0 }
};

static const char* WELL_KNOWN[] = {
    "Accept", "Allow", "Allow-Events", "Authorization", "Call-ID", "Contact",
    "Content-Encoding", "Content-Length", "Content-Type", "CSeq", "Event",
    "Expires", "From", "Max-Forwards", "Min-Expires", "Proxy-Authenticate",
    "Proxy-Authorization", "Proxy-Require", "Reason", "Record-Route", "Refer-To",
    "Require", "Route", "Server", "Subject", "Supported", "To", "Unsupported",
    "User-Agent", "Via", "WWW-Authenticate", 0
};

static const char* LIST_HEADERS[] = {
    "Via", "Route", "Record-Route", "Contact", "Allow", "Supported", "Require",
    "Proxy-Require", "Unsupported", "Accept", "Allow-Events", 0
};

// These are written one value per line since some servers don't
// like to see them combined.
static bool isOnePerLine(const std::string& name) {
    return iequals(name, "Via") || iequals(name, "Route") ||
        iequals(name, "Record-Route") || iequals(name, "Contact");
}

static bool isToken(const std::string& s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!isalnum((unsigned char)c) && strchr("-.!%*_+`'~", c) == 0)
            return false;
    }
    return true;
}

static bool isDigits(const std::string& s) {
    if (s.empty())
        return false;
    for (char c : s)
        if (!isdigit((unsigned char)c))
            return false;
    return true;
}

SipMessage::SipMessage() {
}

SipMessage SipMessage::makeRequest(const char* method, const std::string& requestUri) {
    SipMessage m;
    m._request = true;
    m._method = method;
    m._requestUri = requestUri;
    return m;
}

SipMessage SipMessage::makeResponse(int code, const char* reason) {
    SipMessage m;
    m._request = false;
    m._statusCode = code;
    m._reason = reason ? reason : reasonPhrase(code);
    return m;
}

SipMessage SipMessage::responseTo(const SipMessage& req, int code,
    const char* reason, const std::string& toTag) {

    SipMessage m = makeResponse(code, reason);
    for (const string& via : req.getHeaderValues("Via"))
        m.addHeader("Via", via);
    // Record-Route is echoed on dialog-creating responses
    if (req.isMethod("INVITE") && code > 100 && code < 300) {
        for (const string& rr : req.getHeaderValues("Record-Route"))
            m.addHeader("Record-Route", rr);
    }
    m.addHeader("From", req.getHeader("From"));
    string to = req.getHeader("To");
    if (!toTag.empty() && req.getToTag().empty() && code > 100)
        to += ";tag=" + toTag;
    m.addHeader("To", to);
    m.addHeader("Call-ID", req.getCallId());
    m.addHeader("CSeq", req.getHeader("CSeq"));
    return m;
}

void SipMessage::clear() {
    _request = true;
    _method.clear();
    _requestUri.clear();
    _statusCode = 0;
    _reason.clear();
    _headers.clear();
    _body.clear();
}

bool SipMessage::isMethod(const char* method) const {
    return _request ? (_method == method) : (getCSeqMethod() == method);
}

std::string SipMessage::canonicalName(const std::string& name) {
    string n = trim(name);
    if (n.size() == 1) {
        for (unsigned i = 0; COMPACT_FORMS[i][0]; i++)
            if (iequals(n.c_str(), COMPACT_FORMS[i][0]))
                return COMPACT_FORMS[i][1];
    }
    for (unsigned i = 0; WELL_KNOWN[i]; i++)
        if (iequals(n.c_str(), WELL_KNOWN[i]))
            return WELL_KNOWN[i];
    return n;
}

bool SipMessage::isListHeader(const std::string& name) {
    for (unsigned i = 0; LIST_HEADERS[i]; i++)
        if (iequals(name.c_str(), LIST_HEADERS[i]))
            return true;
    return false;
}

int SipMessage::_parseStartLine(const std::string& line) {

    if (line.size() > 8 && iequals(line.substr(0, 8), "SIP/2.0 ")) {
        // Status-Line = SIP-Version SP Status-Code SP Reason-Phrase
        _request = false;
        string rest = line.substr(8);
        string code = rest.substr(0, 3);
        if (!isDigits(code) || code.size() != 3)
            return SIP_ERR_MALFORMED_MESSAGE;
        if (rest.size() > 3 && rest[3] != ' ')
            return SIP_ERR_MALFORMED_MESSAGE;
        _statusCode = atoi(code.c_str());
        if (_statusCode < 100 || _statusCode > 699)
            return SIP_ERR_MALFORMED_MESSAGE;
        _reason = (rest.size() > 4) ? trim(rest.substr(4)) : string();
        return SIP_OK;
    }

    // Request-Line = Method SP Request-URI SP SIP-Version
    size_t sp1 = line.find(' ');
    if (sp1 == string::npos)
        return SIP_ERR_MALFORMED_MESSAGE;
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == string::npos)
        return SIP_ERR_MALFORMED_MESSAGE;
    _request = true;
    _method = line.substr(0, sp1);
    _requestUri = line.substr(sp1 + 1, sp2 - sp1 - 1);
    string version = trim(line.substr(sp2 + 1));
    if (!isToken(_method) || _requestUri.empty() || !iequals(version, "SIP/2.0"))
        return SIP_ERR_MALFORMED_MESSAGE;
    return SIP_OK;
}

int SipMessage::parse(const char* text, unsigned len) {

    clear();
    string all(text, len);

    // Locate the end of the header section. Bare LF is tolerated.
    size_t sepPos = all.find("\r\n\r\n");
    size_t sepLen = 4;
    if (sepPos == string::npos) {
        sepPos = all.find("\n\n");
        sepLen = 2;
    }
    string head;
    string rest;
    if (sepPos == string::npos) {
        head = all;
    } else {
        head = all.substr(0, sepPos);
        rest = all.substr(sepPos + sepLen);
    }

    // Break the header section into lines, unfolding continuations
    vector<string> lines;
    size_t p = 0;
    while (p <= head.size()) {
        size_t eol = head.find('\n', p);
        string line = head.substr(p, eol == string::npos ? string::npos : eol - p);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty() && (line[0] == ' ' || line[0] == '\t')) {
            // A continuation line can't be the first thing (i.e. before/on the
            // start-line or the first header).
            if (lines.size() < 2)
                return SIP_ERR_MALFORMED_MESSAGE;
            lines.back() += " " + trim(line);
        } else if (!line.empty()) {
            lines.push_back(line);
        }
        if (eol == string::npos)
            break;
        p = eol + 1;
    }

    if (lines.empty())
        return SIP_ERR_MALFORMED_MESSAGE;
    if (_parseStartLine(lines[0]) != SIP_OK)
        return SIP_ERR_MALFORMED_MESSAGE;

    bool haveContentLength = false;
    unsigned long contentLength = 0;

    for (unsigned i = 1; i < lines.size(); i++) {
        size_t colon = lines[i].find(':');
        if (colon == string::npos)
            return SIP_ERR_MALFORMED_MESSAGE;
        string name = canonicalName(lines[i].substr(0, colon));
        string value = trim(lines[i].substr(colon + 1));
        if (!isToken(name))
            return SIP_ERR_MALFORMED_MESSAGE;
        if (name == "Content-Length") {
            if (!isDigits(value))
                return SIP_ERR_MALFORMED_MESSAGE;
            haveContentLength = true;
            contentLength = strtoul(value.c_str(), 0, 10);
            // Computed on the way out
            continue;
        }
        addHeader(name.c_str(), value);
    }

    if (haveContentLength) {
        if (contentLength != rest.size())
            return SIP_ERR_MALFORMED_MESSAGE;
    }
    _body = rest;

    // Mandatory headers
    if (!hasHeader("Call-ID") || !hasHeader("CSeq") ||
        !hasHeader("From") || !hasHeader("To"))
        return SIP_ERR_MALFORMED_MESSAGE;
    if (_request && !hasHeader("Via"))
        return SIP_ERR_MALFORMED_MESSAGE;

    // CSeq = 1*DIGIT LWS Method
    string cseq = getHeader("CSeq");
    size_t sp = cseq.find_first_of(" \t");
    if (sp == string::npos)
        return SIP_ERR_MALFORMED_MESSAGE;
    string num = cseq.substr(0, sp);
    string method = trim(cseq.substr(sp + 1));
    if (!isDigits(num) || num.size() > 10 || !isToken(method))
        return SIP_ERR_MALFORMED_MESSAGE;
    if (_request && method != _method)
        return SIP_ERR_MALFORMED_MESSAGE;

    return SIP_OK;
}

void SipMessage::_writeHeader(std::string& out, const Header& h) const {
    if (isOnePerLine(h.name)) {
        for (const string& v : h.values) {
            out += h.name;
            out += ": ";
            out += v;
            out += "\r\n";
        }
    } else if (isListHeader(h.name)) {
        out += h.name;
        out += ": ";
        for (unsigned i = 0; i < h.values.size(); i++) {
            if (i > 0)
                out += ", ";
            out += h.values[i];
        }
        out += "\r\n";
    } else {
        out += h.name;
        out += ": ";
        out += h.values.empty() ? string() : h.values[0];
        out += "\r\n";
    }
}

std::string SipMessage::build() const {

    string out;
    if (_request) {
        out = _method + " " + _requestUri + " SIP/2.0\r\n";
    } else {
        out = "SIP/2.0 " + to_string(_statusCode) + " " + _reason + "\r\n";
    }

    // Routing headers go first
    static const char* FIRST[] = { "Via", "Route", "Record-Route", 0 };
    for (unsigned i = 0; FIRST[i]; i++) {
        for (const Header& h : _headers)
            if (iequals(h.name.c_str(), FIRST[i]))
                _writeHeader(out, h);
    }
    for (const Header& h : _headers) {
        bool done = false;
        for (unsigned i = 0; FIRST[i]; i++)
            if (iequals(h.name.c_str(), FIRST[i]))
                done = true;
        if (!done)
            _writeHeader(out, h);
    }

    out += "Content-Length: " + to_string(_body.size()) + "\r\n";
    out += "\r\n";
    out += _body;
    return out;
}

bool SipMessage::hasHeader(const char* name) const {
    string cn = canonicalName(name);
    for (const Header& h : _headers)
        if (iequals(h.name, cn) && !h.values.empty())
            return true;
    return false;
}

std::string SipMessage::getHeader(const char* name) const {
    string cn = canonicalName(name);
    for (const Header& h : _headers)
        if (iequals(h.name, cn) && !h.values.empty())
            return h.values[0];
    return string();
}

std::vector<std::string> SipMessage::getHeaderValues(const char* name) const {
    string cn = canonicalName(name);
    vector<string> result;
    for (const Header& h : _headers)
        if (iequals(h.name, cn))
            result.insert(result.end(), h.values.begin(), h.values.end());
    return result;
}

void SipMessage::addHeader(const char* name, const std::string& value) {
    string cn = canonicalName(name);
    if (isListHeader(cn)) {
        vector<string> pieces = splitList(value);
        if (pieces.empty())
            return;
        for (Header& h : _headers) {
            if (iequals(h.name, cn)) {
                h.values.insert(h.values.end(), pieces.begin(), pieces.end());
                return;
            }
        }
        _headers.push_back({ cn, pieces });
    } else {
        _headers.push_back({ cn, { trim(value) } });
    }
}

void SipMessage::setHeader(const char* name, const std::string& value) {
    removeHeader(name);
    addHeader(name, value);
}

void SipMessage::removeHeader(const char* name) {
    string cn = canonicalName(name);
    for (auto it = _headers.begin(); it != _headers.end(); ) {
        if (iequals(it->name, cn))
            it = _headers.erase(it);
        else
            it++;
    }
}

void SipMessage::setBody(const std::string& contentType, const std::string& body) {
    _body = body;
    if (body.empty())
        removeHeader("Content-Type");
    else
        setHeader("Content-Type", contentType);
}

unsigned SipMessage::getCSeqNumber() const {
    return strtoul(getHeader("CSeq").c_str(), 0, 10);
}

std::string SipMessage::getCSeqMethod() const {
    string cseq = getHeader("CSeq");
    size_t sp = cseq.find_first_of(" \t");
    if (sp == string::npos)
        return string();
    return trim(cseq.substr(sp + 1));
}

std::string SipMessage::getBranch() const {
    return getHeaderParam(getTopVia(), "branch");
}

std::string SipMessage::getFromTag() const {
    return getHeaderParam(getHeader("From"), "tag");
}

std::string SipMessage::getToTag() const {
    return getHeaderParam(getHeader("To"), "tag");
}

bool SipMessage::isEquivalent(const SipMessage& other) const {

    if (_request != other._request)
        return false;
    if (_request) {
        if (_method != other._method || _requestUri != other._requestUri)
            return false;
    } else {
        if (_statusCode != other._statusCode || _reason != other._reason)
            return false;
    }
    if (_body != other._body)
        return false;

    // Every name on either side must carry the same values
    for (int pass = 0; pass < 2; pass++) {
        const SipMessage& a = (pass == 0) ? *this : other;
        const SipMessage& b = (pass == 0) ? other : *this;
        for (const Header& h : a._headers) {
            vector<string> va = a.getHeaderValues(h.name.c_str());
            vector<string> vb = b.getHeaderValues(h.name.c_str());
            if (va.size() != vb.size())
                return false;
            for (unsigned i = 0; i < va.size(); i++)
                if (trim(va[i]) != trim(vb[i]))
                    return false;
        }
    }
    return true;
}

}

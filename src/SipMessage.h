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
 * A structured SIP request or response. This is also the codec: parse()
 * turns the text of one WebSocket frame into a message and build()
 * turns a message back into text that is ready to go onto the wire.
 *
 * Header names are case-insensitive and compact forms (ex: "v" for Via)
 * are expanded on the way in. Headers that are declared as list-type
 * (Via, Route, Contact, etc.) are collapsed into one multi-valued entry,
 * all other headers keep one entry per occurrence.
 */
class SipMessage {
public:

    struct Header {
        std::string name;
        std::vector<std::string> values;
    };

    SipMessage();

    static SipMessage makeRequest(const char* method, const std::string& requestUri);
    static SipMessage makeResponse(int code, const char* reason = 0);

    /**
     * Creates a response to the request provided, copying the Via, From,
     * To, Call-ID and CSeq headers across (RFC 3261 section 8.2.6).
     *
     * @param toTag If not empty, and if the To header of the request
     * doesn't already have a tag, this tag is added.
     */
    static SipMessage responseTo(const SipMessage& req, int code,
        const char* reason = 0, const std::string& toTag = std::string());

    /**
     * Parses the text of a complete SIP message. The message is
     * cleared first.
     *
     * @returns SIP_OK or SIP_ERR_MALFORMED_MESSAGE.
     */
    int parse(const char* text, unsigned len);
    int parse(const std::string& text) { return parse(text.c_str(), text.size()); }

    /**
     * Produces the wire format. The Via headers are written first, then
     * Route/Record-Route, then everything else in insertion order. The
     * Content-Length is always computed from the body.
     */
    std::string build() const;

    void clear();

    bool isRequest() const { return _request; }
    bool isResponse() const { return !_request; }
    bool isMethod(const char* method) const;

    const std::string& getMethod() const { return _method; }
    const std::string& getRequestUri() const { return _requestUri; }
    void setRequestUri(const std::string& uri) { _requestUri = uri; }
    int getStatusCode() const { return _statusCode; }
    const std::string& getReason() const { return _reason; }

    bool isProvisional() const { return !_request && _statusCode < 200; }
    bool isSuccess() const { return !_request && _statusCode >= 200 && _statusCode < 300; }

    bool hasHeader(const char* name) const;

    /**
     * @returns The first value of the named header, or an empty string.
     */
    std::string getHeader(const char* name) const;

    /**
     * @returns All values of the named header, in order, across all
     * occurrences.
     */
    std::vector<std::string> getHeaderValues(const char* name) const;

    /**
     * Adds a header value. List-type values are split on commas and
     * merged into the existing entry for that header, if any.
     */
    void addHeader(const char* name, const std::string& value);

    /**
     * Replaces all occurrences of the named header with a single value.
     */
    void setHeader(const char* name, const std::string& value);

    void removeHeader(const char* name);

    const std::vector<Header>& getHeaders() const { return _headers; }

    void setBody(const std::string& contentType, const std::string& body);
    const std::string& getBody() const { return _body; }
    std::string getContentType() const { return getHeader("Content-Type"); }

    std::string getCallId() const { return getHeader("Call-ID"); }
    unsigned getCSeqNumber() const;
    std::string getCSeqMethod() const;
    std::string getTopVia() const { return getHeader("Via"); }
    std::string getBranch() const;
    std::string getFromTag() const;
    std::string getToTag() const;

    /**
     * Semantic comparison: same start-line, the same values for every
     * header name (in order per name) and the same body. Whitespace around
     * values and the case of header names are not significant.
     */
    bool isEquivalent(const SipMessage& other) const;

    /**
     * Expands compact forms and normalizes the case of well-known names.
     */
    static std::string canonicalName(const std::string& name);

    static bool isListHeader(const std::string& name);

private:

    int _parseStartLine(const std::string& line);
    void _writeHeader(std::string& out, const Header& h) const;

    bool _request = true;
    std::string _method;
    std::string _requestUri;
    int _statusCode = 0;
    std::string _reason;
    std::vector<Header> _headers;
    std::string _body;
};

}

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

namespace sipwire {

/**
 * Something that happened on a WebSocketChannel.
 */
struct ChannelEvent {

    enum Type {
        NONE,
        // The connection (TCP + TLS + WebSocket handshake) is up
        OPENED,
        // A complete text frame was received
        TEXT,
        // A pong was received
        PONG,
        // The connection was closed by either end
        CLOSED,
        // An attempt to connect failed, or an established connection broke
        FAILURE
    };

    Type type = Type::NONE;
    std::string data;
};

/**
 * An abstract interface of a WebSocket client connection. This is the
 * boundary between the signaling engine and the socket library, so it is
 * kept as simple as possible: everything that happens on the connection
 * comes back as a ChannelEvent through pollEvent().
 *
 * Implementations are free to do their I/O on another thread. The
 * methods here are all called from the engine thread.
 */
class WebSocketChannel {
public:

    virtual ~WebSocketChannel() { }

    /**
     * Starts connecting. The result comes back later as an OPENED or
     * FAILURE event.
     *
     * @param url ws:// or wss://
     * @param subProtocol The Sec-WebSocket-Protocol to ask for (ex: "sip")
     * @returns 0 if the attempt was started, -1 if the URL is bad.
     */
    virtual int open(const std::string& url, const std::string& subProtocol,
        const std::string& userAgent, unsigned connectTimeoutMs) = 0;

    /**
     * Closes the connection (if any). No further events are generated
     * for the connection being closed.
     */
    virtual void close() = 0;

    /**
     * Queues one complete text frame.
     */
    virtual void sendText(const std::string& text) = 0;

    virtual void sendPing() = 0;

    /**
     * @returns true if an event was returned.
     */
    virtual bool pollEvent(ChannelEvent& event) = 0;

    /**
     * @returns A file descriptor that becomes readable when events are
     * waiting, or -1 if the implementation doesn't provide one.
     */
    virtual int getWakeFd() const { return -1; }
};

}

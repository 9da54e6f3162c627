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

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ssl/context.hpp>

#include "kc1fsz-tools/threadsafequeue.h"

#include "sipwire/WebSocketChannel.h"

namespace kc1fsz {
    class Log;
}

namespace sipwire {

class WebSocketSession;

/**
 * WebSocketChannel on top of Boost.Beast. Handles ws:// and wss://
 * (TLS with SNI and certificate verification against the system trust
 * store).
 *
 * All of the socket work happens on a private I/O thread. Events are
 * passed back to the engine thread through a thread-safe queue and an
 * eventfd is signalled so that a poll() loop wakes up.
 */
class BeastWebSocketChannel : public WebSocketChannel {
public:

    BeastWebSocketChannel(kc1fsz::Log& log);
    virtual ~BeastWebSocketChannel();

    virtual int open(const std::string& url, const std::string& subProtocol,
        const std::string& userAgent, unsigned connectTimeoutMs);
    virtual void close();
    virtual void sendText(const std::string& text);
    virtual void sendPing();
    virtual bool pollEvent(ChannelEvent& event);
    virtual int getWakeFd() const { return _wakeFd; }

    /**
     * Turns off certificate verification for wss://. Only useful for
     * testing against a server with a self-signed certificate.
     */
    void setInsecure(bool insecure) { _insecure = insecure; }

private:

    struct TaggedEvent {
        unsigned generation = 0;
        ChannelEvent event;
    };

    void _push(unsigned generation, ChannelEvent::Type type, const std::string& data);

    kc1fsz::Log& _log;
    boost::asio::io_context _ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
    boost::asio::ssl::context _sslCtx;
    std::thread _thread;
    bool _insecure = false;

    std::shared_ptr<WebSocketSession> _session;
    // Bumped on every open/close so that late events from a connection
    // that has been abandoned are recognized and dropped.
    std::atomic<unsigned> _generation;
    kc1fsz::threadsafequeue<TaggedEvent> _events;
    int _wakeFd = -1;
};

}

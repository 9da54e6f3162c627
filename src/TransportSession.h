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
#include <string>
#include <queue>

#include "sipwire/WebSocketChannel.h"

namespace kc1fsz {
    class Log;
    class Clock;
}

namespace sipwire {

class Config;

/**
 * Keeps one logical WebSocket connection to the SIP server alive. Each
 * SIP message travels as one text frame (RFC 7118).
 *
 * Keepalive: a ping goes out every ping interval. If nothing at all
 * (pong or traffic) comes back within the pong timeout the connection
 * is considered dead.
 *
 * Reconnection: whenever the connection is lost (or an attempt fails)
 * another attempt is scheduled after a delay that doubles each time,
 * up to a ceiling. An outage is reported to the listener exactly once,
 * no matter how many attempts it takes to get back.
 */
class TransportSession {
public:

    enum State {
        STATE_DISCONNECTED,
        STATE_CONNECTING,
        STATE_CONNECTED,
        STATE_WAITING_RECONNECT,
        STATE_FAILED
    };

    // Messages produced while the connection is down wait here
    static const unsigned MAX_QUEUE = 64;
    // The longest wait between reconnect attempts, whatever the configuration says
    static const uint32_t MAX_RECONNECT_DELAY_MS = 60 * 60 * 1000;

    static const char* stateName(int state);

    class Listener {
    public:
        virtual ~Listener() { }
        /**
         * @param reconnected true if this isn't the first connection.
         */
        virtual void transportUp(bool reconnected) = 0;
        virtual void transportDown(const std::string& reason) = 0;
        virtual void frameReceived(const std::string& frame) = 0;
    };

    TransportSession(kc1fsz::Log& log, kc1fsz::Clock& clock, WebSocketChannel& channel);

    void setListener(Listener* listener) { _listener = listener; }

    /**
     * Takes the URL, keepalive and reconnect settings. Takes effect
     * on the next connection attempt.
     */
    void configure(const Config& config);

    /**
     * Starts the first connection attempt.
     */
    int start();

    /**
     * Closes the connection and stops reconnecting. If the connection
     * was up the listener hears about it.
     */
    void stop();

    /**
     * Drops whatever connection there is and starts a new attempt right
     * away with the failure count cleared. Works from any state, including
     * Failed after giving up.
     */
    int reconnect();

    /**
     * Sends a frame, or queues it if the connection isn't up.
     *
     * @returns 0 or SIP_ERR_NO_CAPACITY if the queue is full.
     */
    int send(const std::string& frame);

    /**
     * Processes channel events and timers.
     *
     * @returns true if anything happened.
     */
    bool poll();

    State getState() const { return _state; }
    bool isConnected() const { return _state == STATE_CONNECTED; }
    unsigned getQueueDepth() const { return _queue.size(); }
    unsigned getFailureCount() const { return _failures; }
    unsigned getConnectCount() const { return _connectCount; }
    uint32_t getNextAttemptMs() const { return _nextAttemptMs; }
    int getWakeFd() const { return _channel.getWakeFd(); }

    /**
     * @returns The delay in front of the reconnect attempt that follows
     * the given number of consecutive failures.
     */
    uint32_t getReconnectDelayMs(unsigned failures) const;

private:

    void _connect();
    void _opened();
    void _lost(const std::string& reason);
    void _setState(State s);

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    WebSocketChannel& _channel;
    Listener* _listener = 0;

    std::string _url;
    std::string _subProtocol;
    std::string _userAgent;
    unsigned _pingIntervalMs = 30000;
    unsigned _pongTimeoutMs = 10000;
    unsigned _connectTimeoutMs = 5000;
    unsigned _reconnectDelayMs = 2000;
    unsigned _maxBackoffMs = 60000;
    unsigned _maxAttempts = 0;
    bool _exponential = true;

    State _state = State::STATE_DISCONNECTED;
    bool _stopped = true;
    bool _everConnected = false;
    bool _downReported = false;
    unsigned _failures = 0;
    unsigned _connectCount = 0;

    uint32_t _connectDeadlineMs = 0;
    uint32_t _nextAttemptMs = 0;
    uint32_t _nextPingMs = 0;
    bool _pingOutstanding = false;
    uint32_t _pongDeadlineMs = 0;

    std::queue<std::string> _queue;
};

}

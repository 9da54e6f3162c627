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
#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "SipError.h"
#include "Config.h"
#include "TransportSession.h"

using namespace std;

namespace sipwire {

const char* TransportSession::stateName(int state) {
    switch (state) {
        case STATE_DISCONNECTED: return "Disconnected";
        case STATE_CONNECTING: return "Connecting";
        case STATE_CONNECTED: return "Connected";
        case STATE_WAITING_RECONNECT: return "WaitingReconnect";
        case STATE_FAILED: return "Failed";
        default: return "Unknown";
    }
}

TransportSession::TransportSession(kc1fsz::Log& log, kc1fsz::Clock& clock,
    WebSocketChannel& channel)
:   _log(log),
    _clock(clock),
    _channel(channel) {
}

void TransportSession::configure(const Config& config) {
    _url = config.webSocketUrl;
    _subProtocol = config.webSocketSubProtocol;
    _userAgent = config.userAgent;
    _pingIntervalMs = config.pingIntervalMs;
    _pongTimeoutMs = config.pongTimeoutMs;
    _connectTimeoutMs = config.webSocketConnectTimeoutMs;
    _reconnectDelayMs = config.reconnectDelayMs;
    _maxBackoffMs = config.maxReconnectBackoffMs;
    _maxAttempts = config.maxReconnectAttempts;
    _exponential = config.exponentialBackoff;
}

int TransportSession::start() {
    if (_state == STATE_CONNECTING || _state == STATE_CONNECTED)
        return SIP_ERR_ILLEGAL_TRANSITION;
    _stopped = false;
    _failures = 0;
    _downReported = false;
    _connect();
    return _state == STATE_FAILED ? SIP_ERR_INVALID_ARGUMENT : SIP_OK;
}

void TransportSession::stop() {
    _stopped = true;
    // An established connection going away is a loss like any other
    if (_state == STATE_CONNECTED) {
        _lost("Transport stopped");
        return;
    }
    _channel.close();
    _pingOutstanding = false;
    _setState(STATE_DISCONNECTED);
}

int TransportSession::reconnect() {

    _log.info("Forced reconnect (state %s)", stateName(_state));

    if (_state == STATE_CONNECTED) {
        _channel.close();
        _pingOutstanding = false;
        _queue = std::queue<std::string>();
        if (!_downReported) {
            _downReported = true;
            if (_listener)
                _listener->transportDown("Forced reconnect");
        }
    }
    else if (_state == STATE_CONNECTING) {
        _channel.close();
    }

    _stopped = false;
    _failures = 0;
    _connect();
    return _state == STATE_FAILED ? SIP_ERR_INVALID_ARGUMENT : SIP_OK;
}

int TransportSession::send(const std::string& frame) {
    if (_state == STATE_CONNECTED) {
        _channel.sendText(frame);
        return SIP_OK;
    }
    if (_queue.size() >= MAX_QUEUE) {
        _log.error("Transport queue full, message dropped");
        return SIP_ERR_NO_CAPACITY;
    }
    _queue.push(frame);
    return SIP_OK;
}

uint32_t TransportSession::getReconnectDelayMs(unsigned failures) const {
    // No configured ceiling still means a finite one
    uint32_t ceiling = MAX_RECONNECT_DELAY_MS;
    if (_maxBackoffMs && _maxBackoffMs < ceiling)
        ceiling = _maxBackoffMs;
    uint32_t delay = _reconnectDelayMs;
    if (_exponential) {
        for (unsigned i = 1; i < failures && delay < ceiling; i++)
            delay *= 2;
    }
    if (delay > ceiling)
        delay = ceiling;
    return delay;
}

bool TransportSession::poll() {

    bool worked = false;

    ChannelEvent ev;
    while (_channel.pollEvent(ev)) {
        worked = true;
        if (ev.type == ChannelEvent::OPENED) {
            if (_state == STATE_CONNECTING)
                _opened();
        }
        else if (ev.type == ChannelEvent::TEXT) {
            if (_state == STATE_CONNECTED) {
                _pingOutstanding = false;
                _nextPingMs = _clock.time() + _pingIntervalMs;
                if (_listener)
                    _listener->frameReceived(ev.data);
            }
        }
        else if (ev.type == ChannelEvent::PONG) {
            _pingOutstanding = false;
            _nextPingMs = _clock.time() + _pingIntervalMs;
        }
        else if (ev.type == ChannelEvent::CLOSED || ev.type == ChannelEvent::FAILURE) {
            if (_state == STATE_CONNECTING || _state == STATE_CONNECTED)
                _lost(ev.data.empty() ? "Connection closed" : ev.data);
        }
    }

    if (_state == STATE_CONNECTING && _clock.isPast(_connectDeadlineMs)) {
        _log.info("WebSocket connect timeout");
        _lost("Connect timeout");
        worked = true;
    }
    else if (_state == STATE_CONNECTED && _pingIntervalMs) {
        if (_pingOutstanding) {
            if (_clock.isPast(_pongDeadlineMs)) {
                _log.info("No response to ping");
                _lost("Keepalive timeout");
                worked = true;
            }
        }
        else if (_clock.isPast(_nextPingMs)) {
            _channel.sendPing();
            _pingOutstanding = true;
            _pongDeadlineMs = _clock.time() + _pongTimeoutMs;
        }
    }
    else if (_state == STATE_WAITING_RECONNECT && _clock.isPast(_nextAttemptMs)) {
        _connect();
        worked = true;
    }

    return worked;
}

void TransportSession::_connect() {
    _log.info("Connecting to %s (failures %u)", _url.c_str(), _failures);
    _setState(STATE_CONNECTING);
    _connectDeadlineMs = _clock.time() + _connectTimeoutMs;
    if (_channel.open(_url, _subProtocol, _userAgent, _connectTimeoutMs) != 0) {
        _log.error("Invalid WebSocket URL %s", _url.c_str());
        _stopped = true;
        _setState(STATE_FAILED);
    }
}

void TransportSession::_opened() {

    const bool reconnected = _everConnected;
    _everConnected = true;
    _downReported = false;
    _failures = 0;
    _connectCount++;
    _pingOutstanding = false;
    _nextPingMs = _clock.time() + _pingIntervalMs;
    _setState(STATE_CONNECTED);

    if (!_queue.empty())
        _log.info("Sending %u queued messages", (unsigned)_queue.size());
    while (!_queue.empty()) {
        _channel.sendText(_queue.front());
        _queue.pop();
    }

    if (_listener)
        _listener->transportUp(reconnected);
}

void TransportSession::_lost(const std::string& reason) {

    const bool wasConnected = _state == STATE_CONNECTED;
    _channel.close();
    _pingOutstanding = false;
    _failures++;

    // Anything queued for the old connection is stale, the state
    // machines will produce fresh requests after the reconnect.
    if (wasConnected)
        _queue = std::queue<std::string>();

    _log.error("WebSocket down: %s", reason.c_str());

    if (_stopped) {
        _setState(STATE_DISCONNECTED);
    } else if (_maxAttempts && _failures > _maxAttempts) {
        _log.error("Giving up after %u attempts", _maxAttempts);
        _setState(STATE_FAILED);
    } else {
        uint32_t delay = getReconnectDelayMs(_failures);
        _nextAttemptMs = _clock.time() + delay;
        _log.info("Reconnect in %u ms", delay);
        _setState(STATE_WAITING_RECONNECT);
    }

    if (!_downReported) {
        _downReported = true;
        if (_listener)
            _listener->transportDown(reason);
    }
}

void TransportSession::_setState(State s) {
    if (s == _state)
        return;
    _log.info("Transport %s -> %s", stateName(_state), stateName(s));
    _state = s;
}

}

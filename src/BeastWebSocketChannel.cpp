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
#include <sys/eventfd.h>
#include <unistd.h>
#include <errno.h>

#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <type_traits>

#include <boost/asio/strand.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "kc1fsz-tools/Log.h"

#include "SipUtil.h"
#include "ThreadUtil.h"
#include "BeastWebSocketChannel.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using namespace std;

namespace sipwire {

typedef std::function<void(ChannelEvent::Type type, const std::string& data)> EventSink;

/**
 * One connection attempt (and the connection that results, if any).
 * Everything runs on the strand, the public methods just post work
 * onto it.
 */
class WebSocketSession {
public:
    virtual ~WebSocketSession() { }
    virtual void start(const std::string& host, const std::string& port,
        const std::string& path) = 0;
    virtual void write(const std::string& text) = 0;
    virtual void ping() = 0;
    virtual void shutdown() = 0;
};

template <class Stream>
class StreamSession : public WebSocketSession,
    public std::enable_shared_from_this<StreamSession<Stream>> {
public:

    static constexpr bool IS_TLS = !std::is_same<Stream, beast::tcp_stream>::value;

    template <class... Args>
    StreamSession(EventSink sink, const std::string& subProtocol,
        const std::string& userAgent, unsigned connectTimeoutMs, bool verifyPeer,
        net::io_context& ioc, Args&&... args)
    :   _sink(sink),
        _subProtocol(subProtocol),
        _userAgent(userAgent),
        _connectTimeoutMs(connectTimeoutMs),
        _verifyPeer(verifyPeer),
        _strand(net::make_strand(ioc)),
        _resolver(_strand),
        _ws(_strand, std::forward<Args>(args)...) {
    }

    virtual void start(const std::string& host, const std::string& port,
        const std::string& path) {
        auto self = this->shared_from_this();
        net::post(_strand, [self, host, port, path]() {
            self->_host = host;
            self->_path = path;
            self->_resolver.async_resolve(host, port,
                beast::bind_front_handler(&StreamSession::_onResolve, self));
        });
    }

    virtual void write(const std::string& text) {
        auto self = this->shared_from_this();
        net::post(_strand, [self, text]() {
            self->_writeQueue.push_back(text);
            if (self->_open && !self->_writing)
                self->_doWrite();
        });
    }

    virtual void ping() {
        auto self = this->shared_from_this();
        net::post(_strand, [self]() {
            if (!self->_open || self->_closing)
                return;
            self->_ws.async_ping({}, [self](beast::error_code ec) {
                if (ec)
                    self->_fail(ec, "ping");
            });
        });
    }

    virtual void shutdown() {
        auto self = this->shared_from_this();
        net::post(_strand, [self]() {
            if (self->_closing)
                return;
            self->_closing = true;
            self->_resolver.cancel();
            if (self->_open) {
                self->_open = false;
                self->_ws.async_close(websocket::close_code::normal,
                    [self](beast::error_code) {
                        // Nobody is listening any more
                        beast::get_lowest_layer(self->_ws).close();
                    });
            } else {
                beast::get_lowest_layer(self->_ws).close();
            }
        });
    }

private:

    void _onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec)
            return _fail(ec, "resolve");
        beast::get_lowest_layer(_ws).expires_after(
            std::chrono::milliseconds(_connectTimeoutMs));
        beast::get_lowest_layer(_ws).async_connect(results,
            beast::bind_front_handler(&StreamSession::_onConnect, this->shared_from_this()));
    }

    void _onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
        if (ec)
            return _fail(ec, "connect");
        // The Host header in the upgrade request carries the port
        _hostHeader = _host + ":" + to_string(ep.port());
        if constexpr (IS_TLS) {
            // SNI, most servers need it
            if (!SSL_set_tlsext_host_name(_ws.next_layer().native_handle(), _host.c_str())) {
                ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category());
                return _fail(ec, "SNI");
            }
            if (_verifyPeer) {
                _ws.next_layer().set_verify_mode(ssl::verify_peer);
                _ws.next_layer().set_verify_callback(ssl::host_name_verification(_host));
            } else {
                _ws.next_layer().set_verify_mode(ssl::verify_none);
            }
            beast::get_lowest_layer(_ws).expires_after(
                std::chrono::milliseconds(_connectTimeoutMs));
            _ws.next_layer().async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&StreamSession::_onTlsHandshake,
                    this->shared_from_this()));
        } else {
            _upgrade();
        }
    }

    void _onTlsHandshake(beast::error_code ec) {
        if (ec)
            return _fail(ec, "TLS handshake");
        _upgrade();
    }

    void _upgrade() {
        // The websocket stream has its own timeout settings
        beast::get_lowest_layer(_ws).expires_never();
        websocket::stream_base::timeout opt =
            websocket::stream_base::timeout::suggested(beast::role_type::client);
        opt.handshake_timeout = std::chrono::milliseconds(_connectTimeoutMs);
        _ws.set_option(opt);

        const string userAgent = _userAgent;
        const string subProtocol = _subProtocol;
        _ws.set_option(websocket::stream_base::decorator(
            [userAgent, subProtocol](websocket::request_type& req) {
                if (!userAgent.empty())
                    req.set(http::field::user_agent, userAgent);
                if (!subProtocol.empty())
                    req.set(http::field::sec_websocket_protocol, subProtocol);
            }
        ));

        // Pongs are reported so that the keepalive can see them
        EventSink sink = _sink;
        _ws.control_callback([sink](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong)
                sink(ChannelEvent::PONG, string());
        });

        _ws.text(true);
        _ws.async_handshake(_hostHeader, _path,
            beast::bind_front_handler(&StreamSession::_onHandshake, this->shared_from_this()));
    }

    void _onHandshake(beast::error_code ec) {
        if (ec)
            return _fail(ec, "WebSocket handshake");
        if (_closing)
            return;
        _open = true;
        _sink(ChannelEvent::OPENED, string());
        _read();
        if (!_writeQueue.empty() && !_writing)
            _doWrite();
    }

    void _read() {
        _ws.async_read(_buffer,
            beast::bind_front_handler(&StreamSession::_onRead, this->shared_from_this()));
    }

    void _onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                _open = false;
                if (!_closing)
                    _sink(ChannelEvent::CLOSED, "Closed by server");
                return;
            }
            return _fail(ec, "read");
        }
        _sink(ChannelEvent::TEXT, beast::buffers_to_string(_buffer.data()));
        _buffer.consume(_buffer.size());
        _read();
    }

    void _doWrite() {
        _writing = true;
        _ws.async_write(net::buffer(_writeQueue.front()),
            beast::bind_front_handler(&StreamSession::_onWrite, this->shared_from_this()));
    }

    void _onWrite(beast::error_code ec, std::size_t) {
        _writing = false;
        if (ec)
            return _fail(ec, "write");
        _writeQueue.pop_front();
        if (_open && !_writeQueue.empty())
            _doWrite();
    }

    void _fail(beast::error_code ec, const char* what) {
        _open = false;
        // Errors caused by our own shutdown aren't interesting
        if (_closing)
            return;
        _closing = true;
        _sink(ChannelEvent::FAILURE, string(what) + ": " + ec.message());
        beast::get_lowest_layer(_ws).close();
    }

    EventSink _sink;
    const std::string _subProtocol;
    const std::string _userAgent;
    const unsigned _connectTimeoutMs;
    const bool _verifyPeer;

    net::strand<net::io_context::executor_type> _strand;
    tcp::resolver _resolver;
    websocket::stream<Stream> _ws;
    beast::flat_buffer _buffer;

    std::string _host;
    std::string _hostHeader;
    std::string _path;
    std::deque<std::string> _writeQueue;
    bool _writing = false;
    bool _open = false;
    bool _closing = false;
};

typedef StreamSession<beast::tcp_stream> PlainSession;
typedef StreamSession<beast::ssl_stream<beast::tcp_stream>> TlsSession;

BeastWebSocketChannel::BeastWebSocketChannel(kc1fsz::Log& log)
:   _log(log),
    _work(net::make_work_guard(_ioc)),
    _sslCtx(ssl::context::tlsv12_client),
    _generation(0) {

    _sslCtx.set_default_verify_paths();

    _wakeFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_wakeFd < 0)
        _log.error("Unable to create eventfd (%d)", errno);

    _thread = std::thread([this]() {
        setThreadName("WebSocket");
        try {
            _ioc.run();
        } catch (const std::exception& ex) {
            _log.error("WebSocket I/O thread stopped: %s", ex.what());
            _push(_generation, ChannelEvent::FAILURE, ex.what());
        }
    });
}

BeastWebSocketChannel::~BeastWebSocketChannel() {
    close();
    _work.reset();
    _ioc.stop();
    if (_thread.joinable())
        _thread.join();
    if (_wakeFd >= 0)
        ::close(_wakeFd);
}

int BeastWebSocketChannel::open(const std::string& url, const std::string& subProtocol,
    const std::string& userAgent, unsigned connectTimeoutMs) {

    bool secure = false;
    string host, port, path;
    if (parseWebSocketUrl(url, secure, host, port, path) != 0)
        return -1;

    close();

    const unsigned gen = ++_generation;
    EventSink sink = [this, gen](ChannelEvent::Type type, const std::string& data) {
        _push(gen, type, data);
    };

    if (secure) {
        _session = make_shared<TlsSession>(sink, subProtocol, userAgent, connectTimeoutMs,
            !_insecure, _ioc, _sslCtx);
    } else {
        _session = make_shared<PlainSession>(sink, subProtocol, userAgent, connectTimeoutMs,
            false, _ioc);
    }

    _log.info("WebSocket connecting to %s:%s%s (%s)", host.c_str(), port.c_str(),
        path.c_str(), secure ? "TLS" : "plain");
    _session->start(host, port, path);
    return 0;
}

void BeastWebSocketChannel::close() {
    if (_session) {
        _session->shutdown();
        _session.reset();
    }
    ++_generation;
}

void BeastWebSocketChannel::sendText(const std::string& text) {
    if (_session)
        _session->write(text);
}

void BeastWebSocketChannel::sendPing() {
    if (_session)
        _session->ping();
}

bool BeastWebSocketChannel::pollEvent(ChannelEvent& event) {

    if (_wakeFd >= 0) {
        uint64_t count;
        ssize_t rc = ::read(_wakeFd, &count, sizeof(count));
        if (rc < 0 && errno != EAGAIN)
            _log.error("eventfd read failed (%d)", errno);
    }

    TaggedEvent tagged;
    while (_events.try_pop(tagged)) {
        // Anything from a connection that has since been closed is ignored
        if (tagged.generation == _generation) {
            event = tagged.event;
            return true;
        }
    }
    return false;
}

void BeastWebSocketChannel::_push(unsigned generation, ChannelEvent::Type type,
    const std::string& data) {
    TaggedEvent tagged;
    tagged.generation = generation;
    tagged.event.type = type;
    tagged.event.data = data;
    _events.push(tagged);
    if (_wakeFd >= 0) {
        uint64_t one = 1;
        ssize_t rc = ::write(_wakeFd, &one, sizeof(one));
        if (rc < 0 && errno != EAGAIN)
            _log.error("eventfd write failed (%d)", errno);
    }
}

}

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
 *
 * A small command-line agent that registers the accounts in a JSON
 * configuration file and (optionally) places one call. Inbound calls are
 * answered automatically. Everything the engine reports is logged.
 */
#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <iterator>
#include <iostream>

// 3rd party command-line parser
#include <argparse/argparse.hpp>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/linux/StdClock.h"
#include "kc1fsz-tools/MTLog2.h"

#include "SipError.h"
#include "EventLoop.h"
#include "ConfigPoller.h"
#include "BeastWebSocketChannel.h"
#include "SignalingEngine.h"
#include "EngineEvent.h"
#include "EngineEventConsumer.h"
#include "Registration.h"
#include "CallDialog.h"

using namespace std;
using namespace kc1fsz;
using namespace sipwire;

#ifndef SIPWIRE_VERSION
#define SIPWIRE_VERSION "1.0"
#endif

// A placeholder offer, there is no media in this program
static const char* DEMO_SDP =
    "v=0\r\n"
    "o=- 0 0 IN IP4 0.0.0.0\r\n"
    "s=-\r\n"
    "c=IN IP4 0.0.0.0\r\n"
    "t=0 0\r\n"
    "m=audio 9 RTP/AVP 0\r\n"
    "a=rtpmap:0 PCMU/8000\r\n";

static std::atomic<bool> stopRequested(false);
static std::atomic<bool> reconnectRequested(false);

static void sigHandler(int sig) {
    void *array[32];
    size_t size = backtrace(array, 32);
    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(array, size, STDERR_FILENO);
    signal(sig, SIG_DFL);
    raise(sig);
}

static void intHandler(int) {
    stopRequested = true;
}

static void usr1Handler(int) {
    reconnectRequested = true;
}

/**
 * Logs everything and drives the demo behavior.
 */
class AgentSink : public EngineEventConsumer {
public:

    AgentSink(Log& log, SignalingEngine& engine, const string& target)
    :   _log(log), _engine(engine), _target(target) { }

    void consume(const EngineEvent& ev) {

        _log.info("%s", ev.toString().c_str());

        // Commands can't be issued from inside of a notification
        if (ev.type == EngineEvent::REGISTRATION_STATE_CHANGED &&
            ev.state == Registration::STATE_REGISTERED &&
            !_target.empty() && !_called) {
            _called = true;
            string user = ev.user, domain = ev.domain;
            _engine.post([this, user, domain]() {
                string callId;
                int rc = _engine.makeCall(user, domain, _target, DEMO_SDP, callId);
                if (rc < 0)
                    _log.error("Call failed %s", errorName(rc));
                else
                    _log.info("Calling %s (%s)", _target.c_str(), callId.c_str());
            });
        }
        else if (ev.type == EngineEvent::INCOMING_CALL) {
            string callId = ev.callId;
            _engine.post([this, callId]() {
                int rc = _engine.acceptCall(callId, DEMO_SDP);
                if (rc < 0)
                    _log.error("Answer failed %s", errorName(rc));
            });
        }
    }

private:

    Log& _log;
    SignalingEngine& _engine;
    string _target;
    bool _called = false;
};

int main(int argc, const char** argv) {

    signal(SIGSEGV, sigHandler);
    signal(SIGINT, intHandler);
    // kill -USR1 drops the connection and re-registers everything
    signal(SIGUSR1, usr1Handler);

    StdClock clock;
    MTLog2 log;

    log.info("sipwire agent %s", SIPWIRE_VERSION);

    argparse::ArgumentParser program("sipwire-agent", SIPWIRE_VERSION);

    string configFn;
    program.add_argument("config")
        .store_into(configFn)
        .help("Configuration file (JSON)");

    string target;
    program.add_argument("--call")
        .store_into(target)
        .default_value(string(""))
        .help("Number or URI to call once registered");

    program.add_argument("--trace")
        .help("Log every SIP message")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--insecure")
        .help("Don't verify the server certificate")
        .default_value(false)
        .implicit_value(true);

    unsigned ttlSec = 0;
    program.add_argument("--ttlsec")
        .store_into(ttlSec)
        .default_value(0u)
        .help("Run time in seconds (0 means forever)");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        log.error("Argument error: %s", err.what());
        std::exit(-2);
    }

    BeastWebSocketChannel channel(log);
    channel.setInsecure(program.get<bool>("--insecure"));

    SignalingEngine engine(log, clock, channel);
    AgentSink sink(log, engine, target);
    engine.setSink(&sink);

    bool started = false;
    const bool trace = program.get<bool>("--trace");

    ConfigPoller poller(log, configFn.c_str(),
        [&log, &engine, &started, trace](const Config& cfg) {
            if (!started) {
                if (engine.configure(cfg) < 0) {
                    log.error("Bad configuration");
                    return;
                }
                if (trace)
                    engine.setTrace(true);
                if (engine.start() < 0)
                    log.error("Unable to start");
                started = true;
            } else {
                log.info("Configuration changed");
                engine.applyAccounts(cfg.accounts);
            }
        }
    );

    if (poller.load() != 0) {
        log.error("Unable to load %s", configFn.c_str());
        return -1;
    }

    const uint32_t endMs = clock.time() + ttlSec * 1000;
    Runnable2* tasks[] = { &engine, &poller };
    EventLoop::run(log, clock, tasks, std::size(tasks),
        [&engine, ttlSec, endMs](Log& log, Clock& clock) {
            if (reconnectRequested.exchange(false))
                engine.forceReconnect();
            if (stopRequested) {
                log.info("Interrupted");
                return false;
            }
            if (ttlSec && clock.isPast(endMs)) {
                log.info("Time is up");
                return false;
            }
            return true;
        }
    );

    engine.stop();
    return 0;
}

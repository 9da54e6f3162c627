#include <iostream>
#include <cassert>
#include <string>

#include "kc1fsz-tools/Log.h"

#include "SipError.h"
#include "SipUtil.h"
#include "SipMessage.h"
#include "Config.h"
#include "Registration.h"
#include "SignalingEngine.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace sipwire;

static Config makeConfig() {
    Config cfg;
    cfg.setDefaults();
    cfg.webSocketUrl = "wss://sip.example.com/ws";
    cfg.defaultDomain = "example.com";
    // Keepalive would get in the way of the big clock jumps
    cfg.pingIntervalMs = 0;
    return cfg;
}

static void connect(SignalingEngine& engine, TestChannel& channel) {
    engine.start();
    channel.opened();
    pump(engine);
    assert(engine.getTransport().isConnected());
}

static bool contains(const string& s, const char* piece) {
    return s.find(piece) != string::npos;
}

static int regState(SignalingEngine& engine) {
    return engine.getRegistrationState("alice", "example.com");
}

/**
 * Takes alice all the way to Registered with a plain 200.
 */
static void registerAlice(SignalingEngine& engine, TestChannel& channel) {
    assert(engine.registerAccount("alice", "secret", "") == SIP_OK);
    SipMessage req = channel.lastSent();
    SipMessage ok = makeReply(req, 200, "srv");
    ok.addHeader("Contact", "<sip:alice@example.com;transport=ws>;expires=600");
    channel.receive(ok);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
}

// Challenge, authenticated retry, and the refresh at 90%
static void authAndRefreshTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    assert(engine.configure(makeConfig()) == SIP_OK);
    connect(engine, channel);
    assert(sink.count(EngineEvent::TRANSPORT_STATE_CHANGED) == 1);
    assert(sink.last(EngineEvent::TRANSPORT_STATE_CHANGED).up);

    assert(engine.registerAccount("alice", "secret", "", "Alice") == SIP_OK);
    assert(regState(engine) == Registration::STATE_REGISTERING);
    assert(channel.sentCount() == 1);

    SipMessage reg1 = channel.lastSent();
    assert(reg1.getMethod() == "REGISTER");
    assert(reg1.getRequestUri() == "sip:example.com");
    assert(reg1.getHeader("Expires") == "3600");
    assert(reg1.getCSeqNumber() == 1);
    assert(reg1.hasHeader("User-Agent"));
    assert(reg1.getTopVia().find("SIP/2.0/WSS ") == 0);
    assert(extractUri(reg1.getHeader("Contact")) == "sip:alice@example.com;transport=ws");
    assert(extractDisplayName(reg1.getHeader("From")) == "Alice");
    assert(!reg1.hasHeader("Authorization"));

    SipMessage chal = makeReply(reg1, 401, "srv");
    chal.addHeader("WWW-Authenticate",
        "Digest realm=\"example.com\", nonce=\"abc123\", qop=\"auth\"");
    channel.receive(chal);
    pump(engine);

    assert(regState(engine) == Registration::STATE_REGISTERING);
    assert(channel.sentCount() == 2);
    SipMessage reg2 = channel.lastSent();
    assert(reg2.getCSeqNumber() == 2);
    assert(reg2.getCallId() == reg1.getCallId());
    assert(reg2.getFromTag() == reg1.getFromTag());
    assert(reg2.getBranch() != reg1.getBranch());
    assert(contains(reg2.getHeader("Authorization"), "nc=00000001"));
    assert(contains(reg2.getHeader("Authorization"), "username=\"alice\""));

    SipMessage ok = makeReply(reg2, 200, "srv");
    ok.addHeader("Contact", "<sip:alice@example.com;transport=ws>;expires=3600");
    channel.receive(ok);
    pump(engine);

    assert(regState(engine) == Registration::STATE_REGISTERED);
    const Registration* reg = engine.getRegistration("alice", "EXAMPLE.com");
    assert(reg != 0);
    assert(reg->getExpiresSec() == 3600);
    assert(reg->getRefreshIntervalSec() == 3240);
    EngineEvent ev = sink.last(EngineEvent::REGISTRATION_STATE_CHANGED);
    assert(ev.state == Registration::STATE_REGISTERED);
    assert(ev.oldState == Registration::STATE_REGISTERING);
    assert(ev.user == "alice");
    assert(ev.domain == "example.com");

    // Not yet
    clock.setTime(3239 * 1000);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(channel.sentCount() == 2);

    clock.setTime(3240 * 1000 + 1);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REFRESHING);
    assert(channel.sentCount() == 3);
    SipMessage reg3 = channel.lastSent();
    assert(reg3.getCSeqNumber() == 3);
    assert(reg3.getCallId() == reg1.getCallId());
    // Credentials go out right away with the next nonce-count
    assert(contains(reg3.getHeader("Authorization"), "nc=00000002"));

    // The server can shorten the interval
    SipMessage ok2 = makeReply(reg3, 200, "srv");
    ok2.addHeader("Expires", "1800");
    channel.receive(ok2);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(reg->getExpiresSec() == 1800);
    assert(reg->getRefreshIntervalSec() == 1620);

    // A stray copy of that response changes nothing
    unsigned events = sink.events.size();
    channel.receive(ok2);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(sink.events.size() == events);
}

static void authFailureTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    engine.configure(makeConfig());
    connect(engine, channel);

    engine.registerAccount("alice", "wrong", "");
    for (unsigned i = 0; i < 2; i++) {
        SipMessage chal = makeReply(channel.lastSent(), 401, "srv");
        chal.addHeader("WWW-Authenticate", "Digest realm=\"example.com\", nonce=\"n1\"");
        channel.receive(chal);
        pump(engine);
    }

    // Only one retry
    assert(channel.sentCount() == 2);
    assert(regState(engine) == Registration::STATE_FAILED);
    const Registration* reg = engine.getRegistration("alice", "");
    assert(reg->getLastError() == SIP_ERR_AUTHENTICATION_FAILED);
    assert(reg->getLastStatusCode() == 401);
    EngineEvent ev = sink.last(EngineEvent::REGISTRATION_STATE_CHANGED);
    assert(ev.state == Registration::STATE_FAILED);
    assert(ev.statusCode == 401);
    assert(ev.reason == "Authentication failed");

    // Can try again from Failed
    assert(engine.registerAccount("alice", "wrong", "") == SIP_OK);
    assert(regState(engine) == Registration::STATE_REGISTERING);

    // A challenge we can't answer
    SipMessage chal = makeReply(channel.lastSent(), 401, "srv");
    chal.addHeader("WWW-Authenticate", "Basic realm=\"example.com\"");
    channel.receive(chal);
    pump(engine);
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(reg->getLastError() == SIP_ERR_UNSUPPORTED_CHALLENGE);
}

static void rejectAndTimeoutTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    engine.configure(makeConfig());
    connect(engine, channel);

    engine.registerAccount("alice", "secret", "");
    channel.receive(makeReply(channel.lastSent(), 403, "srv"));
    pump(engine);
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(engine.getRegistration("alice", "")->getLastStatusCode() == 403);

    // Nobody answers this time
    engine.registerAccount("alice", "secret", "");
    clock.setTime(9000);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERING);
    clock.setTime(10100);
    pump(engine);
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(engine.getRegistration("alice", "")->getLastError() == SIP_ERR_TRANSACTION_TIMEOUT);
}

static void unregisterTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    engine.configure(makeConfig());
    connect(engine, channel);

    // Can't unregister something that doesn't exist
    assert(engine.unregisterAccount("alice", "") == SIP_ERR_NOT_FOUND);

    registerAlice(engine, channel);
    SipMessage first = channel.lastSent();
    // Already registered
    assert(engine.registerAccount("alice", "secret", "") == SIP_ERR_ILLEGAL_TRANSITION);

    // The server says 200 twice, the second one is ignored
    unsigned sent = channel.sentCount();
    SipMessage dup = makeReply(first, 200, "srv");
    dup.addHeader("Expires", "60");
    channel.receive(dup);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(engine.getRegistration("alice", "")->getExpiresSec() == 600);
    assert(channel.sentCount() == sent);

    // Unregister while the refresh is still waiting for an answer
    clock.setTime(540 * 1000 + 1);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REFRESHING);
    SipMessage refresh = channel.lastSent();
    assert(refresh.getHeader("Expires") == "3600");

    assert(engine.unregisterAccount("alice", "") == SIP_OK);
    assert(regState(engine) == Registration::STATE_UNREGISTERING);
    SipMessage req = channel.lastSent();
    assert(req.getHeader("Expires") == "0");
    assert(!engine.getRegistration("alice", "")->isWanted());

    // The answer to the refresh turns up late
    channel.receive(makeReply(refresh, 200, "srv"));
    pump(engine);
    assert(regState(engine) == Registration::STATE_UNREGISTERING);

    channel.receive(makeReply(req, 200, "srv"));
    pump(engine);
    assert(regState(engine) == Registration::STATE_UNREGISTERED);

    // And once more after it's all over
    sent = channel.sentCount();
    channel.receive(makeReply(refresh, 200, "srv"));
    channel.receive(makeReply(req, 200, "srv"));
    pump(engine);
    assert(regState(engine) == Registration::STATE_UNREGISTERED);
    assert(channel.sentCount() == sent);
    assert(engine.unregisterAccount("alice", "") == SIP_ERR_ILLEGAL_TRANSITION);

    // And back again
    assert(engine.registerAccount("alice", "secret", "") == SIP_OK);
    assert(regState(engine) == Registration::STATE_REGISTERING);
}

// Everything is re-registered after the transport comes back
static void transportTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    Config cfg = makeConfig();
    Config::Account bob;
    bob.username = "bob";
    bob.password = "pw";
    cfg.accounts.push_back(bob);
    engine.configure(cfg);

    // Bob is in the configuration, nothing goes out before the connection
    engine.start();
    assert(engine.getRegistrationState("bob", "example.com") == Registration::STATE_NONE);
    assert(engine.getRegistration("bob", "")->isWanted());
    assert(channel.sentCount() == 0);

    channel.opened();
    pump(engine);
    assert(engine.getRegistrationState("bob", "example.com") == Registration::STATE_REGISTERING);
    assert(channel.sentCount() == 1);
    channel.receive(makeReply(channel.lastSent(), 200, "srv"));
    pump(engine);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_REGISTERED);

    registerAlice(engine, channel);

    clock.setTime(1000);
    channel.fail("Connection reset");
    pump(engine);
    assert(!engine.getTransport().isConnected());
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_FAILED);
    assert(engine.getRegistration("bob", "")->getLastError() == SIP_ERR_TRANSPORT_DOWN);
    EngineEvent down = sink.last(EngineEvent::TRANSPORT_STATE_CHANGED);
    assert(!down.up);
    assert(down.reason == "Connection reset");

    unsigned sent = channel.sentCount();
    clock.setTime(3100);
    pump(engine);
    assert(channel.openCount == 2);
    channel.opened();
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERING);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_REGISTERING);
    assert(channel.sentCount() == sent + 2);
    assert(sink.last(EngineEvent::TRANSPORT_STATE_CHANGED).up);
}

// A registrar that hands out a very long registration
static void longExpiresTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    engine.configure(makeConfig());
    connect(engine, channel);

    engine.registerAccount("alice", "secret", "");
    SipMessage ok = makeReply(channel.lastSent(), 200, "srv");
    ok.addHeader("Expires", "4000000");
    channel.receive(ok);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    const Registration* reg = engine.getRegistration("alice", "");
    assert(reg->getExpiresSec() == Registration::MAX_EXPIRES_SEC);
    assert(reg->getRefreshIntervalSec() == (Registration::MAX_EXPIRES_SEC * 9) / 10);

    // No refresh for a long while
    unsigned sent = channel.sentCount();
    clock.setTime(1000);
    pump(engine);
    clock.setTime(3600 * 1000);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(channel.sentCount() == sent);

    clock.setTime(reg->getRefreshIntervalSec() * 1000 + 1);
    pump(engine);
    assert(regState(engine) == Registration::STATE_REFRESHING);
    assert(channel.sentCount() == sent + 1);
}

// Shutting down looks like a transport failure to the registrations
static void stopTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    engine.configure(makeConfig());
    connect(engine, channel);
    registerAlice(engine, channel);

    engine.stop();
    pump(engine);
    assert(!engine.getTransport().isConnected());
    assert(engine.getTransport().getState() == TransportSession::STATE_DISCONNECTED);
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(engine.getRegistration("alice", "")->getLastError() == SIP_ERR_TRANSPORT_DOWN);
    EngineEvent down = sink.last(EngineEvent::TRANSPORT_STATE_CHANGED);
    assert(!down.up);
    assert(down.reason == "Transport stopped");
    unsigned events = sink.count(EngineEvent::TRANSPORT_STATE_CHANGED);

    // Nothing more happens while stopped, no refresh and no reconnect
    unsigned sent = channel.sentCount();
    clock.setTime(3600 * 1000);
    pump(engine);
    assert(channel.sentCount() == sent);
    assert(channel.openCount == 1);
    assert(sink.count(EngineEvent::TRANSPORT_STATE_CHANGED) == events);

    // Starting again brings alice back
    engine.start();
    channel.opened();
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERING);
    assert(channel.sentCount() == sent + 1);
}

// A reconnect on demand re-registers everything that should be registered
static void forceReconnectTest() {

    Log log;
    TestClock clock(log);
    TestChannel channel;
    SignalingEngine engine(log, clock, channel);
    RecordingSink sink;
    engine.setSink(&sink);
    engine.configure(makeConfig());
    connect(engine, channel);
    registerAlice(engine, channel);

    assert(engine.registerAccount("bob", "pw", "") == SIP_OK);
    channel.receive(makeReply(channel.lastSent(), 200, "srv"));
    pump(engine);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_REGISTERED);

    // Carol was unregistered and stays that way
    assert(engine.registerAccount("carol", "pw", "") == SIP_OK);
    channel.receive(makeReply(channel.lastSent(), 200, "srv"));
    pump(engine);
    assert(engine.unregisterAccount("carol", "") == SIP_OK);
    channel.receive(makeReply(channel.lastSent(), 200, "srv"));
    pump(engine);
    assert(engine.getRegistrationState("carol", "") == Registration::STATE_UNREGISTERED);

    unsigned sent = channel.sentCount();
    assert(engine.forceReconnect() == SIP_OK);
    assert(channel.openCount == 2);
    assert(engine.getTransport().getState() == TransportSession::STATE_CONNECTING);
    assert(regState(engine) == Registration::STATE_FAILED);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_FAILED);
    EngineEvent down = sink.last(EngineEvent::TRANSPORT_STATE_CHANGED);
    assert(!down.up);
    assert(down.reason == "Forced reconnect");

    channel.opened();
    pump(engine);
    assert(engine.getTransport().isConnected());
    assert(engine.getTransport().getConnectCount() == 2);
    assert(regState(engine) == Registration::STATE_REGISTERING);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_REGISTERING);
    assert(engine.getRegistrationState("carol", "") == Registration::STATE_UNREGISTERED);
    assert(channel.sentCount() == sent + 2);
    assert(channel.countSent("REGISTER") == 6);
    assert(sink.last(EngineEvent::TRANSPORT_STATE_CHANGED).up);

    for (unsigned i = sent; i < channel.sentCount(); i++) {
        channel.receive(makeReply(channel.sentMessage(i), 200, "srv"));
    }
    pump(engine);
    assert(regState(engine) == Registration::STATE_REGISTERED);
    assert(engine.getRegistrationState("bob", "") == Registration::STATE_REGISTERED);
}

int main(int, const char**) {
    authAndRefreshTest();
    authFailureTest();
    rejectAndTimeoutTest();
    unregisterTest();
    transportTest();
    longExpiresTest();
    stopTest();
    forceReconnectTest();
    cout << "All tests passed" << endl;
    return 0;
}

#include <iostream>
#include <cassert>
#include <string>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "SipError.h"
#include "SipUtil.h"
#include "SipMessage.h"
#include "Config.h"
#include "Registration.h"
#include "CallDialog.h"
#include "SignalingEngine.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace sipwire;

static const char* SDP_A = "v=0\r\no=- 1 1 IN IP4 0.0.0.0\r\ns=-\r\nm=audio 4000 RTP/AVP 0\r\n";
static const char* SDP_B = "v=0\r\no=- 2 2 IN IP4 10.1.1.1\r\ns=-\r\nm=audio 5000 RTP/AVP 0\r\n";
static const char* SDP_HOLD = "v=0\r\no=- 1 2 IN IP4 0.0.0.0\r\ns=-\r\nm=audio 4000 RTP/AVP 0\r\na=sendonly\r\n";

static const char* REMOTE_FROM = "\"Bob Jones\" <sip:5551234@example.com>;tag=rem1";

/**
 * An engine that is connected and has alice registered.
 */
struct Rig {

    Rig(bool callTimeout = true) : clock(log), engine(log, clock, channel) {
        Config cfg;
        cfg.setDefaults();
        cfg.webSocketUrl = "wss://sip.example.com/ws";
        cfg.defaultDomain = "example.com";
        cfg.pingIntervalMs = 0;
        if (!callTimeout)
            cfg.callTimeoutMs = 0;
        engine.setSink(&sink);
        engine.configure(cfg);
        engine.start();
        channel.opened();
        pump(engine);

        engine.registerAccount("alice", "secret", "");
        SipMessage ok = makeReply(channel.lastSent(), 200, "srv");
        ok.addHeader("Expires", "3600");
        channel.receive(ok);
        pump(engine);
        assert(engine.getRegistrationState("alice", "") == Registration::STATE_REGISTERED);
    }

    void receive(const SipMessage& msg) {
        channel.receive(msg);
        pump(engine);
    }

    int state(const string& callId) {
        return engine.getCallState(callId);
    }

    Log log;
    TestClock clock;
    TestChannel channel;
    SignalingEngine engine;
    RecordingSink sink;
};

static SipMessage makeInboundInvite(const string& callId, const string& branch) {
    SipMessage inv = SipMessage::makeRequest("INVITE", "sip:alice@abc.invalid;transport=ws");
    inv.addHeader("Via", "SIP/2.0/WSS proxy.example.com;branch=" + branch);
    inv.addHeader("Record-Route", "<sip:proxy.example.com;transport=ws;lr>");
    inv.addHeader("Max-Forwards", "69");
    inv.addHeader("From", REMOTE_FROM);
    inv.addHeader("To", "<sip:alice@example.com>");
    inv.addHeader("Call-ID", callId);
    inv.addHeader("CSeq", "101 INVITE");
    inv.addHeader("Contact", "<sip:5551234@10.1.1.1:5060;transport=ws>");
    inv.setBody("application/sdp", SDP_B);
    return inv;
}

static SipMessage makeInDialog(const char* method, const CallDialog& call, unsigned cseq,
    const string& branch) {
    SipMessage req = SipMessage::makeRequest(method, "sip:alice@abc.invalid;transport=ws");
    req.addHeader("Via", "SIP/2.0/WSS proxy.example.com;branch=" + branch);
    req.addHeader("Max-Forwards", "69");
    req.addHeader("From", REMOTE_FROM);
    req.addHeader("To", "<sip:alice@example.com>;tag=" + call.getLocalTag());
    req.addHeader("Call-ID", call.getCallId());
    req.addHeader("CSeq", to_string(cseq) + " " + method);
    return req;
}

/**
 * Places a call from alice and has the far end answer it.
 */
static string answeredCall(Rig& r, const char* target = "1002") {
    string callId;
    assert(r.engine.makeCall("alice", "", target, SDP_A, callId) == SIP_OK);
    SipMessage invite = r.channel.lastSent();
    SipMessage ok = makeReply(invite, 200, "b1");
    ok.addHeader("Contact", "<sip:1002@10.0.0.5:5060;transport=ws>");
    ok.addHeader("Record-Route", "<sip:p1.example.com;lr>");
    ok.addHeader("Record-Route", "<sip:p2.example.com;lr>");
    ok.setBody("application/sdp", SDP_B);
    r.receive(ok);
    assert(r.state(callId) == CallDialog::STATE_CONNECTED);
    return callId;
}

static void outboundTest() {

    Rig r;
    r.clock.setTime(1000);

    string callId;
    assert(r.engine.makeCall("alice", "", "1002", SDP_A, callId) == SIP_OK);
    assert(!callId.empty());
    assert(r.state(callId) == CallDialog::STATE_CALLING);
    assert(r.sink.last(EngineEvent::CALL_STATE_CHANGED).state == CallDialog::STATE_CALLING);

    SipMessage invite = r.channel.lastSent();
    assert(invite.getMethod() == "INVITE");
    assert(invite.getRequestUri() == "sip:1002@example.com");
    assert(invite.getCallId() == callId);
    assert(invite.getCSeqNumber() == 1);
    assert(invite.getBody() == SDP_A);
    assert(invite.getContentType() == "application/sdp");
    assert(!invite.getFromTag().empty());
    assert(invite.getToTag().empty());
    assert(invite.hasHeader("Contact"));

    r.receive(makeReply(invite, 100));
    assert(r.state(callId) == CallDialog::STATE_CALLING);
    r.receive(makeReply(invite, 180, "b1"));
    assert(r.state(callId) == CallDialog::STATE_RINGING);

    r.clock.setTime(2000);
    SipMessage ok = makeReply(invite, 200, "b1");
    ok.addHeader("Contact", "<sip:1002@10.0.0.5:5060;transport=ws>");
    ok.addHeader("Record-Route", "<sip:p1.example.com;lr>");
    ok.addHeader("Record-Route", "<sip:p2.example.com;lr>");
    ok.setBody("application/sdp", SDP_B);
    r.receive(ok);
    assert(r.state(callId) == CallDialog::STATE_CONNECTED);

    const CallDialog* call = r.engine.getCall(callId);
    assert(call->getRemoteTag() == "b1");
    assert(call->getRemoteSdp() == SDP_B);
    assert(call->getRouteSet().size() == 2);

    // The ACK goes straight to the remote target along the route set
    SipMessage ack = r.channel.lastSent();
    assert(ack.getMethod() == "ACK");
    assert(ack.getRequestUri() == "sip:1002@10.0.0.5:5060;transport=ws");
    assert(ack.getHeader("CSeq") == "1 ACK");
    assert(ack.getToTag() == "b1");
    vector<string> route = ack.getHeaderValues("Route");
    assert(route.size() == 2);
    assert(route[0] == "<sip:p2.example.com;lr>");
    assert(route[1] == "<sip:p1.example.com;lr>");

    // The 2xx shows up again, the ACK is repeated
    r.receive(ok);
    assert(r.channel.countSent("ACK") == 2);
    assert(r.state(callId) == CallDialog::STATE_CONNECTED);

    r.clock.setTime(7000);
    assert(r.engine.hangup(callId) == SIP_OK);
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);
    SipMessage bye = r.channel.lastSent();
    assert(bye.getMethod() == "BYE");
    assert(bye.getHeader("CSeq") == "2 BYE");
    assert(bye.getRequestUri() == "sip:1002@10.0.0.5:5060;transport=ws");
    assert(bye.getHeaderValues("Route").size() == 2);

    r.receive(makeReply(bye, 200));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    EngineEvent ev = r.sink.last(EngineEvent::CALL_STATE_CHANGED);
    assert(ev.state == CallDialog::STATE_ENDED);
    assert(ev.oldState == CallDialog::STATE_TERMINATING);
    assert(ev.endReason == CallDialog::END_NORMAL_CLEARING);
    assert(ev.durationMs == 5000);
    assert(r.engine.getActiveCalls().empty());

    // Hangs around for a while, then the slot is released
    assert(r.engine.hangup(callId) == SIP_ERR_ILLEGAL_TRANSITION);
    r.clock.setTime(7000 + CallDialog::LINGER_MS + 100);
    pump(r.engine);
    assert(r.state(callId) == SIP_ERR_NOT_FOUND);
    assert(r.engine.hangup(callId) == SIP_ERR_NOT_FOUND);
}

static void busyTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();
    r.receive(makeReply(invite, 486, "b1"));

    assert(r.state(callId) == CallDialog::STATE_FAILED);
    // The transaction layer acknowledges the final response
    SipMessage ack = r.channel.lastSent();
    assert(ack.getMethod() == "ACK");
    assert(ack.getBranch() == invite.getBranch());
    EngineEvent ev = r.sink.last(EngineEvent::CALL_STATE_CHANGED);
    assert(ev.state == CallDialog::STATE_FAILED);
    assert(ev.endReason == CallDialog::END_USER_BUSY);
    assert(ev.statusCode == 486);
}

// Hangup while ringing, and the 200 crosses with the CANCEL
static void glareTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();
    r.receive(makeReply(invite, 180, "b1"));

    assert(r.engine.hangup(callId) == SIP_OK);
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);
    SipMessage cancel = r.channel.lastSent();
    assert(cancel.getMethod() == "CANCEL");
    assert(cancel.getRequestUri() == invite.getRequestUri());
    assert(cancel.getBranch() == invite.getBranch());
    assert(cancel.getHeader("CSeq") == "1 CANCEL");
    assert(cancel.getToTag().empty());

    r.receive(makeReply(cancel, 200, "b1"));
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);

    SipMessage ok = makeReply(invite, 200, "b1");
    ok.addHeader("Contact", "<sip:1002@10.0.0.5;transport=ws>");
    r.receive(ok);
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);
    assert(r.channel.countSent("ACK") == 1);
    SipMessage bye = r.channel.lastSent();
    assert(bye.getMethod() == "BYE");
    assert(bye.getToTag() == "b1");

    r.receive(makeReply(bye, 200));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_NORMAL_CLEARING);
    // Never made it to Connected
    assert(r.sink.last(EngineEvent::CALL_STATE_CHANGED).durationMs == 0);
}

// Hangup before the far end has said anything at all
static void earlyHangupTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();
    assert(r.engine.hangup(callId) == SIP_OK);
    assert(r.channel.lastSent().getMethod() == "CANCEL");
    assert(r.channel.countSent("BYE") == 0);

    SipMessage ok = makeReply(invite, 200, "b2");
    ok.addHeader("Contact", "<sip:1002@10.0.0.5;transport=ws>");
    r.receive(ok);
    assert(r.channel.countSent("ACK") == 1);
    SipMessage bye = r.channel.lastSent();
    assert(bye.getMethod() == "BYE");
    assert(bye.getRequestUri() == "sip:1002@10.0.0.5;transport=ws");
    r.receive(makeReply(bye, 200));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
}

static void cancelTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();
    r.receive(makeReply(invite, 180, "b1"));
    r.engine.hangup(callId);
    SipMessage cancel = r.channel.lastSent();
    r.receive(makeReply(cancel, 200, "b1"));
    r.receive(makeReply(invite, 487, "b1"));

    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(r.channel.lastSent().getMethod() == "ACK");
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_NORMAL_CLEARING);

    // Late copies of the final responses don't bring the call back
    unsigned sent = r.channel.sentCount();
    unsigned events = r.sink.events.size();
    r.receive(makeReply(invite, 487, "b1"));
    r.receive(makeReply(invite, 200, "b1"));
    r.receive(makeReply(cancel, 200, "b1"));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_NORMAL_CLEARING);
    assert(r.channel.sentCount() == sent);
    assert(r.sink.events.size() == events);
}

static void noAnswerTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();
    r.receive(makeReply(invite, 180, "b1"));

    r.clock.setTime(29000);
    pump(r.engine);
    assert(r.state(callId) == CallDialog::STATE_RINGING);

    r.clock.setTime(30100);
    pump(r.engine);
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);
    assert(r.channel.lastSent().getMethod() == "CANCEL");

    r.receive(makeReply(invite, 487, "b1"));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    EngineEvent ev = r.sink.last(EngineEvent::CALL_STATE_CHANGED);
    assert(ev.endReason == CallDialog::END_NO_ANSWER);
}

static void inviteTimeoutTest() {

    Rig r(false);
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    r.clock.setTime(31000);
    pump(r.engine);
    assert(r.state(callId) == CallDialog::STATE_CALLING);
    r.clock.setTime(32100);
    pump(r.engine);
    assert(r.state(callId) == CallDialog::STATE_FAILED);
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_TIMEOUT);
}

static void inviteAuthTest() {

    Rig r;
    string callId;
    r.engine.makeCall("alice", "", "1002", SDP_A, callId);
    SipMessage invite = r.channel.lastSent();

    SipMessage chal = makeReply(invite, 407, "px");
    chal.addHeader("Proxy-Authenticate",
        "Digest realm=\"example.com\", nonce=\"inv1\", qop=\"auth\"");
    r.receive(chal);

    assert(r.state(callId) == CallDialog::STATE_CALLING);
    SipMessage invite2 = r.channel.lastSent();
    assert(invite2.getMethod() == "INVITE");
    assert(invite2.getCSeqNumber() == 2);
    assert(invite2.getCallId() == callId);
    assert(invite2.getFromTag() == invite.getFromTag());
    assert(invite2.getBranch() != invite.getBranch());
    assert(invite2.getBody() == SDP_A);
    assert(invite2.getHeader("Proxy-Authorization").find("nonce=\"inv1\"") != string::npos);
    // The 407 was acknowledged
    assert(r.channel.countSent("ACK") == 1);

    // Rejected again
    SipMessage chal2 = makeReply(invite2, 407, "px");
    chal2.addHeader("Proxy-Authenticate",
        "Digest realm=\"example.com\", nonce=\"inv2\", qop=\"auth\"");
    r.receive(chal2);
    assert(r.state(callId) == CallDialog::STATE_FAILED);
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_AUTHENTICATION_FAILED);
}

static void inboundTest() {

    Rig r;
    SipMessage invite = makeInboundInvite("in-call-1", "z9hG4bKin1");
    unsigned sent = r.channel.sentCount();
    r.receive(invite);

    const string callId = "in-call-1";
    assert(r.state(callId) == CallDialog::STATE_RINGING);
    assert(r.channel.sentCount() == sent + 2);
    SipMessage trying = r.channel.sentMessage(sent);
    assert(trying.getStatusCode() == 100);
    SipMessage ringing = r.channel.sentMessage(sent + 1);
    assert(ringing.getStatusCode() == 180);
    assert(!ringing.getToTag().empty());
    assert(ringing.hasHeader("Contact"));

    EngineEvent ic = r.sink.last(EngineEvent::INCOMING_CALL);
    assert(ic.callId == callId);
    assert(ic.callerNumber == "5551234");
    assert(ic.callerName == "Bob Jones");
    assert(ic.user == "alice");

    const CallDialog* call = r.engine.getCall(callId);
    assert(call->getDirection() == CallDialog::DIRECTION_INBOUND);
    assert(call->getRemoteSdp() == SDP_B);
    assert(call->getLocalTag() == ringing.getToTag());

    // A retransmitted INVITE gets the last response again
    r.receive(invite);
    assert(r.channel.sentCount() == sent + 3);
    assert(r.channel.lastSent().getStatusCode() == 180);
    assert(r.sink.count(EngineEvent::INCOMING_CALL) == 1);

    assert(r.engine.acceptCall(callId, SDP_A) == SIP_OK);
    assert(r.state(callId) == CallDialog::STATE_CONNECTED);
    SipMessage ok = r.channel.lastSent();
    assert(ok.getStatusCode() == 200);
    assert(ok.getBody() == SDP_A);
    assert(ok.getToTag() == call->getLocalTag());
    assert(ok.getHeaderValues("Record-Route").size() == 1);
    assert(call->isAwaitingAck());
    assert(r.engine.acceptCall(callId, SDP_A) == SIP_ERR_ILLEGAL_TRANSITION);

    r.receive(makeInDialog("ACK", *call, 101, "z9hG4bKack1"));
    assert(!call->isAwaitingAck());

    // The far end puts us on hold
    SipMessage reinvite = makeInDialog("INVITE", *call, 102, "z9hG4bKre1");
    reinvite.setBody("application/sdp", SDP_HOLD);
    r.receive(reinvite);
    SipMessage reok = r.channel.lastSent();
    assert(reok.getStatusCode() == 200);
    assert(reok.getBody() == SDP_A);
    assert(call->getRemoteSdp() == SDP_HOLD);
    assert(call->isAwaitingAck());
    r.receive(makeInDialog("ACK", *call, 102, "z9hG4bKack2"));
    assert(!call->isAwaitingAck());

    // Out of order
    r.receive(makeInDialog("INFO", *call, 102, "z9hG4bKinfo0"));
    assert(r.channel.lastSent().getStatusCode() == 500);

    // DTMF from the far end, both formats
    SipMessage info = makeInDialog("INFO", *call, 103, "z9hG4bKinfo1");
    info.setBody("application/dtmf-relay", "Signal=5\r\nDuration=250\r\n");
    r.receive(info);
    assert(r.channel.lastSent().getStatusCode() == 200);
    EngineEvent dr = r.sink.last(EngineEvent::DTMF_RECEIVED);
    assert(dr.callId == callId);
    assert(dr.digit == '5');
    assert(dr.durationMs == 250);

    SipMessage info2 = makeInDialog("INFO", *call, 104, "z9hG4bKinfo2");
    info2.setBody("application/dtmf", "#");
    r.receive(info2);
    assert(r.sink.last(EngineEvent::DTMF_RECEIVED).digit == '#');
    assert(r.sink.count(EngineEvent::DTMF_RECEIVED) == 2);

    // We put the far end on hold
    assert(r.engine.hold(callId, SDP_HOLD) == SIP_OK);
    SipMessage hold = r.channel.lastSent();
    assert(hold.getMethod() == "INVITE");
    assert(hold.getRequestUri() == "sip:5551234@10.1.1.1:5060;transport=ws");
    assert(hold.getHeader("Route") == "<sip:proxy.example.com;transport=ws;lr>");
    assert(hold.getCSeqNumber() == 1);
    assert(hold.getBody() == SDP_HOLD);
    assert(hold.getFromTag() == call->getLocalTag());
    assert(hold.getToTag() == "rem1");
    assert(call->isReinvitePending());
    r.receive(makeReply(hold, 200));
    assert(r.state(callId) == CallDialog::STATE_ON_HOLD);
    assert(r.channel.lastSent().getHeader("CSeq") == "1 ACK");
    assert(r.engine.hold(callId, SDP_HOLD) == SIP_ERR_ILLEGAL_TRANSITION);

    // Resume is refused once, then works
    assert(r.engine.resume(callId, SDP_A) == SIP_OK);
    SipMessage resume1 = r.channel.lastSent();
    assert(r.engine.resume(callId, SDP_A) == SIP_ERR_ILLEGAL_TRANSITION);
    r.receive(makeReply(resume1, 491));
    assert(r.state(callId) == CallDialog::STATE_ON_HOLD);
    assert(r.engine.resume(callId, SDP_A) == SIP_OK);
    SipMessage resume2 = r.channel.lastSent();
    assert(resume2.getCSeqNumber() == 3);
    r.receive(makeReply(resume2, 200));
    assert(r.state(callId) == CallDialog::STATE_CONNECTED);
    assert(call->getLocalSdp() == SDP_A);

    // The far end hangs up
    SipMessage bye = makeInDialog("BYE", *call, 105, "z9hG4bKbye1");
    r.receive(bye);
    assert(r.channel.lastSent().getStatusCode() == 200);
    assert(r.channel.lastSent().getCSeqMethod() == "BYE");
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(call->getEndReason() == CallDialog::END_NORMAL_CLEARING);

    // Anything else for the dialog is too late
    r.receive(makeInDialog("INFO", *call, 106, "z9hG4bKinfo3"));
    assert(r.channel.lastSent().getStatusCode() == 481);
}

static void inboundCancelTest() {

    Rig r;
    SipMessage invite = makeInboundInvite("in-call-2", "z9hG4bKin2");
    r.receive(invite);
    assert(r.state("in-call-2") == CallDialog::STATE_RINGING);

    SipMessage cancel = SipMessage::makeRequest("CANCEL", invite.getRequestUri());
    cancel.addHeader("Via", invite.getTopVia());
    cancel.addHeader("From", invite.getHeader("From"));
    cancel.addHeader("To", invite.getHeader("To"));
    cancel.addHeader("Call-ID", "in-call-2");
    cancel.addHeader("CSeq", "101 CANCEL");
    unsigned sent = r.channel.sentCount();
    r.receive(cancel);

    assert(r.channel.sentCount() == sent + 2);
    SipMessage ok = r.channel.sentMessage(sent);
    assert(ok.getStatusCode() == 200 && ok.getCSeqMethod() == "CANCEL");
    SipMessage terminated = r.channel.sentMessage(sent + 1);
    assert(terminated.getStatusCode() == 487 && terminated.getCSeqMethod() == "INVITE");
    assert(r.state("in-call-2") == CallDialog::STATE_ENDED);

    // The ACK for the 487 never reaches the dialog
    SipMessage ack = SipMessage::makeRequest("ACK", invite.getRequestUri());
    ack.addHeader("Via", invite.getTopVia());
    ack.addHeader("From", invite.getHeader("From"));
    ack.addHeader("To", terminated.getHeader("To"));
    ack.addHeader("Call-ID", "in-call-2");
    ack.addHeader("CSeq", "101 ACK");
    r.receive(ack);
    assert(r.channel.sentCount() == sent + 2);
}

static void declineTest() {

    Rig r;
    r.receive(makeInboundInvite("in-call-3", "z9hG4bKin3"));
    assert(r.engine.declineCall("in-call-3", true) == SIP_OK);
    assert(r.channel.lastSent().getStatusCode() == 486);
    assert(r.state("in-call-3") == CallDialog::STATE_ENDED);
    assert(r.engine.getCall("in-call-3")->getEndReason() == CallDialog::END_USER_BUSY);

    // Hanging up while ringing is a decline
    r.receive(makeInboundInvite("in-call-4", "z9hG4bKin4"));
    assert(r.engine.hangup("in-call-4") == SIP_OK);
    assert(r.channel.lastSent().getStatusCode() == 603);
    assert(r.engine.getCall("in-call-4")->getEndReason() == CallDialog::END_CALL_REJECTED);
}

static void ackTimeoutTest() {

    Rig r;
    r.receive(makeInboundInvite("in-call-5", "z9hG4bKin5"));
    r.engine.acceptCall("in-call-5", SDP_A);

    r.clock.setTime(CallDialog::ACK_TIMEOUT_MS + 100);
    pump(r.engine);
    assert(r.state("in-call-5") == CallDialog::STATE_TERMINATING);
    SipMessage bye = r.channel.lastSent();
    assert(bye.getMethod() == "BYE");
    r.receive(makeReply(bye, 200));
    assert(r.state("in-call-5") == CallDialog::STATE_ENDED);
    assert(r.engine.getCall("in-call-5")->getEndReason() == CallDialog::END_NETWORK_ERROR);
}

static void dtmfTest() {

    Rig r;
    string callId = answeredCall(r);

    assert(r.engine.sendDtmfSequence(callId, "1x") == SIP_ERR_INVALID_ARGUMENT);
    assert(r.engine.sendDtmf(callId, 'e') == SIP_ERR_INVALID_ARGUMENT);
    unsigned infos = r.channel.countSent("INFO");
    assert(infos == 0);

    assert(r.engine.sendDtmfSequence(callId, "12#") == SIP_OK);
    // One at a time
    assert(r.channel.countSent("INFO") == 1);
    assert(r.engine.getCall(callId)->getDtmfQueueDepth() == 2);
    SipMessage info = r.channel.lastSent();
    assert(info.getContentType() == "application/dtmf-relay");
    assert(info.getBody() == "Signal=1\r\nDuration=160\r\n");

    r.receive(makeReply(info, 200));
    EngineEvent res = r.sink.last(EngineEvent::DTMF_RESULT);
    assert(res.digit == '1' && res.success);
    assert(r.channel.countSent("INFO") == 2);

    SipMessage info2 = r.channel.lastSent();
    assert(info2.getBody() == "Signal=2\r\nDuration=160\r\n");
    assert(info2.getCSeqNumber() == info.getCSeqNumber() + 1);
    r.receive(makeReply(info2, 500));
    res = r.sink.last(EngineEvent::DTMF_RESULT);
    assert(res.digit == '2' && !res.success);

    // A failure doesn't stop the rest
    assert(r.channel.countSent("INFO") == 3);
    r.receive(makeReply(r.channel.lastSent(), 200));
    assert(r.sink.last(EngineEvent::DTMF_RESULT).digit == '#');
    assert(r.sink.count(EngineEvent::DTMF_RESULT) == 3);

    // Anything still queued fails when the call ends
    r.engine.sendDtmfSequence(callId, "99");
    r.engine.hangup(callId);
    assert(r.channel.lastSent().getMethod() == "BYE");
    r.receive(makeReply(r.channel.lastSent(), 200));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(r.sink.count(EngineEvent::DTMF_RESULT) == 5);
    assert(!r.sink.last(EngineEvent::DTMF_RESULT).success);
    assert(r.engine.sendDtmf(callId, '1') == SIP_ERR_ILLEGAL_TRANSITION);
}

static void reinviteFailureTest() {

    Rig r;
    string callId = answeredCall(r);
    r.engine.hold(callId, SDP_HOLD);
    r.receive(makeReply(r.channel.lastSent(), 481));
    assert(r.state(callId) == CallDialog::STATE_TERMINATING);
    SipMessage bye = r.channel.lastSent();
    assert(bye.getMethod() == "BYE");
    r.receive(makeReply(bye, 200));
    assert(r.state(callId) == CallDialog::STATE_ENDED);
    assert(r.engine.getCall(callId)->getEndReason() == CallDialog::END_NETWORK_ERROR);
}

// A signaling outage doesn't take down a call that still has media
static void transportGraceTest() {

    Rig r;
    string a = answeredCall(r);
    string b = answeredCall(r, "1003");
    assert(r.engine.getActiveCalls().size() == 2);
    assert(r.engine.setMediaAlive(a, true) == SIP_OK);

    r.clock.setTime(1000);
    r.channel.fail("Connection reset");
    pump(r.engine);
    assert(r.state(a) == CallDialog::STATE_CONNECTED);
    assert(r.state(b) == CallDialog::STATE_CONNECTED);
    // New calls have to wait
    string c;
    assert(r.engine.makeCall("alice", "", "1004", SDP_A, c) == SIP_ERR_TRANSPORT_DOWN);

    r.clock.setTime(1000 + 30000 + 100);
    pump(r.engine);
    assert(r.state(a) == CallDialog::STATE_CONNECTED);
    assert(r.state(b) == CallDialog::STATE_FAILED);
    assert(r.engine.getCall(b)->getEndReason() == CallDialog::END_NETWORK_ERROR);

    r.channel.opened();
    pump(r.engine);
    assert(r.engine.getTransport().isConnected());
    r.clock.setTime(100000);
    pump(r.engine);
    assert(r.state(a) == CallDialog::STATE_CONNECTED);
}

int main(int, const char**) {
    outboundTest();
    busyTest();
    glareTest();
    earlyHangupTest();
    cancelTest();
    noAnswerTest();
    inviteTimeoutTest();
    inviteAuthTest();
    inboundTest();
    inboundCancelTest();
    declineTest();
    ackTimeoutTest();
    dtmfTest();
    reinviteFailureTest();
    transportGraceTest();
    cout << "All tests passed" << endl;
    return 0;
}

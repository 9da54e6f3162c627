#include <iostream>
#include <cassert>
#include <string>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "SipError.h"
#include "SipMessage.h"
#include "TransactionManager.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace sipwire;

static SipMessage makeRequest(const char* method, const string& branch, unsigned cseq = 1) {
    SipMessage req = SipMessage::makeRequest(method, "sip:bob@example.com");
    req.addHeader("Via", "SIP/2.0/WSS abc.invalid;branch=" + branch);
    req.addHeader("Max-Forwards", "70");
    req.addHeader("From", "<sip:alice@example.com>;tag=111");
    req.addHeader("To", "<sip:bob@example.com>");
    req.addHeader("Call-ID", "call-1");
    req.addHeader("CSeq", to_string(cseq) + " " + method);
    return req;
}

struct Result {
    int calls = 0;
    int lastHandle = 0;
    int lastCode = 0;
    int lastError = 0;
};

static TransactionManager::Callback recorder(Result& r) {
    return [&r](int handle, const SipMessage& resp, int error) {
        r.calls++;
        r.lastHandle = handle;
        r.lastCode = resp.getStatusCode();
        r.lastError = error;
    };
}

// Matching, provisional vs. final, and unmatched responses
static void clientTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });

    // Can't track a request without a branch
    SipMessage bad = SipMessage::makeRequest("OPTIONS", "sip:example.com");
    bad.addHeader("CSeq", "1 OPTIONS");
    Result r;
    assert(tm.sendRequest(bad, recorder(r)) == SIP_ERR_INVALID_ARGUMENT);
    assert(sent.empty());

    SipMessage req = makeRequest("OPTIONS", "z9hG4bKaaa");
    int h = tm.sendRequest(req, recorder(r));
    assert(h > 0);
    assert(sent.size() == 1);
    assert(tm.isPending(h));
    assert(tm.getPendingCount() == 1);

    // The same branch/method can't be used twice
    assert(tm.sendRequest(req, recorder(r)) == SIP_ERR_INVALID_ARGUMENT);

    // Wrong method, same branch
    SipMessage other = makeReply(req, 200, "t1");
    other.setHeader("CSeq", "1 BYE");
    assert(tm.onResponseReceived(other) == SIP_ERR_NOT_FOUND);
    assert(tm.getUnmatchedCount() == 1);
    assert(r.calls == 0);

    assert(tm.onResponseReceived(makeReply(req, 100)) == SIP_OK);
    assert(r.calls == 1);
    assert(r.lastCode == 100);
    assert(tm.isPending(h));

    assert(tm.onResponseReceived(makeReply(req, 200, "t1")) == SIP_OK);
    assert(r.calls == 2);
    assert(r.lastCode == 200);
    assert(r.lastHandle == h);
    assert(r.lastError == SIP_OK);
    assert(!tm.isPending(h));
    assert(tm.getPendingCount() == 0);

    // A late duplicate has nowhere to go
    assert(tm.onResponseReceived(makeReply(req, 200, "t1")) == SIP_ERR_NOT_FOUND);
    assert(r.calls == 2);
}

// A transaction that never sees a final response
static void timeoutTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });
    tm.setTimeoutMs(32000);

    Result r;
    int h = tm.sendRequest(makeRequest("OPTIONS", "z9hG4bKbbb"), recorder(r));
    int h2 = tm.sendRequest(makeRequest("REGISTER", "z9hG4bKccc"), recorder(r), 5000);
    assert(h > 0 && h2 > 0 && h != h2);

    clock.setTime(4000);
    tm.poll();
    assert(r.calls == 0);

    // The short one goes first
    clock.setTime(5100);
    tm.poll();
    assert(r.calls == 1);
    assert(r.lastHandle == h2);
    assert(r.lastCode == 408);
    assert(r.lastError == SIP_ERR_TRANSACTION_TIMEOUT);

    clock.setTime(32100);
    tm.poll();
    assert(r.calls == 2);
    assert(r.lastHandle == h);
    assert(r.lastError == SIP_ERR_TRANSACTION_TIMEOUT);
    assert(tm.getPendingCount() == 0);

    // No retransmissions on a reliable transport
    assert(sent.size() == 2);
}

// Timer A/E style retransmission when turned on
static void retransmitTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });
    tm.setRetransmit(true);

    Result r;
    SipMessage req = makeRequest("OPTIONS", "z9hG4bKddd");
    tm.sendRequest(req, recorder(r));
    assert(sent.size() == 1);

    clock.setTime(400);
    tm.poll();
    assert(sent.size() == 1);

    clock.setTime(600);
    tm.poll();
    assert(sent.size() == 2);
    assert(sent[1].getBranch() == "z9hG4bKddd");

    // Interval doubles to 1000
    clock.setTime(1500);
    tm.poll();
    assert(sent.size() == 2);
    clock.setTime(1700);
    tm.poll();
    assert(sent.size() == 3);
    assert(tm.getRetransmitCount() == 2);

    // Done once the final response shows up
    tm.onResponseReceived(makeReply(req, 200, "x"));
    clock.setTime(10000);
    tm.poll();
    assert(sent.size() == 3);
}

// A non-2xx final response to an INVITE is acknowledged right here
static void inviteAckTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });

    Result r;
    SipMessage invite = makeRequest("INVITE", "z9hG4bKeee", 7);
    invite.addHeader("Route", "<sip:proxy.example.com;lr>");
    int h = tm.sendRequest(invite, recorder(r));
    assert(h > 0);

    tm.onResponseReceived(makeReply(invite, 486, "busy1"));
    assert(r.calls == 1);
    assert(r.lastCode == 486);
    assert(sent.size() == 2);

    const SipMessage& ack = sent[1];
    assert(ack.getMethod() == "ACK");
    assert(ack.getRequestUri() == invite.getRequestUri());
    assert(ack.getBranch() == "z9hG4bKeee");
    assert(ack.getHeader("CSeq") == "7 ACK");
    assert(ack.getToTag() == "busy1");
    assert(ack.getHeader("Route") == "<sip:proxy.example.com;lr>");

    // A 2xx is the dialog's problem
    SipMessage invite2 = makeRequest("INVITE", "z9hG4bKfff", 8);
    tm.sendRequest(invite2, recorder(r));
    tm.onResponseReceived(makeReply(invite2, 200, "ok1"));
    assert(sent.size() == 3);
    assert(r.lastCode == 200);
}

// Cancellation is only advisory
static void cancelTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });

    Result r;
    SipMessage invite = makeRequest("INVITE", "z9hG4bKggg");
    int h = tm.sendRequest(invite, recorder(r));
    tm.cancel(h);
    assert(tm.isCancelled(h));
    assert(tm.isPending(h));

    tm.onResponseReceived(makeReply(invite, 200, "late"));
    assert(r.calls == 1);
    assert(r.lastCode == 200);
    assert(!tm.isCancelled(h));
}

// Retransmitted inbound requests are answered without bothering anyone
static void serverTest() {

    Log log;
    TestClock clock(log);
    vector<SipMessage> sent;
    TransactionManager tm(log, clock, [&sent](const SipMessage& m) { sent.push_back(m); });

    SipMessage bye = makeRequest("BYE", "z9hG4bKhhh", 3);
    assert(!tm.onRequestReceived(bye));
    // Still being worked on
    assert(tm.onRequestReceived(bye));
    assert(sent.empty());

    SipMessage ok = makeReply(bye, 200, "x");
    tm.onResponseSent(ok);
    assert(tm.onRequestReceived(bye));
    assert(sent.size() == 1);
    assert(sent[0].getStatusCode() == 200);

    // An INVITE that was rejected, then the ACK for it
    SipMessage invite = makeRequest("INVITE", "z9hG4bKiii", 1);
    assert(!tm.onRequestReceived(invite));
    tm.onResponseSent(makeReply(invite, 100));
    tm.onResponseSent(makeReply(invite, 486, "y"));
    SipMessage ack = makeRequest("ACK", "z9hG4bKiii", 1);
    assert(tm.onRequestReceived(ack));

    // An ACK for a 2xx is a new transaction and goes to the dialog
    SipMessage invite2 = makeRequest("INVITE", "z9hG4bKjjj", 2);
    assert(!tm.onRequestReceived(invite2));
    tm.onResponseSent(makeReply(invite2, 200, "z"));
    SipMessage ack2 = makeRequest("ACK", "z9hG4bKkkk", 2);
    assert(!tm.onRequestReceived(ack2));

    // Eventually forgotten
    clock.setTime(40000);
    tm.poll();
    assert(!tm.onRequestReceived(bye));
}

int main(int, const char**) {
    clientTest();
    timeoutTest();
    retransmitTest();
    inviteAckTest();
    cancelTest();
    serverTest();
    cout << "All tests passed" << endl;
    return 0;
}

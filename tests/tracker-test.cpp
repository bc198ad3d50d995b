#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "callpop/call_tracker.hpp"

using namespace std;
using namespace callpop;
using std::chrono::milliseconds;
using std::chrono::seconds;

static const Timestamp T0 = Timestamp(seconds(1700000000));
static const vector<string> TRUNKS = {"PJSIP/trunk", "SIP/trunk"};

static Message ev(const string& text) {
  Message m = parse_message(text);
  assert(m.is_event());
  return m;
}

// Collects notifications in arrival order.
struct Recorder {
  vector<Call> started, answered, ended;
  vector<string> order;

  void attach(CallTracker& t) {
    t.on_call_started([this](const Call& c) { started.push_back(c); order.push_back("started " + c.call_id); });
    t.on_call_answered([this](const Call& c) { answered.push_back(c); order.push_back("answered " + c.call_id); });
    t.on_call_ended([this](const Call& c) { ended.push_back(c); order.push_back("ended " + c.call_id); });
  }
};

static void configure(CallTracker& t, vector<string> monitored, CauseMap causes = CauseMap()) {
  t.configure(ExtensionMatcher(std::move(monitored)), causes, TRUNKS, milliseconds(5000));
}

static const string DIAL_BEGIN_101 =
    "Event: DialBegin\n"
    "Channel: PJSIP/trunk-00000001\n"
    "Uniqueid: 1700000000.1\n"
    "Linkedid: 1700000000.1\n"
    "CallerIDNum: 5551234567\n"
    "CallerIDName: Jane Doe\n"
    "DestChannel: PJSIP/101-00000002\n"
    "DestUniqueid: 1700000000.2\n"
    "DestLinkedid: 1700000000.1\n"
    "DestCallerIDNum: 101\n"
    "DialString: 101";

static void ring_answer_hangup_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  assert(r.started.size() == 1);
  const Call& s = r.started[0];
  assert(s.call_id == "1700000000.2");
  assert(s.linked_id == "1700000000.1");
  assert(s.extension == "101");
  assert(s.channel == "PJSIP/101-00000002");
  assert(s.caller_id_number == "5551234567");
  assert(s.caller_id_name == "Jane Doe");
  assert(s.direction == CallDirection::Inbound);
  assert(s.state == CallState::Ringing);
  assert(s.started_at && *s.started_at == T0);
  assert(t.active_count() == 1);

  t.handle_event(ev("Event: DialEnd\nChannel: PJSIP/trunk-00000001\nUniqueid: 1700000000.1\n"
                    "DestChannel: PJSIP/101-00000002\nDestUniqueid: 1700000000.2\nDialStatus: ANSWER"),
                 T0 + seconds(4));
  assert(r.answered.size() == 1);
  assert(r.answered[0].state == CallState::Answered);
  assert(*r.answered[0].answered_at == T0 + seconds(4));

  // BridgeEnter on an answered call changes nothing
  t.handle_event(ev("Event: BridgeEnter\nChannel: PJSIP/101-00000002\nUniqueid: 1700000000.2"), T0 + seconds(5));
  assert(r.answered.size() == 1);

  t.handle_event(ev("Event: Hangup\nChannel: PJSIP/101-00000002\nUniqueid: 1700000000.2\n"
                    "Cause: 16\nCause-txt: Normal Clearing"),
                 T0 + seconds(64));
  assert(r.ended.size() == 1);
  const Call& e = r.ended[0];
  assert(e.state == CallState::Ended);
  assert(e.end_cause && *e.end_cause == EndCause::NormalClearing);
  assert(e.cause_code == 16);
  assert(e.cause_text == "Normal Clearing");
  assert(*e.ended_at == T0 + seconds(64));
  assert(e.duration() == seconds(60));
  assert(t.active_count() == 0);
  assert(t.active_calls().empty());

  vector<string> expect = {"started 1700000000.2", "answered 1700000000.2", "ended 1700000000.2"};
  assert(r.order == expect);
}

static void no_answer_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  t.handle_event(ev("Event: Hangup\nChannel: PJSIP/101-00000002\nUniqueid: 1700000000.2\n"
                    "Cause: 19\nCause-txt: No answer"),
                 T0 + seconds(30));
  assert(r.answered.empty());
  assert(r.ended.size() == 1);
  assert(*r.ended[0].end_cause == EndCause::NoAnswer);
  assert(!r.ended[0].answered_at);
  assert(r.ended[0].duration() == seconds(30));

  // Duplicate hangup is ignored
  t.handle_event(ev("Event: Hangup\nUniqueid: 1700000000.2\nCause: 16"), T0 + seconds(31));
  assert(r.ended.size() == 1);
}

static void unmonitored_test() {
  CallTracker t;
  configure(t, {"102"});
  Recorder r;
  r.attach(t);
  t.handle_event(ev(DIAL_BEGIN_101), T0);
  assert(r.started.empty());

  // Events for calls nobody tracks are ignored
  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/101-00000002\nUniqueid: 1700000000.2\nChannelStateDesc: Up"), T0);
  t.handle_event(ev("Event: Hangup\nUniqueid: 1700000000.2\nCause: 16"), T0);
  assert(r.answered.empty() && r.ended.empty());

  // The monitored set can change at runtime
  t.set_monitored(ExtensionMatcher({"_1XX"}));
  t.handle_event(ev(DIAL_BEGIN_101), T0);
  assert(r.started.size() == 1);
  assert(r.started[0].extension == "101");
}

static void outbound_and_internal_test() {
  CallTracker t;
  configure(t, {"101", "102"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/101-00000020\nUniqueid: u20\nLinkedid: u20\n"
                    "CallerIDNum: 101\nDestChannel: PJSIP/trunk-00000021\nDestUniqueid: u21\n"
                    "DestCallerIDNum: <unknown>\nExten: 5559990000"),
                 T0);
  assert(r.started.size() == 1);
  assert(r.started[0].call_id == "u20");
  assert(r.started[0].direction == CallDirection::Outbound);
  assert(r.started[0].caller_id_number == "5559990000");

  // The far end's trunk leg rings back with the caller as its connected line
  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/trunk-00000021\nUniqueid: u21\nLinkedid: u20\n"
                    "ChannelStateDesc: Ringing\nCallerIDNum: 5559990000\nConnectedLineNum: 101"),
                 T0 + seconds(1));
  assert(r.started.size() == 1);
  assert(t.active_count() == 1);

  // The trunk leg presents our outbound number, which is not the remote party
  t.handle_event(ev("Event: NewCallerid\nChannel: PJSIP/trunk-00000021\nUniqueid: u21\nLinkedid: u20\n"
                    "CallerIDNum: 2125550100\nCallerIDName: Example Corp"),
                 T0 + seconds(1));
  auto out = t.find_call("u20");
  assert(out->caller_id_number == "5559990000");
  assert(out->caller_id_name.empty());

  t.handle_event(ev("Event: NewConnectedLine\nChannel: PJSIP/101-00000020\nUniqueid: u20\nLinkedid: u20\n"
                    "CallerIDNum: 101\nConnectedLineNum: 5559990000\nConnectedLineName: Acme Support"),
                 T0 + seconds(2));
  out = t.find_call("u20");
  assert(out->caller_id_number == "5559990000");
  assert(out->caller_id_name == "Acme Support");
  assert(out->direction == CallDirection::Outbound);

  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/101-00000030\nUniqueid: u30\nLinkedid: u30\n"
                    "CallerIDNum: 101\nCallerIDName: Alice\nDestChannel: PJSIP/102-00000031\n"
                    "DestUniqueid: u31\nDestLinkedid: u30\nDestCallerIDNum: 102\nDestCallerIDName: Bob\nExten: 102"),
                 T0);
  // Both ends are monitored: one call per extension leg
  assert(r.started.size() == 3);
  assert(r.started[1].call_id == "u31");
  assert(r.started[1].extension == "102");
  assert(r.started[1].caller_id_number == "101");
  assert(r.started[1].caller_id_name == "Alice");
  assert(r.started[1].direction == CallDirection::Internal);
  assert(r.started[2].call_id == "u30");
  assert(r.started[2].caller_id_name == "Bob");
  assert(r.started[2].direction == CallDirection::Internal);
  assert(t.active_count() == 3);

  // The caller renaming itself shows up on the callee's call only
  t.handle_event(ev("Event: NewCallerid\nChannel: PJSIP/101-00000030\nUniqueid: u30\nLinkedid: u30\n"
                    "CallerIDNum: 101\nCallerIDName: Alice Smith\nConnectedLineNum: 102\nConnectedLineName: Bob"),
                 T0);
  assert(t.find_call("u31")->caller_id_name == "Alice Smith");
  assert(t.find_call("u30")->caller_id_name == "Bob");
  assert(t.find_call("u30")->caller_id_number == "102");
}

static void newstate_ringing_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/101-00000040\nUniqueid: u40\nLinkedid: u39\n"
                    "ChannelStateDesc: Ringing\nConnectedLineNum: 5559876543\nConnectedLineName: <unknown>"),
                 T0);
  assert(r.started.size() == 1);
  assert(r.started[0].caller_id_number == "5559876543");
  assert(r.started[0].caller_id_name.empty());
  assert(r.started[0].direction == CallDirection::Inbound);

  // A repeat ringing state starts nothing new
  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/101-00000040\nUniqueid: u40\nChannelStateDesc: Ringing"), T0);
  assert(r.started.size() == 1);

  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/101-00000040\nUniqueid: u40\nChannelStateDesc: Up\n"
                    "ConnectedLineNum: 5559876543\nConnectedLineName: Carol"),
                 T0 + seconds(2));
  assert(r.answered.size() == 1);
  assert(r.answered[0].caller_id_name == "Carol");
}

static void legacy_trunk_ringing_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev("Event: Newchannel\nChannel: PJSIP/trunk-00000050\nUniqueid: u50\n"
                    "ChannelStateDesc: Ringing\nCallerIDNum: 5550001111\nCallerIDName: Dave\nConnectedLineNum: 101"),
                 T0);
  assert(r.started.size() == 1);
  assert(r.started[0].call_id == "u50");
  assert(r.started[0].extension == "101");
  assert(r.started[0].caller_id_number == "5550001111");
  assert(r.started[0].direction == CallDirection::Inbound);

  // The tracked channel is the caller's: its connected line is the extension
  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/trunk-00000050\nUniqueid: u50\nChannelStateDesc: Up\n"
                    "CallerIDNum: 5550001111\nCallerIDName: Dave\n"
                    "ConnectedLineNum: 101\nConnectedLineName: Front Desk"),
                 T0 + seconds(3));
  assert(r.answered.size() == 1);
  assert(r.answered[0].caller_id_number == "5550001111");
  assert(r.answered[0].caller_id_name == "Dave");

  t.handle_event(ev("Event: NewConnectedLine\nChannel: PJSIP/trunk-00000050\nUniqueid: u50\n"
                    "ConnectedLineNum: 101\nConnectedLineName: Front Desk"),
                 T0 + seconds(4));
  t.handle_event(ev("Event: NewCallerid\nChannel: PJSIP/trunk-00000050\nUniqueid: u50\n"
                    "CallerIDNum: 5550001111\nCallerIDName: Dave Smith"),
                 T0 + seconds(5));
  auto c = t.find_call("u50");
  assert(c->caller_id_number == "5550001111");
  assert(c->caller_id_name == "Dave Smith");
  assert(r.started.size() == 1);

  // A modern server already reported the extension leg: the ringing trunk is the same call
  CallTracker modern;
  configure(modern, {"101"});
  Recorder m;
  m.attach(modern);
  modern.handle_event(ev(DIAL_BEGIN_101), T0);
  modern.handle_event(ev("Event: Newstate\nChannel: PJSIP/trunk-00000001\nUniqueid: 1700000000.1\n"
                         "Linkedid: 1700000000.1\nChannelStateDesc: Ringing\n"
                         "CallerIDNum: 5551234567\nConnectedLineNum: 101"),
                      T0 + seconds(1));
  assert(m.started.size() == 1);
  assert(m.started[0].call_id == "1700000000.2");
  assert(modern.active_count() == 1);
}

static void local_ring_group_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/trunk-00000001\nUniqueid: u1\nLinkedid: u1\n"
                    "CallerIDNum: 5551234567\nCallerIDName: Jane\n"
                    "DestChannel: Local/101@from-queue-00000003;1\nDestUniqueid: u2\nDestLinkedid: u1\n"
                    "DestCallerIDNum: 101"),
                 T0);
  t.handle_event(ev("Event: Newstate\nChannel: Local/101@from-queue-00000003;1\nUniqueid: u2\nLinkedid: u1\n"
                    "ChannelStateDesc: Ringing\nCallerIDNum: 101\nConnectedLineNum: 5551234567"),
                 T0);
  assert(r.started.empty());

  t.handle_event(ev("Event: DialBegin\nChannel: Local/101@from-queue-00000003;2\nUniqueid: u3\nLinkedid: u1\n"
                    "CallerIDNum: 5551234567\nCallerIDName: Jane\n"
                    "DestChannel: PJSIP/101-00000004\nDestUniqueid: u4\nDestLinkedid: u1\nDestCallerIDNum: 101"),
                 T0 + seconds(1));
  assert(r.started.size() == 1);
  const Call& s = r.started[0];
  assert(s.call_id == "u4");
  assert(s.channel == "PJSIP/101-00000004");
  assert(s.caller_id_number == "5551234567");
  assert(s.direction == CallDirection::Inbound);

  // The caller's trunk leg ringing back belongs to the same call
  t.handle_event(ev("Event: Newstate\nChannel: PJSIP/trunk-00000001\nUniqueid: u1\nLinkedid: u1\n"
                    "ChannelStateDesc: Ringing\nCallerIDNum: 5551234567\nConnectedLineNum: 101"),
                 T0 + seconds(1));
  assert(r.started.size() == 1);
  assert(t.active_count() == 1);

  t.handle_event(ev("Event: NewCallerid\nChannel: PJSIP/trunk-00000001\nUniqueid: u1\nLinkedid: u1\n"
                    "CallerIDNum: 5551234567\nCallerIDName: Jane Doe"),
                 T0 + seconds(2));
  assert(t.find_call("u4")->caller_id_name == "Jane Doe");

  // Monitoring everything still skips the Local halves
  t.set_monitored(ExtensionMatcher());
  t.handle_event(ev("Event: DialBegin\nChannel: Local/102@from-queue-00000005;2\nUniqueid: u6\nLinkedid: u1\n"
                    "CallerIDNum: 5551234567\nDestChannel: PJSIP/102-00000007\nDestUniqueid: u7\n"
                    "DestLinkedid: u1"),
                 T0 + seconds(2));
  assert(r.started.size() == 2);
  assert(r.started[1].call_id == "u7");

  t.handle_event(ev("Event: Hangup\nChannel: PJSIP/101-00000004\nUniqueid: u4\nCause: 26"), T0 + seconds(3));
  assert(r.ended.size() == 1);
  assert(*r.ended[0].end_cause == EndCause::NormalClearing);
  assert(t.active_count() == 1);
}

static void identity_and_direction_updates_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);
  t.handle_event(ev(DIAL_BEGIN_101), T0);

  // Never reverted to empty
  t.handle_event(ev("Event: NewConnectedLine\nChannel: PJSIP/101-00000002\nUniqueid: 1700000000.2\n"
                    "ConnectedLineNum: <unknown>\nConnectedLineName: "),
                 T0);
  auto c = t.find_call("1700000000.2");
  assert(c && c->caller_id_number == "5551234567" && c->caller_id_name == "Jane Doe");

  // Another leg of the same linked call updates its own caller id
  t.handle_event(ev("Event: NewCallerid\nChannel: PJSIP/trunk-00000001\nUniqueid: 1700000000.1\n"
                    "Linkedid: 1700000000.1\nCallerIDNum: 5551234567\nCallerIDName: Jane Q. Doe"),
                 T0);
  c = t.find_call("1700000000.2");
  assert(c->caller_id_name == "Jane Q. Doe");

  t.handle_event(ev("Event: VarSet\nChannel: PJSIP/trunk-00000001\nUniqueid: 1700000000.1\n"
                    "Linkedid: 1700000000.1\nVariable: __CALL_DIR\nValue: internal"),
                 T0);
  assert(t.find_call("1700000000.2")->direction == CallDirection::Internal);

  t.handle_event(ev("Event: Rename\nChannel: PJSIP/101-00000002\nNewname: PJSIP/101-00000002<ZOMBIE>\n"
                    "Uniqueid: 1700000000.2"),
                 T0);
  assert(t.find_call("1700000000.2")->channel == "PJSIP/101-00000002<ZOMBIE>");
}

static void monotonic_timestamps_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  // Server timestamps win over arrival time
  t.handle_event(ev(DIAL_BEGIN_101 + "\nTimestamp: 1700000100.500000"), T0);
  assert(*r.started[0].started_at == T0 + milliseconds(100500));

  // An answer stamped before the ring is clamped
  t.handle_event(ev("Event: BridgeEnter\nUniqueid: 1700000000.2\nTimestamp: 1700000050.000000"), T0);
  assert(*r.answered[0].answered_at == *r.answered[0].started_at);

  t.handle_event(ev("Event: Hangup\nUniqueid: 1700000000.2\nCause: 16"), T0);
  const Call& e = r.ended[0];
  assert(*e.started_at <= *e.answered_at);
  assert(*e.answered_at <= *e.ended_at);

  Message bad = ev("Event: Hangup\nTimestamp: soon");
  assert(event_time(bad, T0) == T0);
  assert(event_time(ev("Event: X\nTimestamp: 1700000000"), T0 + seconds(9)) == T0);
  assert(event_time(ev("Event: X\nTimestamp: 1700000000.25"), T0) == T0 + milliseconds(250));
}

static void cause_mapping_test() {
  CauseMap causes;
  causes.set(19, EndCause::Busy);
  CallTracker t;
  configure(t, {"101"}, causes);
  Recorder r;
  r.attach(t);

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  t.handle_event(ev("Event: Hangup\nUniqueid: 1700000000.2\nCause: 19"), T0);
  assert(*r.ended[0].end_cause == EndCause::Busy);

  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/trunk-1\nDestChannel: PJSIP/101-3\nDestUniqueid: u3"), T0);
  t.handle_event(ev("Event: Hangup\nUniqueid: u3\nCause: 999"), T0);
  assert(*r.ended.back().end_cause == EndCause::Unknown);
  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/trunk-1\nDestChannel: PJSIP/101-4\nDestUniqueid: u4"), T0);
  t.handle_event(ev("Event: Hangup\nUniqueid: u4"), T0);
  assert(*r.ended.back().end_cause == EndCause::Unknown);
}

static void grace_window_test() {
  CallTracker t;
  configure(t, {"101"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  t.handle_event(ev("Event: Hangup\nUniqueid: 1700000000.2\nCause: 16"), T0 + seconds(1));
  assert(t.retained_count() == 1);
  auto c = t.find_call("1700000000.2");
  assert(c && c->ended());

  // Late ringing inside the grace window does not resurrect the call
  t.handle_event(ev(DIAL_BEGIN_101), T0 + seconds(2));
  assert(r.started.size() == 1);

  assert(t.sweep(T0 + seconds(3)) == 0);
  assert(t.sweep(T0 + seconds(7)) == 1);
  assert(!t.find_call("1700000000.2"));

  // After the purge the same id is a brand new call
  t.handle_event(ev(DIAL_BEGIN_101), T0 + seconds(8));
  assert(r.started.size() == 2);
  assert(t.find_call("1700000000.2")->state == CallState::Ringing);
}

static void end_all_test() {
  CallTracker t;
  configure(t, {"101", "102"});
  Recorder r;
  r.attach(t);

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  t.handle_event(ev("Event: DialBegin\nChannel: PJSIP/trunk-9\nCallerIDNum: 5550000000\n"
                    "DestChannel: PJSIP/102-9\nDestUniqueid: u9"),
                 T0);
  t.handle_event(ev("Event: BridgeEnter\nUniqueid: u9"), T0 + seconds(1));

  assert(t.end_all(EndCause::ConnectionLost, T0 + seconds(10)) == 2);
  assert(r.ended.size() == 2);
  for (const auto& c : r.ended) {
    assert(*c.end_cause == EndCause::ConnectionLost);
    assert(*c.ended_at == T0 + seconds(10));
  }
  assert(t.active_count() == 0);
  assert(t.end_all(EndCause::ConnectionLost, T0 + seconds(11)) == 0);
}

static void throwing_handler_test() {
  CallTracker t;
  configure(t, {"101"});
  int seen = 0;
  int bad = t.on_call_started([](const Call&) { throw runtime_error("subscriber bug"); });
  t.on_call_started([&](const Call&) { seen++; });

  t.handle_event(ev(DIAL_BEGIN_101), T0);
  assert(seen == 1);

  assert(t.unsubscribe(bad));
  assert(!t.unsubscribe(bad));
}

static void matcher_test() {
  assert(match_dial_pattern("_1XX", "101"));
  assert(!match_dial_pattern("_1XX", "1011"));
  assert(match_dial_pattern("_NXX", "250"));
  assert(!match_dial_pattern("_NXX", "150"));
  assert(match_dial_pattern("_Z.", "91"));
  assert(!match_dial_pattern("_Z.", "9"));
  assert(match_dial_pattern("_9!", "9"));
  assert(match_dial_pattern("_[1-3]0X", "205"));
  assert(!match_dial_pattern("_[1-3]0X", "405"));
  assert(!match_dial_pattern("1XX", "101"));
  assert(match_dial_pattern("1XX", "1XX"));

  ExtensionMatcher all;
  assert(all.monitors_all());
  assert(all.matches("101"));
  assert(all.matches("123456"));
  assert(!all.matches("1234567"));
  assert(!all.matches("provider"));
  assert(!all.matches(""));
}

int main(int, const char**) {
  spdlog::set_level(spdlog::level::off);
  ring_answer_hangup_test();
  no_answer_test();
  unmonitored_test();
  outbound_and_internal_test();
  newstate_ringing_test();
  legacy_trunk_ringing_test();
  local_ring_group_test();
  identity_and_direction_updates_test();
  monotonic_timestamps_test();
  cause_mapping_test();
  grace_window_test();
  end_all_test();
  throwing_handler_test();
  matcher_test();
  cout << "tracker-test OK" << endl;
  return 0;
}

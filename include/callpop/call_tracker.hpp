#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "callpop/call.hpp"
#include "callpop/cause_map.hpp"
#include "callpop/event_router.hpp"
#include "callpop/extension_matcher.hpp"
#include "callpop/message.hpp"

namespace callpop {

// Rebuilds call lifecycles for monitored extensions from AMI events.
//
// handle_event() runs on the session's read loop, which is the only writer.
// Queries take the lock and return copies. Notifications are emitted after
// the lock is released, in the order the events arrived.
class CallTracker {
public:
  using CallHandler = std::function<void(const Call&)>;

  CallTracker();

  void configure(ExtensionMatcher monitored, CauseMap causes,
                 std::vector<std::string> trunkPrefixes,
                 std::chrono::milliseconds endedGrace);
  void set_monitored(ExtensionMatcher monitored);

  int on_call_started(CallHandler h) { return started_.subscribe(std::move(h)); }
  int on_call_answered(CallHandler h) { return answered_.subscribe(std::move(h)); }
  int on_call_ended(CallHandler h) { return ended_.subscribe(std::move(h)); }
  bool unsubscribe(int id);

  void handle_event(const Message& event, Timestamp now = std::chrono::system_clock::now());

  // Ends every open call with the given cause, e.g. when the link drops.
  std::size_t end_all(EndCause cause, Timestamp now = std::chrono::system_clock::now());

  // Forgets ended calls whose grace window has passed.
  std::size_t sweep(Timestamp now = std::chrono::system_clock::now());

  std::vector<Call> active_calls() const;
  // Active calls and ended calls still inside their grace window.
  std::optional<Call> find_call(const std::string& callId) const;

  std::size_t active_count() const;
  std::size_t retained_count() const;

private:
  enum class Transition { Started, Answered, Ended };
  using Notices = std::vector<std::pair<Transition, Call>>;

  struct Leg {
    std::string uniqueid;
    std::string linkedid;
    std::string channel;
    std::string extension;
    std::string remote_num;
    std::string remote_name;
    CallDirection direction = CallDirection::Unknown;
    // False when the tracked channel is the remote party's (older servers)
    bool own_leg = true;
    bool extension_is_callee = true;
    std::string remote_uid;
  };

  void on_state_event(const Message& ev, Timestamp ts, Notices& out);
  void on_dial_begin(const Message& ev, Timestamp ts, Notices& out);
  void on_dial_end(const Message& ev, Timestamp ts, Notices& out);
  void on_rename(const Message& ev);
  void on_caller_id(const Message& ev);
  void on_var_set(const Message& ev);

  void merge_leg_identity(Call& c, const Leg& leg, const Message& ev);
  bool belongs_to_tracked_call(const std::string& uniqueid, const std::string& linkedid,
                               const std::string& extension) const;

  void start_call(const Leg& leg, Timestamp ts, Notices& out);
  void answer_call(const std::string& uniqueid, Timestamp ts, Notices& out);
  void end_call(const std::string& uniqueid, Timestamp ts, Timestamp now, EndCause cause,
                int code, const std::string& text, Notices& out);
  void emit(const Notices& notices) const;

  std::string monitored_extension(const std::string& channel) const;
  bool is_trunk(const std::string& channel) const;
  CallDirection guess_direction(const std::string& otherChannel, const std::string& remoteNum,
                                bool extensionIsCallee) const;

  mutable std::mutex mu_;
  std::map<std::string, Call> active_;
  std::map<std::string, Leg> legs_;  // by call id, active calls only
  struct Retained {
    Call call;
    Timestamp retire_at;
  };
  std::map<std::string, Retained> retained_;

  ExtensionMatcher monitored_;
  CauseMap causes_;
  std::vector<std::string> trunk_prefixes_;
  std::chrono::milliseconds ended_grace_{5000};

  HandlerList<const Call&> started_;
  HandlerList<const Call&> answered_;
  HandlerList<const Call&> ended_;
};

// Parses the "Timestamp: 1700000000.123456" field servers add when
// timestampevents is on. Returns fallback when absent or malformed.
Timestamp event_time(const Message& event, Timestamp fallback);

}  // namespace callpop

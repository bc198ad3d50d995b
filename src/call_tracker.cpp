#include "callpop/call_tracker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "callpop/strings.hpp"

namespace callpop {

namespace {

// Servers send "<unknown>" for identity they do not have
std::string clean_id(const std::string& v) {
  std::string t = trim(v);
  if (t.empty() || iequals(t, "<unknown>")) return "";
  return t;
}

void merge_identity(Call& c, const std::string& num, const std::string& name) {
  std::string n = clean_id(num);
  std::string m = clean_id(name);
  if (!n.empty()) c.caller_id_number = n;
  if (!m.empty()) c.caller_id_name = m;
}

}  // namespace

Timestamp event_time(const Message& event, Timestamp fallback) {
  std::string ts = trim(event.get("Timestamp"));
  if (ts.empty()) return fallback;
  auto dot = ts.find('.');
  std::string secPart = ts.substr(0, dot);
  std::string fracPart = dot == std::string::npos ? "" : ts.substr(dot + 1);
  if (!all_digits(secPart) || (!fracPart.empty() && !all_digits(fracPart))) return fallback;
  try {
    long long sec = std::stoll(secPart);
    fracPart = fracPart.substr(0, 6);
    while (fracPart.size() < 6) fracPart += '0';
    long long usec = std::stoll(fracPart);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(sec) + std::chrono::microseconds(usec)));
  } catch (const std::out_of_range&) {
    return fallback;
  }
}

CallTracker::CallTracker() = default;

void CallTracker::configure(ExtensionMatcher monitored, CauseMap causes,
                            std::vector<std::string> trunkPrefixes,
                            std::chrono::milliseconds endedGrace) {
  std::lock_guard<std::mutex> lk(mu_);
  monitored_ = std::move(monitored);
  causes_ = std::move(causes);
  trunk_prefixes_ = std::move(trunkPrefixes);
  ended_grace_ = endedGrace;
}

void CallTracker::set_monitored(ExtensionMatcher monitored) {
  std::lock_guard<std::mutex> lk(mu_);
  monitored_ = std::move(monitored);
}

bool CallTracker::unsubscribe(int id) {
  return started_.unsubscribe(id) || answered_.unsubscribe(id) || ended_.unsubscribe(id);
}

void CallTracker::handle_event(const Message& ev, Timestamp now) {
  const std::string event = ev.event_name();
  if (event.empty()) return;
  const Timestamp ts = event_time(ev, now);

  Notices notices;
  {
    std::lock_guard<std::mutex> lk(mu_);

    if (event == "Newchannel" || event == "Newstate") {
      on_state_event(ev, ts, notices);
    } else if (event == "DialBegin" || event == "Dial") {
      on_dial_begin(ev, ts, notices);
    } else if (event == "DialEnd") {
      on_dial_end(ev, ts, notices);
    } else if (event == "BridgeEnter") {
      answer_call(ev.get("Uniqueid"), ts, notices);
    } else if (event == "Hangup") {
      const std::string cause = ev.get("Cause");
      end_call(ev.get("Uniqueid"), ts, now, causes_.map(cause), to_int_safe(cause, 0),
               ev.get("Cause-txt"), notices);
    } else if (event == "Rename") {
      on_rename(ev);
    } else if (event == "NewCallerid" || event == "NewConnectedLine") {
      on_caller_id(ev);
    } else if (event == "VarSet") {
      on_var_set(ev);
    } else if (event == "FullyBooted") {
      spdlog::info("PBX reports fully booted");
    }
  }
  emit(notices);
}

void CallTracker::on_state_event(const Message& ev, Timestamp ts, Notices& out) {
  const std::string uid = ev.get("Uniqueid");
  const std::string desc = ev.get("ChannelStateDesc");
  const std::string channel = ev.get("Channel");

  auto it = active_.find(uid);
  if (it != active_.end()) {
    auto lit = legs_.find(uid);
    if (lit != legs_.end()) merge_leg_identity(it->second, lit->second, ev);
    if (iequals(desc, "Up")) answer_call(uid, ts, out);
    return;
  }
  if (!iequals(desc, "Ringing") || uid.empty()) return;

  Leg leg;
  leg.uniqueid = uid;
  leg.linkedid = ev.get("Linkedid");
  leg.channel = channel;
  leg.extension = monitored_extension(channel);
  if (!leg.extension.empty()) {
    // The extension's own leg: the other party is its connected line
    leg.remote_num = clean_id(ev.get("ConnectedLineNum"));
    leg.remote_name = clean_id(ev.get("ConnectedLineName"));
    leg.direction = guess_direction("", leg.remote_num, true);
    start_call(leg, ts, out);
    return;
  }

  // Older servers: a trunk leg ringing towards the extension in ConnectedLineNum.
  // Only used when no leg of the extension is tracked for this call.
  const std::string conn = clean_id(ev.get("ConnectedLineNum"));
  if (!is_trunk(channel) || conn.empty() || !monitored_.matches(conn)) return;
  if (belongs_to_tracked_call(uid, leg.linkedid, conn)) {
    spdlog::debug("Trunk leg {} already covered by a tracked call", uid);
    return;
  }
  leg.extension = conn;
  leg.own_leg = false;
  leg.remote_num = clean_id(ev.get("CallerIDNum"));
  leg.remote_name = clean_id(ev.get("CallerIDName"));
  leg.direction = CallDirection::Inbound;
  start_call(leg, ts, out);
}

void CallTracker::on_dial_begin(const Message& ev, Timestamp ts, Notices& out) {
  const std::string src = ev.get("Channel");
  const std::string dest = ev.get("DestChannel");

  // Someone is ringing a monitored extension
  std::string destExt = monitored_extension(dest);
  if (!destExt.empty() && !ev.get("DestUniqueid").empty()) {
    Leg leg;
    leg.uniqueid = ev.get("DestUniqueid");
    leg.linkedid = ev.get("DestLinkedid");
    leg.channel = dest;
    leg.extension = destExt;
    leg.remote_num = clean_id(ev.get("CallerIDNum"));
    leg.remote_name = clean_id(ev.get("CallerIDName"));
    leg.remote_uid = ev.get("Uniqueid");
    leg.direction = guess_direction(src, leg.remote_num, true);
    start_call(leg, ts, out);
  }

  // A monitored extension is dialing out
  std::string srcExt = monitored_extension(src);
  if (!srcExt.empty() && !ev.get("Uniqueid").empty()) {
    Leg leg;
    leg.uniqueid = ev.get("Uniqueid");
    leg.linkedid = ev.get("Linkedid");
    leg.channel = src;
    leg.extension = srcExt;
    leg.remote_num = clean_id(ev.get("DestCallerIDNum"));
    if (leg.remote_num.empty() || leg.remote_num == srcExt) leg.remote_num = clean_id(ev.get("Exten"));
    leg.remote_name = clean_id(ev.get("DestCallerIDName"));
    leg.extension_is_callee = false;
    leg.remote_uid = ev.get("DestUniqueid");
    leg.direction = guess_direction(dest, leg.remote_num, false);
    start_call(leg, ts, out);
  }
}

void CallTracker::on_dial_end(const Message& ev, Timestamp ts, Notices& out) {
  if (!iequals(ev.get("DialStatus"), "ANSWER")) return;
  answer_call(ev.get("DestUniqueid"), ts, out);
  answer_call(ev.get("Uniqueid"), ts, out);
}

void CallTracker::on_rename(const Message& ev) {
  const std::string newName = ev.get("Newname");
  if (newName.empty()) return;
  std::string oldName = ev.get("Oldname");
  if (oldName.empty()) oldName = ev.get("Channel");
  const std::string uid = ev.get("Uniqueid");

  for (auto& entry : active_) {
    Call& c = entry.second;
    if ((!uid.empty() && c.call_id == uid) || (uid.empty() && c.channel == oldName)) {
      spdlog::debug("Call {} channel {} -> {}", c.call_id, c.channel, newName);
      c.channel = newName;
    }
  }
}

void CallTracker::on_caller_id(const Message& ev) {
  const std::string uid = ev.get("Uniqueid");
  auto it = active_.find(uid);
  auto lit = legs_.find(uid);
  if (it != active_.end() && lit != legs_.end()) merge_leg_identity(it->second, lit->second, ev);

  if (ev.event_name() != "NewCallerid" || uid.empty()) return;
  // The calling party's channel changed its own caller id. A callee channel
  // presents the caller's number, so it never updates an outbound call.
  const std::string linked = ev.get("Linkedid");
  const bool trunk = is_trunk(ev.get("Channel"));
  for (const auto& entry : legs_) {
    const Leg& leg = entry.second;
    if (entry.first == uid || !leg.extension_is_callee) continue;
    bool caller = leg.remote_uid == uid || (trunk && !linked.empty() && leg.linkedid == linked);
    if (!caller) continue;
    auto cit = active_.find(entry.first);
    if (cit != active_.end()) merge_identity(cit->second, ev.get("CallerIDNum"), ev.get("CallerIDName"));
  }
}

void CallTracker::merge_leg_identity(Call& c, const Leg& leg, const Message& ev) {
  // A channel reports its own party as CallerID and the far side as ConnectedLine
  if (leg.own_leg)
    merge_identity(c, ev.get("ConnectedLineNum"), ev.get("ConnectedLineName"));
  else
    merge_identity(c, ev.get("CallerIDNum"), ev.get("CallerIDName"));
}

bool CallTracker::belongs_to_tracked_call(const std::string& uniqueid, const std::string& linkedid,
                                          const std::string& extension) const {
  for (const auto& entry : legs_) {
    const Leg& leg = entry.second;
    if (!uniqueid.empty() && leg.remote_uid == uniqueid) return true;
    if (!linkedid.empty() && leg.linkedid == linkedid && leg.extension == extension) return true;
  }
  return false;
}

void CallTracker::on_var_set(const Message& ev) {
  const std::string var = ev.get("Variable");
  if (var != "CALL_DIR" && var != "__CALL_DIR") return;
  auto dir = direction_from_string(ev.get("Value"));
  if (!dir) return;
  const std::string uid = ev.get("Uniqueid");
  const std::string linked = ev.get("Linkedid");
  for (auto& entry : active_) {
    Call& c = entry.second;
    if (c.call_id == uid || (!linked.empty() && c.linked_id == linked)) c.direction = *dir;
  }
}

void CallTracker::start_call(const Leg& leg, Timestamp ts, Notices& out) {
  auto it = active_.find(leg.uniqueid);
  if (it != active_.end()) {
    Call& c = it->second;
    merge_identity(c, leg.remote_num, leg.remote_name);
    if (c.direction == CallDirection::Unknown) c.direction = leg.direction;
    Leg& known = legs_[leg.uniqueid];
    if (known.remote_uid.empty()) known.remote_uid = leg.remote_uid;
    return;
  }
  if (retained_.count(leg.uniqueid)) {
    spdlog::debug("Ignoring late ringing for ended call {}", leg.uniqueid);
    return;
  }

  Call c;
  c.call_id = leg.uniqueid;
  c.linked_id = leg.linkedid;
  c.channel = leg.channel;
  c.extension = leg.extension;
  c.caller_id_number = leg.remote_num;
  c.caller_id_name = leg.remote_name;
  c.direction = leg.direction;
  c.state = CallState::Ringing;
  c.started_at = ts;

  spdlog::info("Call {} ringing on {} ({}) from {} <{}>", c.call_id, c.extension,
               to_string(c.direction), c.caller_id_name.empty() ? "Unknown" : c.caller_id_name,
               c.caller_id_number.empty() ? "unknown" : c.caller_id_number);
  active_.emplace(c.call_id, c);
  legs_[c.call_id] = leg;
  out.emplace_back(Transition::Started, c);
}

void CallTracker::answer_call(const std::string& uniqueid, Timestamp ts, Notices& out) {
  auto it = active_.find(uniqueid);
  if (it == active_.end() || it->second.state != CallState::Ringing) return;
  Call& c = it->second;
  c.state = CallState::Answered;
  c.answered_at = std::max(ts, *c.started_at);
  spdlog::info("Call {} answered on {}", c.call_id, c.extension);
  out.emplace_back(Transition::Answered, c);
}

void CallTracker::end_call(const std::string& uniqueid, Timestamp ts, Timestamp now, EndCause cause,
                           int code, const std::string& text, Notices& out) {
  auto it = active_.find(uniqueid);
  if (it == active_.end()) {
    if (retained_.count(uniqueid)) spdlog::debug("Duplicate hangup for {}", uniqueid);
    return;
  }
  Call c = std::move(it->second);
  active_.erase(it);
  legs_.erase(uniqueid);

  Timestamp floor = c.answered_at ? *c.answered_at : *c.started_at;
  c.state = CallState::Ended;
  c.ended_at = std::max(ts, floor);
  c.end_cause = cause;
  c.cause_code = code;
  c.cause_text = text;

  spdlog::info("Call {} on {} ended: {} ({} {})", c.call_id, c.extension, to_string(cause), code, text);
  retained_[c.call_id] = Retained{c, now + ended_grace_};
  out.emplace_back(Transition::Ended, std::move(c));
}

std::size_t CallTracker::end_all(EndCause cause, Timestamp now) {
  Notices notices;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> ids;
    for (const auto& entry : active_) ids.push_back(entry.first);
    for (const auto& id : ids) end_call(id, now, now, cause, 0, to_string(cause), notices);
  }
  emit(notices);
  return notices.size();
}

std::size_t CallTracker::sweep(Timestamp now) {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (auto it = retained_.begin(); it != retained_.end();) {
    if (it->second.retire_at <= now) {
      it = retained_.erase(it);
      n++;
    } else {
      ++it;
    }
  }
  return n;
}

std::vector<Call> CallTracker::active_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Call> out;
  out.reserve(active_.size());
  for (const auto& entry : active_) out.push_back(entry.second);
  return out;
}

std::optional<Call> CallTracker::find_call(const std::string& callId) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = active_.find(callId);
  if (it != active_.end()) return it->second;
  auto rit = retained_.find(callId);
  if (rit != retained_.end()) return rit->second.call;
  return std::nullopt;
}

std::size_t CallTracker::active_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_.size();
}

std::size_t CallTracker::retained_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return retained_.size();
}

void CallTracker::emit(const Notices& notices) const {
  for (const auto& n : notices) {
    switch (n.first) {
      case Transition::Started: started_.emit(n.second); break;
      case Transition::Answered: answered_.emit(n.second); break;
      case Transition::Ended: ended_.emit(n.second); break;
    }
  }
}

std::string CallTracker::monitored_extension(const std::string& channel) const {
  std::string tech, peer;
  parse_tech_peer(channel, tech, peer);
  // Local channels are dialplan plumbing (ring groups, follow-me), never a phone
  if (peer.empty() || tech == "Local" || is_trunk(channel)) return "";
  return monitored_.matches(peer) ? peer : "";
}

bool CallTracker::is_trunk(const std::string& channel) const {
  if (channel.empty()) return false;
  std::string lch = lower(channel);
  for (const auto& p : trunk_prefixes_) {
    if (lch.find(lower(p)) != std::string::npos) return true;
  }
  return false;
}

CallDirection CallTracker::guess_direction(const std::string& otherChannel, const std::string& remoteNum,
                                           bool extensionIsCallee) const {
  const CallDirection external = extensionIsCallee ? CallDirection::Inbound : CallDirection::Outbound;
  if (is_trunk(otherChannel)) return external;

  std::string tech, peer;
  parse_tech_peer(otherChannel, tech, peer);
  if (looks_like_extension(peer) && tech != "Local") return CallDirection::Internal;

  if (remoteNum.empty()) return CallDirection::Unknown;
  return looks_like_extension(remoteNum) ? CallDirection::Internal : external;
}

}  // namespace callpop

#include "callpop/call.hpp"

#include "callpop/strings.hpp"

namespace callpop {

const char* to_string(CallState s) {
  switch (s) {
    case CallState::Ringing: return "ringing";
    case CallState::Answered: return "answered";
    case CallState::Ended: return "ended";
  }
  return "?";
}

const char* to_string(CallDirection d) {
  switch (d) {
    case CallDirection::Inbound: return "inbound";
    case CallDirection::Outbound: return "outbound";
    case CallDirection::Internal: return "internal";
    case CallDirection::Unknown: break;
  }
  return "unknown";
}

const char* to_string(EndCause c) {
  switch (c) {
    case EndCause::NormalClearing: return "normal clearing";
    case EndCause::NoAnswer: return "no answer";
    case EndCause::Busy: return "busy";
    case EndCause::Failed: return "failed";
    case EndCause::ConnectionLost: return "connection lost";
    case EndCause::Unknown: break;
  }
  return "unknown";
}

std::optional<EndCause> end_cause_from_string(const std::string& s) {
  std::string k;
  for (char c : lower(trim(s)))
    if (c != ' ' && c != '_' && c != '-') k += c;
  if (k == "normal" || k == "normalclearing") return EndCause::NormalClearing;
  if (k == "noanswer") return EndCause::NoAnswer;
  if (k == "busy") return EndCause::Busy;
  if (k == "failed" || k == "failure") return EndCause::Failed;
  if (k == "connectionlost") return EndCause::ConnectionLost;
  if (k == "unknown") return EndCause::Unknown;
  return std::nullopt;
}

std::optional<CallDirection> direction_from_string(const std::string& s) {
  std::string k = lower(trim(s));
  if (k == "inbound" || k == "in" || k == "incoming") return CallDirection::Inbound;
  if (k == "outbound" || k == "out" || k == "outgoing") return CallDirection::Outbound;
  if (k == "internal") return CallDirection::Internal;
  if (k == "unknown") return CallDirection::Unknown;
  return std::nullopt;
}

std::chrono::seconds Call::duration(Timestamp now) const {
  std::optional<Timestamp> from = answered_at ? answered_at : started_at;
  if (!from) return std::chrono::seconds(0);
  Timestamp to = ended_at ? *ended_at : now;
  if (to < *from) return std::chrono::seconds(0);
  return std::chrono::duration_cast<std::chrono::seconds>(to - *from);
}

}  // namespace callpop

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace callpop {

enum class CallState { Ringing, Answered, Ended };
enum class CallDirection { Unknown, Inbound, Outbound, Internal };
enum class EndCause { NormalClearing, NoAnswer, Busy, Failed, ConnectionLost, Unknown };

const char* to_string(CallState s);
const char* to_string(CallDirection d);
const char* to_string(EndCause c);

// Accepts the to_string() spellings plus compact forms ("noanswer", "normal").
std::optional<EndCause> end_cause_from_string(const std::string& s);
std::optional<CallDirection> direction_from_string(const std::string& s);

using Timestamp = std::chrono::system_clock::time_point;

// A call on a monitored extension as seen through the event stream.
// Consumers only ever hold copies.
struct Call {
  std::string call_id;    // Uniqueid of the extension's channel leg
  std::string linked_id;  // Linkedid shared by every leg of the call
  std::string channel;
  std::string extension;
  std::string caller_id_name;
  std::string caller_id_number;
  CallDirection direction = CallDirection::Unknown;
  CallState state = CallState::Ringing;

  std::optional<Timestamp> started_at;
  std::optional<Timestamp> answered_at;
  std::optional<Timestamp> ended_at;

  std::optional<EndCause> end_cause;
  int cause_code = 0;
  std::string cause_text;

  bool ended() const { return state == CallState::Ended; }

  // Talk time once answered, otherwise ring time. Open calls measure to now.
  std::chrono::seconds duration(Timestamp now = std::chrono::system_clock::now()) const;
};

}  // namespace callpop

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace callpop {

enum class MessageKind { Event, Response, Unknown };

const char* to_string(MessageKind kind);

struct Field {
  std::string name;   // as received
  std::string value;

  // Lower-cased name, the form used for lookups.
  std::string key() const;
};

using Fields = std::vector<Field>;

// One parsed AMI block. Field order is wire order and repeated names
// (e.g. several Variable: lines) are all kept.
class Message {
public:
  Message() = default;
  explicit Message(Fields fields);

  MessageKind kind() const { return kind_; }
  bool is_event() const { return kind_ == MessageKind::Event; }
  bool is_response() const { return kind_ == MessageKind::Response; }

  const Fields& fields() const { return fields_; }
  bool empty() const { return fields_.empty(); }

  bool has(const std::string& name) const;
  std::optional<std::string> find(const std::string& name) const;
  // First value for name, or "" when absent.
  std::string get(const std::string& name) const;
  std::vector<std::string> get_all(const std::string& name) const;

  std::string event_name() const { return get("Event"); }
  std::string action_id() const { return get("ActionID"); }
  std::string response() const { return get("Response"); }
  bool is_success() const;

  // Single-line rendering for logs.
  std::string summary() const;

private:
  Fields fields_;
  MessageKind kind_ = MessageKind::Unknown;
};

Message parse_message(const std::string& block);

std::string serialize_action(const Fields& fields);

}  // namespace callpop

#include "callpop/message.hpp"

#include <sstream>

#include "callpop/strings.hpp"

namespace callpop {

const char* to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::Event: return "event";
    case MessageKind::Response: return "response";
    case MessageKind::Unknown: break;
  }
  return "unknown";
}

std::string Field::key() const { return lower(name); }

Message::Message(Fields fields) : fields_(std::move(fields)) {
  if (has("Event"))
    kind_ = MessageKind::Event;
  else if (has("Response"))
    kind_ = MessageKind::Response;
  else
    kind_ = MessageKind::Unknown;
}

bool Message::has(const std::string& name) const {
  for (const auto& f : fields_)
    if (iequals(f.name, name)) return true;
  return false;
}

std::optional<std::string> Message::find(const std::string& name) const {
  for (const auto& f : fields_)
    if (iequals(f.name, name)) return f.value;
  return std::nullopt;
}

std::string Message::get(const std::string& name) const {
  auto v = find(name);
  return v ? *v : std::string();
}

std::vector<std::string> Message::get_all(const std::string& name) const {
  std::vector<std::string> out;
  for (const auto& f : fields_)
    if (iequals(f.name, name)) out.push_back(f.value);
  return out;
}

bool Message::is_success() const {
  return iequals(response(), "Success");
}

std::string Message::summary() const {
  std::ostringstream oss;
  bool first = true;
  for (const auto& f : fields_) {
    if (iequals(f.name, "Secret")) continue;
    if (!first) oss << ", ";
    oss << f.name << "=" << f.value;
    first = false;
  }
  return oss.str();
}

Message parse_message(const std::string& block) {
  Fields fields;
  std::istringstream is(block);
  std::string line;
  while (std::getline(is, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    auto pos = line.find(':');
    if (pos == std::string::npos) {
      // Continuation of a multi-line value
      if (fields.empty())
        fields.push_back(Field{"", line});
      else
        fields.back().value += "\n" + line;
      continue;
    }
    fields.push_back(Field{trim(line.substr(0, pos)), trim(line.substr(pos + 1))});
  }
  return Message(std::move(fields));
}

std::string serialize_action(const Fields& fields) {
  std::ostringstream oss;
  for (const auto& f : fields)
    oss << f.name << ": " << f.value << "\r\n";
  oss << "\r\n";
  return oss.str();
}

}  // namespace callpop

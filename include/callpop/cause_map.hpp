#pragma once

#include <map>
#include <string>

#include "callpop/call.hpp"

namespace callpop {

// Maps the Q.850 cause carried in Hangup events onto EndCause. Servers
// differ in which codes they emit for the same situation, so the table
// can be overridden entry by entry.
class CauseMap {
public:
  // Loaded with the common Asterisk defaults.
  CauseMap();

  void set(int code, EndCause cause) { table_[code] = cause; }
  void clear() { table_.clear(); }

  EndCause map(int code) const;
  // Non-numeric or empty fields map to Unknown.
  EndCause map(const std::string& causeField) const;

  // "16=normal,17=busy,19=noanswer". Throws ConfigError on a bad entry.
  void apply_overrides(const std::string& entries);

  const std::map<int, EndCause>& table() const { return table_; }

private:
  std::map<int, EndCause> table_;
};

}  // namespace callpop

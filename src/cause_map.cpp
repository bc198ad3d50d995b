#include "callpop/cause_map.hpp"

#include "callpop/errors.hpp"
#include "callpop/strings.hpp"

namespace callpop {

CauseMap::CauseMap() {
  table_ = {
      {16, EndCause::NormalClearing},  // normal clearing
      {26, EndCause::NormalClearing},  // answered elsewhere
      {31, EndCause::NormalClearing},  // normal, unspecified
      {17, EndCause::Busy},            // user busy
      {21, EndCause::Busy},            // call rejected
      {18, EndCause::NoAnswer},        // no user responding
      {19, EndCause::NoAnswer},        // no answer
      {1, EndCause::Failed},           // unallocated number
      {3, EndCause::Failed},           // no route to destination
      {20, EndCause::Failed},          // subscriber absent
      {27, EndCause::Failed},          // destination out of order
      {28, EndCause::Failed},          // invalid number format
      {34, EndCause::Failed},          // congestion
      {38, EndCause::Failed},          // network out of order
      {41, EndCause::Failed},          // temporary failure
      {42, EndCause::Failed},          // switching equipment congestion
      {58, EndCause::Failed},          // bearer capability not available
      {127, EndCause::Failed},         // interworking
  };
}

EndCause CauseMap::map(int code) const {
  auto it = table_.find(code);
  return it == table_.end() ? EndCause::Unknown : it->second;
}

EndCause CauseMap::map(const std::string& causeField) const {
  int code = to_int_safe(causeField, -1);
  if (code < 0) return EndCause::Unknown;
  return map(code);
}

void CauseMap::apply_overrides(const std::string& entries) {
  for (const auto& entry : split_list(entries, ',')) {
    auto eq = entry.find('=');
    if (eq == std::string::npos)
      throw ConfigError("cause map entry '" + entry + "' is not code=class");
    int code = to_int_safe(entry.substr(0, eq), -1);
    auto cause = end_cause_from_string(entry.substr(eq + 1));
    if (code < 0 || !cause)
      throw ConfigError("cause map entry '" + entry + "' is invalid");
    set(code, *cause);
  }
}

}  // namespace callpop

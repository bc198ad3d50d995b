#include "callpop/event_router.hpp"

#include <atomic>

namespace callpop {

int next_subscription_id() {
  static std::atomic<int> next{1};
  return next++;
}

bool EventRouter::dispatch(const Message& msg) const {
  if (!msg.is_event()) {
    spdlog::debug("Router ignoring {} message", to_string(msg.kind()));
    return false;
  }
  dispatched_++;
  handlers_.emit(msg);
  return true;
}

}  // namespace callpop

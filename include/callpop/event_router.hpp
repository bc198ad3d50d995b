#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "callpop/message.hpp"

namespace callpop {

// Ids are unique across every HandlerList in the process, so a caller
// holding several subscriptions can drop any of them by id alone.
int next_subscription_id();

// Thread-safe subscriber list. emit() calls handlers in subscription order
// on the emitting thread, outside the lock, so a handler may subscribe or
// unsubscribe. A throwing handler is logged and skipped.
template <typename... Args>
class HandlerList {
public:
  using Handler = std::function<void(Args...)>;

  int subscribe(Handler h) {
    int id = next_subscription_id();
    std::lock_guard<std::mutex> lk(mu_);
    handlers_.emplace_back(id, std::move(h));
    return id;
  }

  bool unsubscribe(int id) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
      if (it->first == id) {
        handlers_.erase(it);
        return true;
      }
    }
    return false;
  }

  void emit(Args... args) const {
    std::vector<std::pair<int, Handler>> snapshot;
    {
      std::lock_guard<std::mutex> lk(mu_);
      snapshot = handlers_;
    }
    for (const auto& entry : snapshot) {
      try {
        entry.second(args...);
      } catch (const std::exception& ex) {
        spdlog::error("Subscriber {} threw: {}", entry.first, ex.what());
      }
    }
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return handlers_.size();
  }

private:
  mutable std::mutex mu_;
  std::vector<std::pair<int, Handler>> handlers_;
};

// Fans parsed Events out to subscribers in wire order. Responses are the
// correlator's business and are not delivered here.
class EventRouter {
public:
  using EventHandler = std::function<void(const Message&)>;

  int subscribe(EventHandler h) { return handlers_.subscribe(std::move(h)); }
  bool unsubscribe(int id) { return handlers_.unsubscribe(id); }

  // Returns false when msg is not an Event.
  bool dispatch(const Message& msg) const;

  std::size_t subscribers() const { return handlers_.size(); }
  unsigned long dispatched() const { return dispatched_; }

private:
  HandlerList<const Message&> handlers_;
  mutable std::atomic<unsigned long> dispatched_{0};
};

}  // namespace callpop

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "callpop/errors.hpp"
#include "callpop/message.hpp"

namespace callpop {

// Outcome of one action. `error` is empty only for a Response: Success.
// A Rejected result still carries the server's Response.
struct ActionResult {
  std::optional<Message> response;
  std::optional<ActionErrc> error;
  std::string detail;

  bool ok() const { return !error.has_value(); }
};

// Tags outbound actions with an ActionID and pairs each with its Response.
// Registration happens on caller threads, resolution and expiry on the
// read loop; the pending table is guarded for both.
class ActionCorrelator {
public:
  using Clock = std::chrono::steady_clock;
  using SendFn = std::function<bool(const std::string& wire)>;
  using Completion = std::function<void(const ActionResult&)>;

  explicit ActionCorrelator(SendFn send,
                            std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(5000),
                            std::string idPrefix = "callpop");

  // Blocks until the matching Response arrives. Throws ActionError on
  // timeout (the entry is dropped), on Response: Error, or when not sent.
  Message submit(Fields fields, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // For the read loop. done runs exactly once; deadlines are left to expire().
  std::string submit_async(Fields fields, std::chrono::milliseconds timeout, Completion done);

  // Completes the pending action whose ActionID equals response's.
  // Returns false for unmatched responses.
  bool resolve(const Message& response);

  // Fails every action past its deadline with Timeout.
  std::size_t expire(Clock::time_point now = Clock::now());

  void fail_all(ActionErrc code, const std::string& why);

  // Drops an entry without completing it. Returns false if already gone.
  bool cancel(const std::string& actionId);

  std::size_t pending_count() const;
  bool is_pending(const std::string& actionId) const;

  std::chrono::milliseconds default_timeout() const { return default_timeout_; }
  void set_default_timeout(std::chrono::milliseconds t) { default_timeout_ = t; }

private:
  struct PendingAction {
    std::string action;
    Clock::time_point submitted_at;
    Clock::time_point deadline;
    Completion done;
  };

  std::string register_action(Fields& fields, std::chrono::milliseconds timeout, Completion done);
  std::optional<PendingAction> take(const std::string& actionId);

  SendFn send_;
  std::chrono::milliseconds default_timeout_;
  std::string id_prefix_;
  std::atomic<unsigned long> next_id_{0};

  mutable std::mutex mu_;
  std::map<std::string, PendingAction> pending_;
};

}  // namespace callpop

#include "callpop/correlator.hpp"

#include <future>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "callpop/strings.hpp"

namespace callpop {

const char* to_string(ActionErrc code) {
  switch (code) {
    case ActionErrc::Timeout: return "timeout";
    case ActionErrc::Rejected: return "rejected";
    case ActionErrc::Disconnected: return "disconnected";
    case ActionErrc::NotFound: return "not found";
  }
  return "?";
}

ActionCorrelator::ActionCorrelator(SendFn send, std::chrono::milliseconds defaultTimeout,
                                   std::string idPrefix)
    : send_(std::move(send)), default_timeout_(defaultTimeout), id_prefix_(std::move(idPrefix)) {}

std::string ActionCorrelator::register_action(Fields& fields, std::chrono::milliseconds timeout,
                                              Completion done) {
  std::string id = id_prefix_ + "-" + std::to_string(++next_id_);

  // The caller's own ActionID, if any, would break matching
  for (auto it = fields.begin(); it != fields.end();) {
    if (iequals(it->name, "ActionID"))
      it = fields.erase(it);
    else
      ++it;
  }
  fields.push_back(Field{"ActionID", id});

  PendingAction p;
  p.action = Message(fields).get("Action");
  p.submitted_at = Clock::now();
  p.deadline = p.submitted_at + timeout;
  p.done = std::move(done);
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.emplace(id, std::move(p));
  }
  return id;
}

std::optional<ActionCorrelator::PendingAction> ActionCorrelator::take(const std::string& actionId) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = pending_.find(actionId);
  if (it == pending_.end()) return std::nullopt;
  PendingAction p = std::move(it->second);
  pending_.erase(it);
  return p;
}

std::string ActionCorrelator::submit_async(Fields fields, std::chrono::milliseconds timeout,
                                           Completion done) {
  std::string id = register_action(fields, timeout, std::move(done));
  spdlog::debug("Sending action {}", Message(fields).summary());
  if (!send_(serialize_action(fields))) {
    auto p = take(id);
    if (p) {
      ActionResult r;
      r.error = ActionErrc::Disconnected;
      r.detail = "not connected";
      p->done(r);
    }
  }
  return id;
}

Message ActionCorrelator::submit(Fields fields, std::optional<std::chrono::milliseconds> timeout) {
  const std::chrono::milliseconds t = timeout ? *timeout : default_timeout_;
  auto promise = std::make_shared<std::promise<ActionResult>>();
  std::future<ActionResult> future = promise->get_future();

  std::string id = submit_async(std::move(fields), t,
                                [promise](const ActionResult& r) { promise->set_value(r); });

  if (future.wait_for(t) != std::future_status::ready) {
    if (take(id)) {
      spdlog::warn("Action {} timed out after {} ms", id, t.count());
      throw ActionError(ActionErrc::Timeout, "no response to " + id);
    }
    // Completed concurrently; the result is on its way
  }
  ActionResult r = future.get();
  if (!r.ok()) throw ActionError(*r.error, r.detail);
  return *r.response;
}

bool ActionCorrelator::resolve(const Message& response) {
  const std::string id = response.action_id();
  if (id.empty()) return false;
  auto p = take(id);
  if (!p) return false;

  ActionResult r;
  r.response = response;
  if (iequals(response.response(), "Error")) {
    r.error = ActionErrc::Rejected;
    r.detail = response.get("Message");
    if (r.detail.empty()) r.detail = p->action + " refused";
  }
  p->done(r);
  return true;
}

std::size_t ActionCorrelator::expire(Clock::time_point now) {
  std::vector<std::pair<std::string, PendingAction>> expired;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.deadline <= now) {
        expired.emplace_back(it->first, std::move(it->second));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& e : expired) {
    spdlog::warn("Action {} ({}) expired", e.first, e.second.action);
    ActionResult r;
    r.error = ActionErrc::Timeout;
    r.detail = "no response to " + e.first;
    e.second.done(r);
  }
  return expired.size();
}

void ActionCorrelator::fail_all(ActionErrc code, const std::string& why) {
  std::map<std::string, PendingAction> failed;
  {
    std::lock_guard<std::mutex> lk(mu_);
    failed.swap(pending_);
  }
  if (!failed.empty()) spdlog::info("Failing {} pending action(s): {}", failed.size(), why);
  for (auto& e : failed) {
    ActionResult r;
    r.error = code;
    r.detail = why;
    e.second.done(r);
  }
}

bool ActionCorrelator::cancel(const std::string& actionId) {
  return take(actionId).has_value();
}

std::size_t ActionCorrelator::pending_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.size();
}

bool ActionCorrelator::is_pending(const std::string& actionId) const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.count(actionId) != 0;
}

}  // namespace callpop

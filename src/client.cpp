#include "callpop/client.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace callpop {

Client::Client()
    : correlator_([this](const std::string& wire) { return session_.send(wire); }),
      session_(correlator_, router_) {
  router_.subscribe([this](const Message& ev) { tracker_.handle_event(ev); });
  session_.disconnected().subscribe([this]() {
    std::size_t n = tracker_.end_all(EndCause::ConnectionLost);
    if (n > 0) spdlog::warn("Link lost, ended {} open call(s)", n);
  });
  session_.ticked().subscribe([this]() { tracker_.sweep(); });
}

Client::~Client() {
  session_.stop();
}

void Client::require_off_loop(const char* what) const {
  if (session_.in_io_thread())
    throw std::logic_error(std::string(what) + "() would block the event loop; call it from another thread");
}

bool Client::connect(const ClientConfig& cfg) {
  require_off_loop("connect");
  cfg.validate();
  if (session_.state() != ConnectionState::Disconnected)
    throw std::logic_error("connect() while a session is active; disconnect() first");

  tracker_.configure(ExtensionMatcher(cfg.monitored_extensions), cfg.causes, cfg.trunk_prefixes,
                     cfg.ended_call_grace);
  correlator_.set_default_timeout(cfg.action_timeout);
  {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
  }

  session_.start(cfg);
  ConnectOutcome outcome = session_.wait_for_outcome(cfg.connect_timeout);
  switch (outcome) {
    case ConnectOutcome::Connected:
      return true;
    case ConnectOutcome::AuthFailed:
      throw AuthError(session_.last_error());
    default:
      spdlog::warn("Not connected to {}:{} ({}): {}", cfg.host, cfg.port, to_string(outcome),
                   session_.last_error());
      return false;
  }
}

void Client::disconnect() {
  session_.stop();
}

bool Client::unsubscribe(int id) {
  if (tracker_.unsubscribe(id)) return true;
  if (router_.unsubscribe(id)) return true;
  return session_.state_changed().unsubscribe(id);
}

void Client::hangup(const std::string& callId) {
  require_off_loop("hangup");
  std::optional<Call> call = tracker_.find_call(callId);
  if (!call || call->ended()) throw ActionError(ActionErrc::NotFound, "no active call " + callId);

  int retries;
  {
    std::lock_guard<std::mutex> lk(mu_);
    retries = cfg_.hangup_retries;
  }

  for (int attempt = 0;; ++attempt) {
    try {
      correlator_.submit({{"Action", "Hangup"}, {"Channel", call->channel}});
      spdlog::info("Hangup accepted for call {} on {}", callId, call->channel);
      return;
    } catch (const ActionError& ex) {
      if (ex.code() != ActionErrc::Timeout || attempt >= retries) throw;
      spdlog::warn("Hangup of call {} timed out, retrying ({}/{})", callId, attempt + 1, retries);
    }

    // The channel may have been renamed, or the call may be gone by now
    call = tracker_.find_call(callId);
    if (!call || call->ended()) {
      spdlog::info("Call {} ended while hangup was pending", callId);
      return;
    }
  }
}

Message Client::send_action(Fields fields, std::optional<std::chrono::milliseconds> timeout) {
  require_off_loop("send_action");
  return correlator_.submit(std::move(fields), timeout);
}

void Client::set_monitored_extensions(std::vector<std::string> extensions) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_.monitored_extensions = extensions;
  }
  tracker_.set_monitored(ExtensionMatcher(std::move(extensions)));
}

}  // namespace callpop

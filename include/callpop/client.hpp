#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "callpop/call_tracker.hpp"
#include "callpop/config.hpp"
#include "callpop/correlator.hpp"
#include "callpop/errors.hpp"
#include "callpop/event_router.hpp"
#include "callpop/session.hpp"

namespace callpop {

// Entry point for applications: owns the session, the correlator, the
// router and the call tracker, and wires them together.
//
// Handlers run on the session's read loop. Blocking calls (connect,
// hangup, send_action) throw std::logic_error when made from a handler.
class Client {
public:
  using CallHandler = CallTracker::CallHandler;
  using StateHandler = std::function<void(ConnectionState oldState, ConnectionState newState)>;
  using EventHandler = EventRouter::EventHandler;

  Client();
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Waits up to cfg.connect_timeout. False while still retrying or after giving up.
  // Throws ConfigError on bad settings and AuthError on refused credentials.
  bool connect(const ClientConfig& cfg);

  void disconnect();

  int on_call_started(CallHandler h) { return tracker_.on_call_started(std::move(h)); }
  int on_call_answered(CallHandler h) { return tracker_.on_call_answered(std::move(h)); }
  int on_call_ended(CallHandler h) { return tracker_.on_call_ended(std::move(h)); }
  int on_connection_state_changed(StateHandler h) { return session_.state_changed().subscribe(std::move(h)); }
  // Every raw Event, before filtering.
  int on_event(EventHandler h) { return router_.subscribe(std::move(h)); }
  bool unsubscribe(int id);

  // Hangs up the channel currently carrying callId. Unknown or ended calls
  // throw ActionError NotFound without sending anything.
  void hangup(const std::string& callId);

  // Arbitrary action; see ActionCorrelator::submit.
  Message send_action(Fields fields, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::vector<Call> list_active_calls() const { return tracker_.active_calls(); }
  std::optional<Call> find_call(const std::string& callId) const { return tracker_.find_call(callId); }
  ConnectionState connection_state() const { return session_.state(); }
  std::string server_banner() const { return session_.banner(); }
  std::string last_error() const { return session_.last_error(); }

  void set_monitored_extensions(std::vector<std::string> extensions);

private:
  void require_off_loop(const char* what) const;

  EventRouter router_;
  CallTracker tracker_;
  ActionCorrelator correlator_;

  mutable std::mutex mu_;
  ClientConfig cfg_;

  // Last, so it is torn down before everything it calls into
  AmiSession session_;
};

}  // namespace callpop

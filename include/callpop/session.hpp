#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "callpop/backoff.hpp"
#include "callpop/config.hpp"
#include "callpop/correlator.hpp"
#include "callpop/event_router.hpp"
#include "callpop/framer.hpp"

namespace callpop {

enum class ConnectionState { Disconnected, Connecting, Authenticating, Connected, Reconnecting };

const char* to_string(ConnectionState s);

// What the most recent start() came to.
enum class ConnectOutcome { Pending, Connected, AuthFailed, GaveUp, Stopped };

const char* to_string(ConnectOutcome o);

// The TCP link to the manager interface.
//
// A private io_context thread is the read loop: it frames and parses
// inbound data, hands Responses to the correlator and Events to the router,
// runs keep-alive, and reconnects with backoff after network failures.
// Every state change happens on that thread.
class AmiSession {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::milliseconds TICK{200};

  AmiSession(ActionCorrelator& correlator, EventRouter& router);
  ~AmiSession();

  AmiSession(const AmiSession&) = delete;
  AmiSession& operator=(const AmiSession&) = delete;

  // Begins connecting in the background. Throws std::logic_error unless
  // the session is Disconnected.
  void start(const ClientConfig& cfg);

  // Blocks until the current start() is decided or timeout passes.
  ConnectOutcome wait_for_outcome(std::chrono::milliseconds timeout) const;

  // Logs off, closes the socket, cancels any pending reconnect and fails
  // every pending action. Returns once the read loop has done so.
  void stop();

  // Queues a serialized action for writing. Returns false unless the
  // session is Authenticating or Connected.
  bool send(const std::string& wire);

  ConnectionState state() const;
  std::string banner() const;
  std::string last_error() const;
  std::chrono::milliseconds last_backoff() const;

  bool in_io_thread() const { return std::this_thread::get_id() == io_thread_.get_id(); }

  // Emitted on the read loop.
  HandlerList<ConnectionState, ConnectionState>& state_changed() { return state_changed_; }
  HandlerList<>& disconnected() { return disconnected_; }
  HandlerList<>& ticked() { return ticked_; }

private:
  void run_io();
  void do_connect();
  void read_banner(unsigned gen);
  void send_login(unsigned gen);
  void start_read(unsigned gen);
  void process_bytes(const char* data, std::size_t len, unsigned gen);
  void do_write(unsigned gen);
  void schedule_tick();
  void on_tick();
  void on_logged_in();
  void on_auth_failed(const std::string& detail);
  void on_network_failure(const std::string& reason);
  void teardown(const std::string& reason);
  void do_stop();
  void set_state(ConnectionState s);
  void finish(ConnectOutcome o);

  ActionCorrelator& correlator_;
  EventRouter& router_;

  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::steady_timer connect_timer_;
  boost::asio::steady_timer retry_timer_;
  boost::asio::steady_timer tick_timer_;
  boost::asio::streambuf banner_buf_;
  std::array<char, 4096> read_buf_;
  std::deque<std::shared_ptr<std::string>> write_queue_;
  std::thread io_thread_;

  // Read loop only
  ClientConfig cfg_;
  Backoff backoff_;
  LineFramer framer_;
  unsigned gen_ = 0;  // bumped per connection so stale completions are dropped
  bool stopping_ = true;
  bool ping_outstanding_ = false;
  Clock::time_point last_rx_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  ConnectionState state_ = ConnectionState::Disconnected;
  ConnectOutcome outcome_ = ConnectOutcome::Stopped;
  std::string banner_;
  std::string last_error_;
  std::chrono::milliseconds last_backoff_{0};

  HandlerList<ConnectionState, ConnectionState> state_changed_;
  HandlerList<> disconnected_;
  HandlerList<> ticked_;
};

}  // namespace callpop

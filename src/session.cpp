#include "callpop/session.hpp"

#include <future>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "callpop/strings.hpp"

using boost::asio::ip::tcp;

namespace callpop {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Authenticating: return "authenticating";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
  }
  return "?";
}

const char* to_string(ConnectOutcome o) {
  switch (o) {
    case ConnectOutcome::Pending: return "pending";
    case ConnectOutcome::Connected: return "connected";
    case ConnectOutcome::AuthFailed: return "authentication failed";
    case ConnectOutcome::GaveUp: return "gave up";
    case ConnectOutcome::Stopped: return "stopped";
  }
  return "?";
}

AmiSession::AmiSession(ActionCorrelator& correlator, EventRouter& router)
    : correlator_(correlator),
      router_(router),
      work_(boost::asio::make_work_guard(io_)),
      socket_(io_),
      resolver_(io_),
      connect_timer_(io_),
      retry_timer_(io_),
      tick_timer_(io_) {
  io_thread_ = std::thread([this]() { run_io(); });
  boost::asio::post(io_, [this]() { schedule_tick(); });
}

AmiSession::~AmiSession() {
  stop();
  work_.reset();
  io_.stop();
  if (io_thread_.joinable()) io_thread_.join();
}

void AmiSession::run_io() {
  // A throwing handler must not take the read loop down with it
  for (;;) {
    try {
      io_.run();
      return;
    } catch (const std::exception& ex) {
      spdlog::error("Session loop error: {}", ex.what());
    }
  }
}

// ----- Public ------------------------------------------------------------

void AmiSession::start(const ClientConfig& cfg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != ConnectionState::Disconnected) throw std::logic_error("session already started");
    outcome_ = ConnectOutcome::Pending;
    last_error_.clear();
  }
  boost::asio::post(io_, [this, cfg]() {
    cfg_ = cfg;
    backoff_ = Backoff(cfg.reconnect);
    stopping_ = false;
    do_connect();
  });
}

ConnectOutcome AmiSession::wait_for_outcome(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, timeout, [this]() { return outcome_ != ConnectOutcome::Pending; });
  return outcome_;
}

void AmiSession::stop() {
  if (in_io_thread()) {
    do_stop();
    return;
  }
  std::promise<void> done;
  std::future<void> f = done.get_future();
  boost::asio::post(io_, [this, &done]() {
    do_stop();
    done.set_value();
  });
  f.wait();
}

bool AmiSession::send(const std::string& wire) {
  ConnectionState s = state();
  if (s != ConnectionState::Connected && s != ConnectionState::Authenticating) return false;

  auto msg = std::make_shared<std::string>(wire);
  boost::asio::post(io_, [this, msg]() {
    if (!socket_.is_open()) {
      spdlog::debug("Dropping write, socket closed");
      return;
    }
    write_queue_.push_back(msg);
    if (write_queue_.size() == 1) do_write(gen_);
  });
  return true;
}

ConnectionState AmiSession::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::string AmiSession::banner() const {
  std::lock_guard<std::mutex> lk(mu_);
  return banner_;
}

std::string AmiSession::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

std::chrono::milliseconds AmiSession::last_backoff() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_backoff_;
}

// ----- Read loop ---------------------------------------------------------

void AmiSession::do_connect() {
  if (stopping_) return;
  const unsigned gen = ++gen_;
  framer_.reset();
  banner_buf_.consume(banner_buf_.size());
  set_state(ConnectionState::Connecting);
  spdlog::info("Connecting to {}:{}", cfg_.host, cfg_.port);

  connect_timer_.expires_after(cfg_.connect_timeout);
  connect_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
    if (ec || gen != gen_) return;
    ConnectionState s = state();
    if (s == ConnectionState::Connecting || s == ConnectionState::Authenticating)
      on_network_failure("connect timeout");
  });

  resolver_.async_resolve(
      cfg_.host, std::to_string(cfg_.port),
      [this, gen](const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (gen != gen_) return;
        if (ec) {
          on_network_failure("resolve " + cfg_.host + ": " + ec.message());
          return;
        }
        boost::asio::async_connect(
            socket_, results, [this, gen](const boost::system::error_code& ec, const tcp::endpoint& ep) {
              if (gen != gen_) return;
              if (ec) {
                on_network_failure("connect: " + ec.message());
                return;
              }
              spdlog::debug("TCP connected to {}:{}", ep.address().to_string(), ep.port());
              set_state(ConnectionState::Authenticating);
              read_banner(gen);
            });
      });
}

void AmiSession::read_banner(unsigned gen) {
  // "Asterisk Call Manager/5.0.1" arrives as a lone line, outside block framing
  boost::asio::async_read_until(
      socket_, banner_buf_, "\r\n", [this, gen](const boost::system::error_code& ec, std::size_t n) {
        if (gen != gen_) return;
        if (ec) {
          on_network_failure("reading banner: " + ec.message());
          return;
        }
        std::string data(boost::asio::buffers_begin(banner_buf_.data()),
                         boost::asio::buffers_end(banner_buf_.data()));
        banner_buf_.consume(banner_buf_.size());
        std::string line = trim(data.substr(0, n));
        {
          std::lock_guard<std::mutex> lk(mu_);
          banner_ = line;
        }
        spdlog::info("Server banner: {}", line);
        last_rx_ = Clock::now();

        send_login(gen);
        start_read(gen);
        if (data.size() > n) process_bytes(data.data() + n, data.size() - n, gen);
      });
}

void AmiSession::send_login(unsigned gen) {
  Fields login{{"Action", "Login"},
               {"Username", cfg_.username},
               {"Secret", cfg_.secret},
               {"Events", cfg_.events}};
  // Completions arrive on this thread: resolve, expire and fail_all all run here
  correlator_.submit_async(std::move(login), cfg_.connect_timeout, [this, gen](const ActionResult& r) {
    if (gen != gen_) return;
    if (r.ok()) {
      on_logged_in();
    } else if (*r.error == ActionErrc::Rejected) {
      on_auth_failed(r.detail);
    } else {
      on_network_failure(std::string("login ") + to_string(*r.error) + ": " + r.detail);
    }
  });
}

void AmiSession::start_read(unsigned gen) {
  socket_.async_read_some(
      boost::asio::buffer(read_buf_), [this, gen](const boost::system::error_code& ec, std::size_t n) {
        if (gen != gen_) return;
        if (ec) {
          if (ec == boost::asio::error::eof)
            on_network_failure("connection closed by server");
          else
            on_network_failure("read: " + ec.message());
          return;
        }
        last_rx_ = Clock::now();
        process_bytes(read_buf_.data(), n, gen);
        if (gen == gen_) start_read(gen);
      });
}

void AmiSession::process_bytes(const char* data, std::size_t len, unsigned gen) {
  for (const auto& block : framer_.feed(data, len)) {
    // A handler may have torn the connection down mid-batch
    if (gen != gen_) return;
    Message m = parse_message(block);
    if (m.is_response()) {
      if (!correlator_.resolve(m)) spdlog::debug("Unmatched response: {}", m.summary());
    } else if (m.is_event()) {
      router_.dispatch(m);
    } else {
      spdlog::debug("Skipping unrecognised block: {}", m.summary());
    }
  }
}

void AmiSession::do_write(unsigned gen) {
  auto msg = write_queue_.front();
  boost::asio::async_write(socket_, boost::asio::buffer(*msg),
                           [this, gen, msg](const boost::system::error_code& ec, std::size_t) {
                             if (gen != gen_) return;
                             if (ec) {
                               on_network_failure("write: " + ec.message());
                               return;
                             }
                             write_queue_.pop_front();
                             if (!write_queue_.empty()) do_write(gen);
                           });
}

void AmiSession::schedule_tick() {
  tick_timer_.expires_after(TICK);
  tick_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    on_tick();
    schedule_tick();
  });
}

void AmiSession::on_tick() {
  const Clock::time_point now = Clock::now();
  correlator_.expire(now);

  if (state() == ConnectionState::Connected && !ping_outstanding_ &&
      now - last_rx_ >= cfg_.keepalive_idle) {
    ping_outstanding_ = true;
    const unsigned gen = gen_;
    spdlog::debug("Link idle, sending Ping");
    correlator_.submit_async({{"Action", "Ping"}}, cfg_.keepalive_grace, [this, gen](const ActionResult& r) {
      if (gen != gen_) return;
      ping_outstanding_ = false;
      if (!r.ok() && *r.error == ActionErrc::Timeout) on_network_failure("keep-alive timeout");
    });
  }

  ticked_.emit();
}

void AmiSession::on_logged_in() {
  connect_timer_.cancel();
  backoff_.reset();
  last_rx_ = Clock::now();
  spdlog::info("Logged in to {}:{} as {}", cfg_.host, cfg_.port, cfg_.username);
  set_state(ConnectionState::Connected);
  finish(ConnectOutcome::Connected);
}

void AmiSession::on_auth_failed(const std::string& detail) {
  spdlog::error("Authentication failed for {}: {}", cfg_.username, detail);
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_ = "authentication failed: " + detail;
  }
  // Bad credentials will not fix themselves, so no retry
  stopping_ = true;
  teardown("authentication failed");
  finish(ConnectOutcome::AuthFailed);
  set_state(ConnectionState::Disconnected);
}

void AmiSession::on_network_failure(const std::string& reason) {
  if (stopping_) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_ = reason;
  }
  spdlog::warn("AMI link failure: {}", reason);
  teardown(reason);

  if (backoff_.exhausted()) {
    spdlog::error("Giving up after {} reconnect attempts", backoff_.attempts());
    finish(ConnectOutcome::GaveUp);
    set_state(ConnectionState::Disconnected);
    return;
  }

  auto delay = backoff_.next();
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_backoff_ = delay;
  }
  set_state(ConnectionState::Reconnecting);
  spdlog::info("Reconnecting in {} ms (attempt {})", delay.count(), backoff_.attempts());
  retry_timer_.expires_after(delay);
  retry_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopping_) return;
    do_connect();
  });
}

void AmiSession::teardown(const std::string& reason) {
  ++gen_;
  connect_timer_.cancel();
  resolver_.cancel();
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec) spdlog::debug("Socket shutdown: {}", ec.message());
    socket_.close(ec);
    if (ec) spdlog::debug("Socket close: {}", ec.message());
  }
  write_queue_.clear();
  framer_.reset();
  ping_outstanding_ = false;

  correlator_.fail_all(ActionErrc::Disconnected, reason);
  disconnected_.emit();
}

void AmiSession::do_stop() {
  const bool wasActive = !stopping_;
  stopping_ = true;
  retry_timer_.cancel();
  if (!wasActive && state() == ConnectionState::Disconnected) return;

  if (socket_.is_open() && state() == ConnectionState::Connected && write_queue_.empty()) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(serialize_action({{"Action", "Logoff"}})), ec);
    if (ec) spdlog::debug("Logoff not sent: {}", ec.message());
  }
  spdlog::info("Disconnecting from {}:{}", cfg_.host, cfg_.port);
  teardown("disconnect requested");
  finish(ConnectOutcome::Stopped);
  set_state(ConnectionState::Disconnected);
}

void AmiSession::set_state(ConnectionState s) {
  ConnectionState old;
  {
    std::lock_guard<std::mutex> lk(mu_);
    old = state_;
    if (old == s) return;
    state_ = s;
  }
  cv_.notify_all();
  spdlog::info("Connection state {} -> {}", to_string(old), to_string(s));
  state_changed_.emit(old, s);
}

void AmiSession::finish(ConnectOutcome o) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (outcome_ == ConnectOutcome::Pending || o == ConnectOutcome::Stopped) outcome_ = o;
  }
  cv_.notify_all();
}

}  // namespace callpop

#include "FakeAmiServer.h"

#include <future>

#include <spdlog/spdlog.h>

using boost::asio::ip::tcp;

namespace callpop {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

FakeAmiServer::FakeAmiServer()
    : work_(boost::asio::make_work_guard(io_)),
      acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
  port_ = acceptor_.local_endpoint().port();
  do_accept();
  thread_ = std::thread([this]() { io_.run(); });
}

FakeAmiServer::~FakeAmiServer() {
  std::promise<void> done;
  boost::asio::post(io_, [this, &done]() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (current_) current_->socket.close(ec);
    current_.reset();
    done.set_value();
  });
  done.get_future().wait();
  work_.reset();
  io_.stop();
  thread_.join();
}

void FakeAmiServer::set_login_ok(bool b) {
  std::lock_guard<std::mutex> lk(mu_);
  login_ok_ = b;
}

void FakeAmiServer::set_answer_ping(bool b) {
  std::lock_guard<std::mutex> lk(mu_);
  answer_ping_ = b;
}

void FakeAmiServer::set_answer_hangup(bool b) {
  std::lock_guard<std::mutex> lk(mu_);
  answer_hangup_ = b;
}

void FakeAmiServer::push(const std::string& block) {
  std::promise<void> done;
  boost::asio::post(io_, [this, block, &done]() {
    if (current_) write(current_, block + "\r\n\r\n");
    done.set_value();
  });
  done.get_future().wait();
}

void FakeAmiServer::drop_client() {
  std::promise<void> done;
  boost::asio::post(io_, [this, &done]() {
    if (current_) {
      boost::system::error_code ec;
      current_->socket.shutdown(tcp::socket::shutdown_both, ec);
      current_->socket.close(ec);
      current_.reset();
    }
    done.set_value();
  });
  done.get_future().wait();
}

std::vector<Message> FakeAmiServer::actions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return actions_;
}

int FakeAmiServer::count(const std::string& action) const {
  std::lock_guard<std::mutex> lk(mu_);
  int n = 0;
  for (const auto& m : actions_)
    if (m.get("Action") == action) n++;
  return n;
}

int FakeAmiServer::connections() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connections_;
}

bool FakeAmiServer::wait_for_action(const std::string& action, int n,
                                    std::chrono::milliseconds timeout) const {
  return wait_until([&]() { return count(action) >= n; }, timeout);
}

bool FakeAmiServer::wait_for_connections(int n, std::chrono::milliseconds timeout) const {
  return wait_until([&]() { return connections() >= n; }, timeout);
}

void FakeAmiServer::do_accept() {
  auto conn = std::make_shared<Conn>(io_);
  acceptor_.async_accept(conn->socket, [this, conn](const boost::system::error_code& ec) {
    if (ec) return;
    if (current_) {
      boost::system::error_code ignored;
      current_->socket.close(ignored);
    }
    current_ = conn;
    {
      std::lock_guard<std::mutex> lk(mu_);
      connections_++;
    }
    write(conn, "Asterisk Call Manager/5.0.1\r\n");
    do_read(conn);
    do_accept();
  });
}

void FakeAmiServer::do_read(std::shared_ptr<Conn> conn) {
  conn->socket.async_read_some(boost::asio::buffer(conn->buf),
                               [this, conn](const boost::system::error_code& ec, std::size_t n) {
                                 if (ec) return;
                                 for (const auto& block : conn->framer.feed(conn->buf.data(), n))
                                   on_action(conn, parse_message(block));
                                 if (conn->socket.is_open()) do_read(conn);
                               });
}

void FakeAmiServer::on_action(const std::shared_ptr<Conn>& conn, const Message& m) {
  bool loginOk, answerPing, answerHangup;
  {
    std::lock_guard<std::mutex> lk(mu_);
    actions_.push_back(m);
    loginOk = login_ok_;
    answerPing = answer_ping_;
    answerHangup = answer_hangup_;
  }

  const std::string action = m.get("Action");
  const std::string id = "ActionID: " + m.action_id() + "\r\n";
  if (action == "Login") {
    if (loginOk)
      write(conn, "Response: Success\r\n" + id + "Message: Authentication accepted\r\n\r\n");
    else
      write(conn, "Response: Error\r\n" + id + "Message: Authentication failed\r\n\r\n");
  } else if (action == "Ping") {
    if (answerPing) write(conn, "Response: Success\r\n" + id + "Ping: Pong\r\n\r\n");
  } else if (action == "Hangup") {
    if (answerHangup) write(conn, "Response: Success\r\n" + id + "Message: Channel Hungup\r\n\r\n");
  } else if (action == "Logoff") {
    write(conn, "Response: Goodbye\r\n" + id + "Message: Thanks for all the fish.\r\n\r\n");
    boost::system::error_code ec;
    conn->socket.close(ec);
  } else {
    write(conn, "Response: Error\r\n" + id + "Message: Invalid/unknown command\r\n\r\n");
  }
}

void FakeAmiServer::write(const std::shared_ptr<Conn>& conn, const std::string& text) {
  boost::system::error_code ec;
  boost::asio::write(conn->socket, boost::asio::buffer(text), ec);
  if (ec) spdlog::debug("fake server write failed: {}", ec.message());
}

}  // namespace callpop

#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "callpop/framer.hpp"
#include "callpop/message.hpp"

namespace callpop {

// Polls pred every 10 ms until it holds or timeout passes.
bool wait_until(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

// A loopback manager interface good enough to drive a Client: greets,
// answers Login/Ping/Hangup/Logoff, records every action it receives and
// lets the test push event blocks or drop the connection.
class FakeAmiServer {
public:
  FakeAmiServer();
  ~FakeAmiServer();

  int port() const { return port_; }

  void set_login_ok(bool b);
  void set_answer_ping(bool b);
  void set_answer_hangup(bool b);

  // Sends one block (without the terminating blank line) to the client.
  void push(const std::string& block);
  // Closes the current client connection.
  void drop_client();

  std::vector<Message> actions() const;
  int count(const std::string& action) const;
  int connections() const;

  bool wait_for_action(const std::string& action, int n = 1,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) const;
  bool wait_for_connections(int n, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) const;

private:
  struct Conn {
    explicit Conn(boost::asio::io_context& io) : socket(io) {}
    boost::asio::ip::tcp::socket socket;
    LineFramer framer;
    std::array<char, 2048> buf;
  };

  void do_accept();
  void do_read(std::shared_ptr<Conn> conn);
  void on_action(const std::shared_ptr<Conn>& conn, const Message& m);
  void write(const std::shared_ptr<Conn>& conn, const std::string& text);

  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<Conn> current_;
  std::thread thread_;
  int port_ = 0;

  mutable std::mutex mu_;
  std::vector<Message> actions_;
  int connections_ = 0;
  bool login_ok_ = true;
  bool answer_ping_ = true;
  bool answer_hangup_ = true;
};

}  // namespace callpop

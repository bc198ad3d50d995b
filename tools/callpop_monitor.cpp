// callpop_monitor.cpp
// AMI call monitor TUI (ncurses) on top of callpop::Client
// Features:
// - Live calls on monitored extensions: ringing / answered, with caller ID
// - Inbound/Outbound/Internal classification (CALL_DIR variable or trunk heuristic)
// - Ring / talk duration
// - Hang up the selected call
// - Survives AMI restarts: reconnects with backoff, shows the link state
//
// Run:
//   ./callpop-monitor 127.0.0.1 5038 callmon 'secret'
//
// Every AMI_* variable understood by callpop::config_from_env() applies, plus
// AMI_LOG_FILE (default callpop-monitor.log) and AMI_LOG_LEVEL (default info).

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "callpop/client.hpp"
#include "callpop/strings.hpp"

// After Boost.Asio (via client.hpp): curses defines macros such as timeout().
#include <ncursesw/ncurses.h>

namespace {

std::atomic_bool g_running{true};

std::string now_ts() {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string getenv_s(const char* k) {
  const char* v = std::getenv(k);
  return v ? std::string(v) : "";
}

// Fed from client handlers on the session thread, read by the UI loop.
struct MonitorState {
  std::mutex mu;
  std::deque<std::string> audit_log;  // last N calls/link events
  std::string filter = "all";         // all|inbound|outbound|internal
  int selected = 0;

  void log_line(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu);
    audit_log.push_back(now_ts() + "  " + s);
    while (audit_log.size() > 2000) audit_log.pop_front();
  }
};

std::string describe(const callpop::Call& c) {
  std::ostringstream oss;
  oss << c.extension << " " << callpop::to_string(c.direction) << " "
      << (c.caller_id_number.empty() ? "?" : c.caller_id_number);
  if (!c.caller_id_name.empty()) oss << " (" << c.caller_id_name << ")";
  oss << " [" << c.channel << "]";
  return oss.str();
}

std::vector<callpop::Call> build_rows(callpop::Client& client, const std::string& filter) {
  std::vector<callpop::Call> rows;
  for (auto& c : client.list_active_calls()) {
    if (filter != "all" && filter != callpop::to_string(c.direction)) continue;
    rows.push_back(std::move(c));
  }
  // Longest running first
  std::sort(rows.begin(), rows.end(), [](const callpop::Call& a, const callpop::Call& b) {
    return a.started_at < b.started_at;
  });
  return rows;
}

void tui_draw(MonitorState& st, callpop::Client& client, const std::vector<callpop::Call>& rows) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  std::string filter;
  {
    std::lock_guard<std::mutex> lk(st.mu);
    filter = st.filter;
    if (!rows.empty()) st.selected = std::max(0, std::min(st.selected, (int)rows.size() - 1));
  }

  mvprintw(0, 0, "callpop AMI Call Monitor  Link: %s  Filter: %s  Time: %s",
           callpop::to_string(client.connection_state()), filter.c_str(), now_ts().c_str());
  mvprintw(1, 0, "Keys: [Up/Down]=Select Call  [H]=Hangup  [F]=Filter  [L]=Logs  [Q]=Quit");

  int list_start = 3;
  mvprintw(list_start - 1, 0, "Calls: %d", (int)rows.size());
  mvhline(list_start, 0, ACS_HLINE, maxx);

  auto now = std::chrono::system_clock::now();
  int y = list_start + 1;
  for (int idx = 0; idx < (int)rows.size() && y < maxy - 7; idx++, y++) {
    const auto& c = rows[idx];
    bool sel = (idx == st.selected);
    if (sel) attron(A_REVERSE);

    std::ostringstream line;
    line << std::setw(3) << idx + 1 << "  "
         << std::setw(7) << (std::to_string(c.duration(now).count()) + "s") << "  "
         << std::setw(8) << callpop::to_string(c.state) << "  "
         << std::setw(8) << callpop::to_string(c.direction) << "  "
         << "ext=" << std::left << std::setw(6) << c.extension << std::right << "  "
         << (c.caller_id_number.empty() ? "?" : c.caller_id_number) << " "
         << c.caller_id_name;

    std::string s = line.str();
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y, 0, "%s", s.c_str());

    if (sel) attroff(A_REVERSE);
  }

  int detail_y = maxy - 6;
  mvhline(detail_y - 1, 0, ACS_HLINE, maxx);
  mvprintw(detail_y, 0, "Selected Call Details:");

  if (!rows.empty()) {
    const auto& c = rows[st.selected];
    mvprintw(detail_y + 1, 0, "Call: %s   Linked: %s", c.call_id.c_str(), c.linked_id.c_str());
    mvprintw(detail_y + 2, 0, "Channel: %s", c.channel.c_str());
    mvprintw(detail_y + 3, 0, "Direction: %s   State: %s   Duration: %llds",
             callpop::to_string(c.direction), callpop::to_string(c.state),
             static_cast<long long>(c.duration(now).count()));
  } else if (client.connection_state() != callpop::ConnectionState::Connected) {
    std::string err = client.last_error();
    mvprintw(detail_y + 1, 0, "Not connected%s%s", err.empty() ? "" : ": ", err.c_str());
  } else {
    mvprintw(detail_y + 1, 0, "No active calls on monitored extensions.");
  }

  refresh();
}

void tui_show_logs(MonitorState& st) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  mvprintw(0, 0, "Audit / Event Log (press any key to return)");
  mvhline(1, 0, ACS_HLINE, maxx);

  std::vector<std::string> lines;
  {
    std::lock_guard<std::mutex> lk(st.mu);
    int start = std::max(0, (int)st.audit_log.size() - (maxy - 3));
    lines.assign(st.audit_log.begin() + start, st.audit_log.end());
  }
  int y = 2;
  for (size_t i = 0; i < lines.size() && y < maxy; i++, y++) {
    std::string s = lines[i];
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y, 0, "%s", s.c_str());
  }
  refresh();
  getch();
}

void signal_handler(int) {
  g_running.store(false);
}

callpop::ClientConfig read_config_from_env_and_args(int argc, char** argv) {
  callpop::ClientConfig cfg;
  cfg.host = "127.0.0.1";

  // CLI: host port user secret
  if (argc >= 3) {
    cfg.host = argv[1];
    cfg.port = callpop::to_int_safe(argv[2], -1);
  }
  if (argc >= 4) cfg.username = argv[3];
  if (argc >= 5) cfg.secret = argv[4];

  // Allow env overrides (systemd EnvironmentFile)
  return callpop::config_from_env(cfg);
}

void setup_logging() {
  std::string path = getenv_s("AMI_LOG_FILE");
  if (path.empty()) path = "callpop-monitor.log";

  // The screen belongs to curses, so everything goes to the file
  auto logger = spdlog::basic_logger_mt("callpop", path);
  spdlog::set_default_logger(logger);

  std::string level = getenv_s("AMI_LOG_LEVEL");
  spdlog::set_level(level.empty() ? spdlog::level::info : spdlog::level::from_str(callpop::lower(level)));
  spdlog::flush_on(spdlog::level::warn);
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  callpop::ClientConfig cfg;
  try {
    cfg = read_config_from_env_and_args(argc, argv);
    if (cfg.username.empty() || cfg.secret.empty()) {
      std::cerr << "Usage: " << argv[0] << " <host> <port> <user> <secret>\n"
                << "Or set AMI_HOST/AMI_PORT/AMI_USER/AMI_SECRET in environment.\n";
      return 1;
    }
    cfg.validate();
    setup_logging();
  } catch (const callpop::ConfigError& ex) {
    std::cerr << "Configuration error: " << ex.what() << "\n";
    return 1;
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Cannot open log: " << ex.what() << "\n";
    return 1;
  }

  MonitorState st;
  st.log_line("Starting...");

  callpop::Client client;
  client.on_call_started([&st](const callpop::Call& c) { st.log_line("Ringing: " + describe(c)); });
  client.on_call_answered([&st](const callpop::Call& c) { st.log_line("Answered: " + describe(c)); });
  client.on_call_ended([&st](const callpop::Call& c) {
    std::string cause = c.end_cause ? callpop::to_string(*c.end_cause) : "unknown";
    st.log_line("Ended: " + describe(c) + " cause=" + cause + " (" + std::to_string(c.cause_code) + ")");
  });
  client.on_connection_state_changed([&st](callpop::ConnectionState, callpop::ConnectionState now) {
    st.log_line(std::string("AMI link ") + callpop::to_string(now));
  });

  try {
    if (client.connect(cfg))
      st.log_line("AMI login success (" + client.server_banner() + ")");
    else
      st.log_line("AMI not reachable yet: " + client.last_error());
  } catch (const callpop::AuthError& ex) {
    std::cerr << "AMI login failed: " << ex.what() << "\n";
    return 1;
  }

  // Init TUI
  initscr();
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);  // non-blocking
  curs_set(0);

  while (g_running.load()) {
    std::string filter;
    {
      std::lock_guard<std::mutex> lk(st.mu);
      filter = st.filter;
    }
    auto rows = build_rows(client, filter);
    tui_draw(st, client, rows);

    int ch = getch();
    if (ch == ERR) {
      std::this_thread::sleep_for(std::chrono::milliseconds(120));
      continue;
    }

    if (ch == 'q' || ch == 'Q') {
      g_running.store(false);
      break;
    }

    if (ch == 'l' || ch == 'L') {
      // Temporarily turn off nodelay so log view can block
      nodelay(stdscr, FALSE);
      tui_show_logs(st);
      nodelay(stdscr, TRUE);
      continue;
    }

    if (ch == 'f' || ch == 'F') {
      std::lock_guard<std::mutex> lk(st.mu);
      if (st.filter == "all") st.filter = "inbound";
      else if (st.filter == "inbound") st.filter = "outbound";
      else if (st.filter == "outbound") st.filter = "internal";
      else st.filter = "all";
      st.selected = 0;
      continue;
    }

    if (ch == KEY_UP || ch == KEY_DOWN) {
      std::lock_guard<std::mutex> lk(st.mu);
      st.selected += (ch == KEY_UP) ? -1 : 1;
      st.selected = std::max(0, std::min(st.selected, std::max(0, (int)rows.size() - 1)));
      continue;
    }

    if ((ch == 'h' || ch == 'H') && !rows.empty()) {
      int sel;
      {
        std::lock_guard<std::mutex> lk(st.mu);
        sel = st.selected;
      }
      const auto& target = rows[sel];
      try {
        client.hangup(target.call_id);
        st.log_line("Hangup requested: " + describe(target));
      } catch (const callpop::ActionError& ex) {
        st.log_line("Hangup failed: " + describe(target) + ": " + ex.what());
      }
    }
  }

  endwin();
  client.disconnect();
  spdlog::shutdown();
  return 0;
}

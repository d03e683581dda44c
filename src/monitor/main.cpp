// amilive-monitor
// Live view of an Asterisk AMI connection (ncurses): active calls with
// direction, device states, client log. Keeps the AMI session up on its own.
//
// Run:
//   ./amilive-monitor 127.0.0.1 5038 monitor 'secret'
//
// Or set AMI_HOST/AMI_PORT/AMI_USERNAME/AMI_PASSWORD in the environment
// (systemd EnvironmentFile).

#include <ncursesw/ncurses.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "amilive/client.hpp"
#include "amilive/config.hpp"
#include "amilive/error.hpp"
#include "amilive/log.hpp"

using amilive::AmiClient;
using amilive::CallRecord;

static std::atomic_bool g_running{true};

static inline std::string now_ts() {
  auto t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S");
  return oss.str();
}

static int secs_since(std::chrono::system_clock::time_point t0) {
  auto now = std::chrono::system_clock::now();
  return (int)std::chrono::duration_cast<std::chrono::seconds>(now - t0).count();
}

// --- Screen state ---
struct ViewState {
  std::string filter = "all";  // all|inbound|outbound|internal
  int selected = 0;
  std::string status_line;
};

static std::vector<CallRecord> visible_calls(const AmiClient& ami, const ViewState& vs) {
  std::vector<CallRecord> rows;
  for (auto& c : ami.active_calls()) {
    if (vs.filter != "all" && vs.filter != amilive::to_string(c.direction)) continue;
    rows.push_back(std::move(c));
  }
  return rows;
}

static void tui_draw(const AmiClient& ami, ViewState& vs) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  mvprintw(0, 0, "AMI Live Monitor  %s  [%s]  Filter: %s  Time: %s",
           ami.settings().describe().c_str(), amilive::to_string(ami.state()),
           vs.filter.c_str(), now_ts().c_str());
  mvprintw(1, 0, "Keys: [Up/Down]=Select  [F]=Filter  [H]=Hangup  [R]=Reconnect  [D]=Devices  [L]=Logs  [Q]=Quit");

  auto rows = visible_calls(ami, vs);

  int list_start = 3;
  mvprintw(list_start, 0, "Active calls: %d", (int)rows.size());
  mvhline(list_start + 1, 0, ACS_HLINE, maxx);

  if (!rows.empty()) {
    vs.selected = std::max(0, std::min(vs.selected, (int)rows.size() - 1));
  }

  int y = list_start + 2;
  for (int idx = 0; idx < (int)rows.size() && y < maxy - 3; idx++, y++) {
    const auto& c = rows[idx];
    bool sel = (idx == vs.selected);
    if (sel) attron(A_REVERSE);

    std::ostringstream line;
    line << std::setw(3) << idx + 1 << "  "
         << std::setw(7) << (std::to_string(secs_since(c.created)) + "s") << "  "
         << std::setw(9) << amilive::to_string(c.direction) << "  "
         << std::setw(10) << c.state << "  "
         << (c.extension.empty() ? "-" : c.extension) << "  "
         << (c.caller_id.empty() ? "?" : c.caller_id) << "->"
         << (c.destination.empty() ? "?" : c.destination) << "  "
         << c.channel << "  " << c.context;

    std::string s = line.str();
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y, 0, "%s", s.c_str());

    if (sel) attroff(A_REVERSE);
  }

  if (rows.empty()) {
    mvprintw(y, 0, "%s", ami.is_connected() ? "No active calls." : "Not connected to AMI.");
  }

  mvhline(maxy - 2, 0, ACS_HLINE, maxx);
  std::string st = vs.status_line;
  if ((int)st.size() > maxx - 1) st.resize(maxx - 1);
  mvprintw(maxy - 1, 0, "%s", st.c_str());

  refresh();
}

static void tui_show_devices(const AmiClient& ami) {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  mvprintw(0, 0, "Device states (press any key to return)");
  mvhline(1, 0, ACS_HLINE, maxx);

  int y = 2;
  for (const auto& [name, d] : ami.device_states()) {
    if (y >= maxy) break;
    std::ostringstream line;
    line << std::left << std::setw(32) << name << std::setw(16) << d.state
         << secs_since(d.updated) << "s ago";
    std::string s = line.str();
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y++, 0, "%s", s.c_str());
  }
  refresh();
  getch();
}

static void tui_show_logs() {
  erase();
  int maxy, maxx;
  getmaxyx(stdscr, maxy, maxx);

  mvprintw(0, 0, "Client log (press any key to return)");
  mvhline(1, 0, ACS_HLINE, maxx);

  auto history = amilive::log::Logger::instance().history();
  int start = std::max(0, (int)history.size() - (maxy - 3));
  int y = 2;
  for (int i = start; i < (int)history.size() && y < maxy; i++, y++) {
    std::string s = history[i];
    if ((int)s.size() > maxx - 1) s.resize(maxx - 1);
    mvprintw(y, 0, "%s", s.c_str());
  }
  refresh();
  getch();
}

static void hangup_selected(AmiClient& ami, ViewState& vs) {
  auto rows = visible_calls(ami, vs);
  if (rows.empty()) return;
  const auto& c = rows[std::max(0, std::min(vs.selected, (int)rows.size() - 1))];
  try {
    auto resp = ami.send_action("Hangup", {{"Channel", c.channel}});
    vs.status_line = "Hangup " + c.channel + ": " + resp.get("Response") + " " + resp.get("Message");
    AMILIVE_INFO(vs.status_line);
  } catch (const amilive::Error& ex) {
    vs.status_line = "Hangup " + c.channel + " failed: " + ex.what();
    AMILIVE_WARN(vs.status_line);
  }
}

static void signal_handler(int) {
  g_running.store(false);
}

int main(int argc, char** argv) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  amilive::Settings cfg;
  try {
    cfg = amilive::load_settings(argc, argv);
    cfg.validate();
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n"
              << "Usage: " << argv[0] << " <host> <port> <user> <secret>\n"
              << "Or set AMI_HOST/AMI_PORT/AMI_USERNAME/AMI_PASSWORD in environment.\n";
    return 1;
  }

  AmiClient ami(cfg);

  // First attempt in the foreground so bad credentials are reported on the terminal.
  try {
    ami.connect();
  } catch (const amilive::AuthenticationFailure& ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  } catch (const amilive::Error& ex) {
    std::cerr << "AMI not reachable yet (" << ex.what() << "), will keep retrying.\n";
  }

  // The screen owns the terminal from here; log lines go to the history only.
  amilive::log::Logger::instance().set_output(nullptr);
  ami.start();

  initscr();
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);
  curs_set(0);

  ViewState vs;
  while (g_running.load()) {
    tui_draw(ami, vs);

    int ch = getch();
    if (ch == ERR) {
      std::this_thread::sleep_for(std::chrono::milliseconds(120));
      continue;
    }

    if (ch == 'q' || ch == 'Q') break;

    if (ch == KEY_UP) vs.selected = std::max(0, vs.selected - 1);
    if (ch == KEY_DOWN) vs.selected++;

    if (ch == 'f' || ch == 'F') {
      if (vs.filter == "all") vs.filter = "inbound";
      else if (vs.filter == "inbound") vs.filter = "outbound";
      else if (vs.filter == "outbound") vs.filter = "internal";
      else vs.filter = "all";
      vs.selected = 0;
    }

    if (ch == 'h' || ch == 'H') hangup_selected(ami, vs);

    if (ch == 'r' || ch == 'R') {
      vs.status_line = "Reconnecting...";
      tui_draw(ami, vs);
      try {
        ami.reconnect();
        vs.status_line = "Reconnected";
      } catch (const amilive::Error& ex) {
        vs.status_line = std::string("Reconnect failed: ") + ex.what();
      }
    }

    if (ch == 'd' || ch == 'D' || ch == 'l' || ch == 'L') {
      nodelay(stdscr, FALSE);
      if (ch == 'd' || ch == 'D') tui_show_devices(ami);
      else tui_show_logs();
      nodelay(stdscr, TRUE);
    }
  }

  endwin();
  amilive::log::Logger::instance().set_output(&std::cerr);

  ami.stop();
  ami.disconnect();
  return 0;
}

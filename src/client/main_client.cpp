#include "command_executor.hpp"
#include "linux_usb_host.hpp"
#include "logging.hpp"
#include "remote_files.hpp"
#include "session_selector.hpp"
#include "settings.hpp"
#include "sqlite_task_store.hpp"
#include "transfer_engine.hpp"
#include "util.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <thread>

using namespace pcex;

namespace {

void usage() {
  std::cerr
      << "usage: pcex [options] <command> [args]\n"
         "options:\n"
         "  --settings FILE   preferences file (default pcex.conf)\n"
         "  --db FILE         transfer history database (default pcex.db)\n"
         "  --mode MODE       DirectHost|TunnelClient|TunnelServer|WifiClient|Auto\n"
         "  --wifi HOST:PORT  PC address for WifiClient\n"
         "  --log-level LVL   trace|debug|info|warn|error\n"
         "  --threads N       worker threads\n"
         "commands:\n"
         "  status | mode [MODE] | drives | df DRIVE\n"
         "  ls PATH [name|date|size|type] [desc] | stat PATH | find QUERY [PATH]\n"
         "  mkdir PARENT NAME | mv PATH NEW_NAME | rm PATH...\n"
         "  get REMOTE LOCAL | put LOCAL REMOTE\n"
         "  history | cancel ID | retry ID | clear-history\n";
}

void print_entry(const FileEntry &e) {
  std::cout << (e.is_directory ? "d " : "- ") << e.path;
  if (!e.is_directory)
    std::cout << "  " << format_bytes(e.size);
  std::cout << "\n";
}

void print_task(const TransferTask &t) {
  std::cout << t.id << "  " << direction_name(t.direction) << "  "
            << transfer_state_name(t.state) << "  " << t.file_name << "  "
            << format_bytes(t.transferred_bytes) << "/"
            << format_bytes(t.total_bytes);
  if (t.error)
    std::cout << "  (" << *t.error << ")";
  std::cout << "\n";
}

template <typename T> int report(const Result<T> &r) {
  if (r)
    return 0;
  std::cerr << "error: " << r.error().describe() << std::endl;
  return 1;
}

Result<void> ensure_connected(SessionSelector &sessions) {
  if (sessions.state().is_connected())
    return {};
  auto r = sessions.connect();
  if (!r && r.error().code == TransportErrc::authorization_required)
    r = sessions.request_authorization();
  return r;
}

bool prompt_for_access(const UsbDeviceInfo &dev) {
  std::cerr << "Access to " << dev.node << " (" << dev.product
            << ") is not permitted.\n"
               "Grant read/write access to the device node (for example with "
               "a udev rule), then press Enter to retry or type 'n' to give up: ";
  std::string line;
  if (!std::getline(std::cin, line))
    return false;
  return line != "n" && line != "N";
}

} // namespace

int main(int argc, char **argv) {
  std::string settings_path = "pcex.conf";
  std::string db_path = "pcex.db";
  std::string mode_arg, wifi_arg;
  int threads = std::max(2u, std::thread::hardware_concurrency());
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--settings")
      settings_path = next(i);
    else if (a == "--db")
      db_path = next(i);
    else if (a == "--mode")
      mode_arg = next(i);
    else if (a == "--wifi")
      wifi_arg = next(i);
    else if (a == "--threads")
      threads = std::atoi(next(i).c_str());
    else if (a == "--log-level") {
      LogLevel lvl;
      std::string v = next(i);
      if (!parse_log_level(v, lvl)) {
        std::cerr << "bad log level " << v << std::endl;
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else
      args.push_back(a);
  }
  if (args.empty()) {
    usage();
    return 1;
  }
  if (threads < 1)
    threads = 1;

  Settings settings(settings_path);
  settings.load();
  if (!mode_arg.empty()) {
    ConnectionMode m;
    if (!parse_mode(mode_arg, m)) {
      std::cerr << "bad mode " << mode_arg << std::endl;
      return 1;
    }
    settings.set_connection_mode(m);
  }
  if (!wifi_arg.empty()) {
    std::string host;
    uint16_t port;
    if (!parse_host_port(wifi_arg, host, port)) {
      std::cerr << "bad wifi address " << wifi_arg << std::endl;
      return 1;
    }
    settings.set_wifi_endpoint(host, port);
  }

  auto store = SqliteTaskStore::open(db_path);
  if (!store) {
    std::cerr << "error: " << store.error().describe() << std::endl;
    return 1;
  }

  LinuxUsbHost usb(prompt_for_access);
  SessionSelector sessions(settings, usb);
  CommandExecutor exec(sessions);
  RemoteFiles files(exec);
  TransferEngine transfers(exec, *store.value());
  WorkerPool pool((std::size_t)threads);

  const std::string cmd = args[0];
  // Local-only commands.
  if (cmd == "mode") {
    if (args.size() > 1) {
      ConnectionMode m;
      if (!parse_mode(args[1], m)) {
        std::cerr << "bad mode " << args[1] << std::endl;
        return 1;
      }
      sessions.set_mode(m);
    }
    std::cout << mode_name(sessions.mode()) << " (uses "
              << mode_name(sessions.active_mode()) << ")\n";
    return 0;
  }
  if (cmd == "history") {
    auto r = transfers.history();
    if (r)
      for (const auto &t : r.value())
        print_task(t);
    return report(r);
  }
  if (cmd == "cancel") {
    if (args.size() < 2) {
      std::cerr << "cancel: missing argument\n";
      return 1;
    }
    return report(transfers.cancel(args[1]));
  }
  if (cmd == "clear-history") {
    auto r = transfers.clear_history();
    if (r)
      std::cout << r.value() << " task(s) removed\n";
    return report(r);
  }

  // Remote commands run on the pool, so their arguments are checked here.
  static const std::map<std::string, size_t> kRemoteArity = {
      {"status", 0}, {"drives", 0}, {"ls", 1},  {"stat", 1},
      {"find", 1},   {"mkdir", 2},  {"mv", 2},  {"rm", 1},
      {"df", 1},     {"get", 2},    {"put", 2}, {"retry", 1}};
  auto arity = kRemoteArity.find(cmd);
  if (arity == kRemoteArity.end()) {
    std::cerr << "unknown command " << cmd << "\n";
    usage();
    return 1;
  }
  if (args.size() <= arity->second) {
    std::cerr << cmd << ": missing argument\n";
    usage();
    return 1;
  }

  int token = sessions.subscribe([](const ConnectionState &s) {
    Logger::instance().log(LogLevel::DEBUG, "state: %s %s",
                           state_name(s.kind), s.message.c_str());
  });
  auto connected = ensure_connected(sessions);
  if (!connected) {
    sessions.unsubscribe(token);
    return report(connected);
  }
  if (cmd == "status") {
    auto s = sessions.state();
    std::cout << state_name(s.kind) << ": " << s.device.display_name << " ["
              << s.device.id << "]\n";
    sessions.disconnect();
    sessions.unsubscribe(token);
    return 0;
  }

  transfers.set_progress_listener([](const TransferTask &t) {
    if (t.state == TransferState::InProgress)
      std::cerr << "\r" << t.file_name << "  " << (int)(t.progress() * 100)
                << "%   " << std::flush;
    else if (t.state != TransferState::Pending)
      std::cerr << "\n";
  });

  auto job = pool.submit([&]() -> int {
    if (cmd == "ls") {
      SortOrder order;
      if (args.size() > 2) {
        const std::string &k = args[2];
        order.key = k == "date"   ? SortKey::Date
                    : k == "size" ? SortKey::Size
                    : k == "type" ? SortKey::Type
                                  : SortKey::Name;
      }
      if (args.size() > 3 && args[3] == "desc")
        order.ascending = false;
      auto r = files.list(args[1], order);
      if (r)
        for (const auto &e : r.value())
          print_entry(e);
      return report(r);
    }
    if (cmd == "stat") {
      auto r = files.file_info(args[1]);
      if (r)
        print_entry(r.value());
      return report(r);
    }
    if (cmd == "find") {
      auto r = files.search(args[1], args.size() > 2 ? args[2] : "");
      if (r)
        for (const auto &e : r.value())
          print_entry(e);
      return report(r);
    }
    if (cmd == "mkdir") {
      auto r = files.create_directory(args[1], args[2]);
      if (r)
        print_entry(r.value());
      return report(r);
    }
    if (cmd == "mv") {
      auto r = files.rename(args[1], args[2]);
      if (r)
        print_entry(r.value());
      return report(r);
    }
    if (cmd == "rm") {
      std::vector<std::string> paths(args.begin() + 1, args.end());
      return report(files.remove(paths));
    }
    if (cmd == "drives") {
      auto r = files.drives();
      if (r)
        for (const auto &d : r.value())
          std::cout << d << "\n";
      return report(r);
    }
    if (cmd == "df") {
      auto r = files.storage_info(args[1]);
      if (r)
        std::cout << r.value().drive << " " << r.value().volume_name << "  "
                  << format_bytes(r.value().used_bytes()) << " used of "
                  << format_bytes(r.value().total_bytes) << "\n";
      return report(r);
    }
    if (cmd == "get") {
      auto r = transfers.download(args[1], args[2]);
      if (r)
        print_task(r.value());
      return report(r);
    }
    if (cmd == "put") {
      auto r = transfers.upload(args[1], args[2]);
      if (r)
        print_task(r.value());
      return report(r);
    }
    if (cmd == "retry") {
      auto r = transfers.retry(args[1]);
      if (r)
        print_task(r.value());
      return report(r);
    }
    return 1;
  });

  int rc = job.get();
  sessions.disconnect();
  sessions.unsubscribe(token);
  return rc;
}

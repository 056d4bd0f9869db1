#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <random>
#include <stdexcept>

namespace pcex {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (!is_valid_port(p))
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string normalize_host(const std::string &host) {
  std::string h = trim(host);
  if (to_lower(h) == "localhost")
    return "127.0.0.1";
  return h;
}

bool is_valid_port(long port) { return port >= 1 && port <= 65535; }

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b]))
    b++;
  while (e > b && std::isspace((unsigned char)s[e - 1]))
    e--;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

int64_t now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

std::string make_task_id() {
  static std::mutex mtx;
  static std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi, lo;
  {
    std::lock_guard<std::mutex> lk(mtx);
    hi = rng();
    lo = rng();
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
  lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                (unsigned)(hi >> 32), (unsigned)((hi >> 16) & 0xFFFF),
                (unsigned)(hi & 0xFFFF), (unsigned)(lo >> 48),
                (unsigned long long)(lo & 0xFFFFFFFFFFFFull));
  return buf;
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = (double)bytes;
  int u = 0;
  while (v >= 1024.0 && u < 4) {
    v /= 1024.0;
    u++;
  }
  char buf[32];
  if (u == 0)
    std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
  else
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return buf;
}

} // namespace pcex

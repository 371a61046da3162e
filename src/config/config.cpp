#include "panel_sync/config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace panel_sync {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = UINT64_MAX;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool load_config(const std::string &path, SessionConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  SessionConfig next = cfg;
  std::uint64_t u;
  std::string s;
  if (extract_u64(text, "update_interval_ms", u))
    next.update_interval_ms = clamp_u64(u, 0, 3600000);
  if (extract_u64(text, "open_timeout_ms", u))
    next.open_timeout_ms = clamp_u64(u, 0, 600000);
  if (extract_u64(text, "default_ttl_ms", u))
    next.default_ttl_ms = clamp_u64(u, 0, 86400000);
  if (extract_u64(text, "tick_ms", u))
    next.tick_ms = clamp_u64(u, 1, 1000);
  if (extract_u64(text, "worker_threads", u))
    next.worker_threads = static_cast<std::size_t>(clamp_u64(u, 1, 256));
  if (extract_string(text, "executor", s)) {
    if (s != "pool" && s != "inline") {
      if (err)
        *err = "unknown executor: " + s;
      return false;
    }
    next.executor = s;
  }
  if (extract_string(text, "log_level", s))
    next.log_level = s;

  cfg = next;
  return true;
}

} // namespace panel_sync

#include "panel_sync/config.hpp"
#include "panel_sync/executor.hpp"
#include "panel_sync/host.hpp"
#include "panel_sync/log.hpp"
#include "panel_sync/session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

namespace {
volatile std::sig_atomic_t running = 1;
void on_sigint(int) { running = 0; }

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

class SimViewer final : public panel_sync::IViewer {
public:
  SimViewer(std::string id, std::string name)
      : id_(std::move(id)), name_(std::move(name)) {}

  std::string id() const override { return id_; }
  std::string name() const override { return name_; }
  bool online() const override { return online_.load(); }
  void disconnect() { online_.store(false); }

private:
  std::string id_;
  std::string name_;
  std::atomic<bool> online_{true};
};

// Prints one line per panel: each source shows its value or its state.
class ConsoleRenderer final : public panel_sync::IPanelRenderer {
public:
  explicit ConsoleRenderer(std::vector<std::string> keys)
      : keys_(std::move(keys)) {}

  void render(panel_sync::ViewerState &state) override {
    std::ostringstream os;
    os << "[" << state.viewer()->name() << "]";
    for (const auto &key : keys_) {
      os << " " << key << "=";
      const auto data = state.computed<std::int64_t>(key).map(
          [](std::int64_t v) { return std::to_string(v); });
      if (data.is_error()) {
        os << "error(" << data.error_message().value_or("?") << ")";
      } else if (data.is_present()) {
        os << data.value_or("");
        if (state.cache().is_expired(key))
          os << "(stale)";
      } else {
        os << (data.is_loading() ? "loading" : "-");
      }
    }
    auto &line = lines_[state.id()];
    if (line == os.str())
      return;
    line = os.str();
    if (shown_.contains(state.id()))
      std::cout << line << "\n";
  }

  void present(panel_sync::ViewerState &state) override {
    shown_.insert(state.id());
    std::cout << lines_[state.id()] << "\n";
  }

private:
  std::vector<std::string> keys_;
  std::map<std::string, std::string> lines_;
  std::set<std::string> shown_;
};

} // namespace

int main(int argc, char **argv) {
  panel_sync::SessionConfig cfg;
  // Repaint at least once a second unless the config file says otherwise.
  cfg.update_interval_ms = 1000;
  std::string config_path;
  std::string log_level;
  std::uint64_t max_ticks = 200;
  std::uint64_t viewers = 3;
  std::uint64_t load_ms = 120;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (a == "--ticks" && i + 1 < argc) {
      if (!parse_u64(argv[++i], max_ticks)) {
        std::cerr << "invalid --ticks\n";
        return 1;
      }
    } else if (a == "--viewers" && i + 1 < argc) {
      if (!parse_u64(argv[++i], viewers)) {
        std::cerr << "invalid --viewers\n";
        return 1;
      }
    } else if (a == "--load-ms" && i + 1 < argc) {
      if (!parse_u64(argv[++i], load_ms)) {
        std::cerr << "invalid --load-ms\n";
        return 1;
      }
    }
  }

  std::string err;
  if (!config_path.empty() && !panel_sync::load_config(config_path, cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 1;
  }
  if (!log_level.empty())
    cfg.log_level = log_level;
  if (!panel_sync::set_log_level(cfg.log_level, &err)) {
    std::cerr << err << "\n";
    return 1;
  }

  // Loaders read this from worker threads; it must outlive the executor.
  std::atomic<std::int64_t> generation{0};
  auto executor =
      panel_sync::make_executor_by_name(cfg.executor, cfg.worker_threads);
  panel_sync::TickLoop host;
  const std::vector<std::string> keys = {"balance", "rank", "quests"};
  ConsoleRenderer renderer(keys);
  panel_sync::PanelSession session(host, renderer, executor,
                                   {cfg.update_interval(), nullptr});

  const auto delay = std::chrono::milliseconds(load_ms);
  session.sources().add(
      "balance",
      [&generation, delay](const panel_sync::IViewer &v) -> panel_sync::Value {
        std::this_thread::sleep_for(delay);
        return static_cast<std::int64_t>(v.name().size() * 100 +
                                         generation.load());
      },
      cfg.default_ttl());
  session.sources().add(
      "rank",
      [delay](const panel_sync::IViewer &v) -> panel_sync::Value {
        std::this_thread::sleep_for(delay * 2);
        return static_cast<std::int64_t>(std::hash<std::string>{}(v.id()) % 50);
      },
      cfg.default_ttl());
  session.sources().add(
      "quests",
      [delay](const panel_sync::IViewer &) -> panel_sync::Value {
        std::this_thread::sleep_for(delay);
        throw std::runtime_error("quest service unavailable");
      },
      std::nullopt);

  std::vector<std::shared_ptr<SimViewer>> sims;
  for (std::uint64_t i = 0; i < viewers; ++i) {
    auto sim = std::make_shared<SimViewer>("v" + std::to_string(i),
                                           "viewer" + std::to_string(i));
    sims.push_back(sim);
    session.open(sim, cfg.open_timeout(),
                 [name = sim->name()](const panel_sync::OpenResult &r) {
                   std::cout << name << " opened: " << r.describe() << "\n";
                 });
  }

  std::signal(SIGINT, on_sigint);
  std::mt19937_64 rng(424242);
  std::uniform_int_distribution<int> pick(0, 99);
  std::cout << "panel_sync_demo running " << max_ticks << " ticks, tick "
            << cfg.tick_ms << "ms, executor " << executor->name() << "\n";

  for (std::uint64_t t = 0; running && t < max_ticks; ++t) {
    host.tick();
    const int roll = pick(rng);
    if (roll < 3) {
      // Upstream data changed: mark every cache stale.
      generation.fetch_add(1);
      for (const auto &sim : sims) {
        if (auto state = session.state(sim->id()))
          state->cache().invalidate_all();
      }
    } else if (roll == 99 && sims.size() > 1) {
      sims.back()->disconnect();
      std::cout << sims.back()->name() << " disconnected\n";
      sims.pop_back();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg.tick_ms));
  }

  if (const auto *sched = session.scheduler()) {
    const auto s = sched->stats();
    std::cout << "ticks:" << s.ticks << " repaints:" << s.repaints
              << " failures:" << s.failures
              << " removed_offline:" << s.removed_offline << "\n";
  }
  for (const auto &sim : sims) {
    if (auto state = session.state(sim->id()))
      std::cout << sim->name() << "\n" << state->cache().info();
    session.close(sim->id());
  }
  return 0;
}

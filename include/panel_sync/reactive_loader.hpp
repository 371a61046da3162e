#pragma once

#include "panel_sync/types.hpp"
#include "panel_sync/viewer_state.hpp"

#include <functional>
#include <string>
#include <vector>

namespace panel_sync {

// Named data sources a panel depends on. trigger() asks a viewer's cache for
// each of them, which only loads what is missing, failed or stale.
class ReactiveLoader {
public:
  using SourceLoader = std::function<Value(const IViewer &)>;

  void add(const std::string &key, SourceLoader loader, Ttl ttl);
  void trigger(ViewerState &state) const;

  std::vector<std::string> keys() const;
  std::size_t size() const { return sources_.size(); }
  bool empty() const { return sources_.empty(); }

private:
  struct Source {
    std::string key;
    SourceLoader loader;
    Ttl ttl;
  };

  std::vector<Source> sources_;
};

} // namespace panel_sync

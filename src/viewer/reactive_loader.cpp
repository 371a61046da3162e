#include "panel_sync/reactive_loader.hpp"

#include <algorithm>
#include <stdexcept>

namespace panel_sync {

void ReactiveLoader::add(const std::string &key, SourceLoader loader, Ttl ttl) {
  if (!loader)
    throw std::invalid_argument("reactive source '" + key + "' has no loader");
  auto it = std::find_if(sources_.begin(), sources_.end(),
                         [&](const Source &s) { return s.key == key; });
  if (it != sources_.end()) {
    it->loader = std::move(loader);
    it->ttl = ttl;
    return;
  }
  sources_.push_back({key, std::move(loader), ttl});
}

void ReactiveLoader::trigger(ViewerState &state) const {
  for (const auto &source : sources_) {
    state.cache().get_or_start_load(
        source.key,
        [viewer = state.viewer(), fn = source.loader] { return fn(*viewer); },
        source.ttl);
  }
}

std::vector<std::string> ReactiveLoader::keys() const {
  std::vector<std::string> out;
  out.reserve(sources_.size());
  for (const auto &s : sources_)
    out.push_back(s.key);
  return out;
}

} // namespace panel_sync

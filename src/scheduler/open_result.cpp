#include "panel_sync/open_result.hpp"

#include <sstream>

namespace panel_sync {

std::string to_string(OpenStatus status) {
  switch (status) {
  case OpenStatus::Immediate:
    return "IMMEDIATE";
  case OpenStatus::Preloaded:
    return "PRELOADED";
  case OpenStatus::Timeout:
    return "TIMEOUT";
  case OpenStatus::ViewerOffline:
    return "VIEWER_OFFLINE";
  case OpenStatus::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

OpenResult::OpenResult(OpenStatus status, Duration elapsed,
                       std::set<std::string> successful,
                       std::set<std::string> failed,
                       std::set<std::string> pending, std::exception_ptr error)
    : status_(status), elapsed_(elapsed), successful_(std::move(successful)),
      failed_(std::move(failed)), pending_(std::move(pending)),
      error_(std::move(error)) {}

OpenResult OpenResult::immediate() {
  return OpenResult(OpenStatus::Immediate, Duration::zero(), {}, {}, {},
                    nullptr);
}

OpenResult OpenResult::preloaded(Duration elapsed,
                                 std::set<std::string> successful,
                                 std::set<std::string> failed) {
  return OpenResult(OpenStatus::Preloaded, elapsed, std::move(successful),
                    std::move(failed), {}, nullptr);
}

OpenResult OpenResult::timeout(Duration elapsed,
                               std::set<std::string> successful,
                               std::set<std::string> failed,
                               std::set<std::string> pending) {
  return OpenResult(OpenStatus::Timeout, elapsed, std::move(successful),
                    std::move(failed), std::move(pending), nullptr);
}

OpenResult OpenResult::viewer_offline(Duration elapsed) {
  return OpenResult(OpenStatus::ViewerOffline, elapsed, {}, {}, {}, nullptr);
}

OpenResult OpenResult::error(Duration elapsed, std::exception_ptr error) {
  return OpenResult(OpenStatus::Error, elapsed, {}, {}, {}, std::move(error));
}

bool OpenResult::success() const {
  return status_ == OpenStatus::Immediate ||
         status_ == OpenStatus::Preloaded || status_ == OpenStatus::Timeout;
}

std::size_t OpenResult::total() const {
  return successful_.size() + failed_.size() + pending_.size();
}

double OpenResult::success_rate() const {
  const auto n = total();
  if (n == 0)
    return 1.0;
  return static_cast<double>(successful_.size()) / static_cast<double>(n);
}

std::string OpenResult::describe() const {
  std::ostringstream os;
  os << "OpenResult{status=" << to_string(status_)
     << ", elapsed=" << elapsed_.count() << "ms"
     << ", success=" << successful_.size() << ", failed=" << failed_.size()
     << ", pending=" << pending_.size() << "}";
  return os.str();
}

} // namespace panel_sync

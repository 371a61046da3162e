#pragma once

#include "panel_sync/types.hpp"

#include <exception>
#include <optional>
#include <set>
#include <string>

namespace panel_sync {

enum class OpenStatus { Immediate, Preloaded, Timeout, ViewerOffline, Error };

std::string to_string(OpenStatus status);

class OpenResult {
public:
  static OpenResult immediate();
  static OpenResult preloaded(Duration elapsed, std::set<std::string> successful,
                              std::set<std::string> failed);
  static OpenResult timeout(Duration elapsed, std::set<std::string> successful,
                            std::set<std::string> failed,
                            std::set<std::string> pending);
  static OpenResult viewer_offline(Duration elapsed);
  static OpenResult error(Duration elapsed, std::exception_ptr error);

  OpenStatus status() const { return status_; }
  Duration elapsed() const { return elapsed_; }
  const std::set<std::string> &successful() const { return successful_; }
  const std::set<std::string> &failed() const { return failed_; }
  const std::set<std::string> &pending() const { return pending_; }
  std::exception_ptr error_ptr() const { return error_; }

  // Immediate, preloaded and timeout opens all showed the panel.
  bool success() const;
  bool failure() const { return !success(); }
  bool fully_loaded() const { return failed_.empty() && pending_.empty(); }
  bool partial() const { return !fully_loaded(); }
  std::size_t total() const;
  double success_rate() const;
  std::string describe() const;

private:
  OpenResult(OpenStatus status, Duration elapsed,
             std::set<std::string> successful, std::set<std::string> failed,
             std::set<std::string> pending, std::exception_ptr error);

  OpenStatus status_;
  Duration elapsed_;
  std::set<std::string> successful_;
  std::set<std::string> failed_;
  std::set<std::string> pending_;
  std::exception_ptr error_;
};

} // namespace panel_sync

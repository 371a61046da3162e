#pragma once

#include "panel_sync/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace panel_sync {

class IExecutor {
public:
  using Job = std::function<void()>;

  virtual ~IExecutor() = default;
  virtual std::string name() const = 0;
  virtual void execute(Job job) = 0;
  virtual std::size_t pending() const = 0;
};

// "inline" runs jobs on the calling thread; anything else is a fixed pool of
// `threads` workers (hardware concurrency when zero).
std::shared_ptr<IExecutor> make_executor_by_name(const std::string &mode,
                                                 std::size_t threads = 0);

} // namespace panel_sync

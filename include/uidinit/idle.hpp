#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace uidinit {

class IdleLoop {
public:
  explicit IdleLoop(std::chrono::milliseconds tick = std::chrono::hours(1),
                    std::chrono::milliseconds poll = std::chrono::milliseconds(200))
      : tick_(tick), poll_(poll) {}

  // Blocks until stop_flag is set. Returns the number of completed ticks.
  std::uint64_t run(std::atomic_bool &stop_flag) const;

private:
  bool wait_tick(std::atomic_bool &stop_flag) const;

  std::chrono::milliseconds tick_;
  std::chrono::milliseconds poll_;
};

// SIGINT/SIGTERM -> stop_flag = true
void install_stop_handlers(std::atomic_bool &stop_flag);

} // namespace uidinit

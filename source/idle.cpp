#include <uidinit/idle.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <thread>

namespace uidinit {

static std::atomic_bool *g_stop_flag = nullptr;

static void on_signal(int sig) {
  if ((sig == SIGINT || sig == SIGTERM) && g_stop_flag)
    g_stop_flag->store(true);
}

void install_stop_handlers(std::atomic_bool &stop_flag) {
  g_stop_flag = &stop_flag;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
}

bool IdleLoop::wait_tick(std::atomic_bool &stop_flag) const {
  const auto deadline = std::chrono::steady_clock::now() + tick_;
  while (!stop_flag.load()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return true;
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(left, poll_));
  }
  return false;
}

std::uint64_t IdleLoop::run(std::atomic_bool &stop_flag) const {
  spdlog::info("[idle] entering infinite sleep loop (tick={}s); send SIGINT "
               "or SIGTERM to exit",
               std::chrono::duration_cast<std::chrono::seconds>(tick_).count());
  std::uint64_t ticks = 0;
  while (wait_tick(stop_flag)) {
    ++ticks;
    spdlog::debug("[idle] tick {}", ticks);
  }
  return ticks;
}

} // namespace uidinit

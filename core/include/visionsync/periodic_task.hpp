#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace visionsync {

// Runs a callback every `interval` on its own thread until stop(). The first
// tick fires one interval after start(). stop() returns only after any
// running tick has finished. Called from the tick itself, it parks the worker
// thread, which is joined by the next stop() from another thread or by the
// destructor.
class PeriodicTask {
public:
  PeriodicTask() = default;
  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;
  ~PeriodicTask();

  // Restarts the task if already running.
  void start(std::chrono::milliseconds interval, std::function<void()> tick);
  void stop();
  bool running() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread worker_;
  std::thread retired_;
  std::uint64_t generation_ = 0;
  bool stop_requested_ = false;
  bool running_ = false;
};

} // namespace visionsync

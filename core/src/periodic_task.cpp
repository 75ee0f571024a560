#include "visionsync/periodic_task.hpp"
#include "visionsync/logger.hpp"

#include <exception>

namespace visionsync {

PeriodicTask::~PeriodicTask() {
  stop();
  // Only left joinable when the owner is destroyed from inside a tick.
  if (retired_.joinable())
    retired_.detach();
}

void PeriodicTask::start(std::chrono::milliseconds interval,
                         std::function<void()> tick) {
  stop();
  std::lock_guard<std::mutex> lk(mu_);
  stop_requested_ = false;
  running_ = true;
  std::uint64_t gen = ++generation_;
  worker_ = std::thread([this, gen, interval, tick = std::move(tick)] {
    std::unique_lock<std::mutex> lk(mu_);
    auto stopped = [this, gen] {
      return stop_requested_ || gen != generation_;
    };
    while (!stopped()) {
      if (cv_.wait_for(lk, interval, stopped))
        break;
      lk.unlock();
      try {
        tick();
      } catch (const std::exception &e) {
        VS_LOG_WARN(LogCategory::General,
                    std::string("periodic task tick failed: ") + e.what());
      }
      lk.lock();
    }
    if (gen == generation_)
      running_ = false;
  });
}

void PeriodicTask::stop() {
  std::thread current;
  std::thread retired;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
    current = std::move(worker_);
    retired = std::move(retired_);
  }
  cv_.notify_all();

  const auto self = std::this_thread::get_id();
  for (std::thread *t : {&retired, &current}) {
    if (!t->joinable())
      continue;
    if (t->get_id() == self) {
      std::lock_guard<std::mutex> lk(mu_);
      retired_ = std::move(*t);
    } else {
      t->join();
    }
  }
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_;
}

} // namespace visionsync

#include "visionsync/limiter.hpp"
#include <algorithm>

namespace visionsync {

ConcurrencyLimiter::ConcurrencyLimiter(size_t permits)
    : capacity_(permits == 0 ? 1 : permits) {}

void ConcurrencyLimiter::grant_locked() {
  in_use_++;
  peak_ = std::max(peak_, in_use_);
}

bool ConcurrencyLimiter::try_acquire() {
  std::lock_guard<std::mutex> lk(mu_);
  if (in_use_ < capacity_ && queue_.empty()) {
    grant_locked();
    return true;
  }
  return false;
}

bool ConcurrencyLimiter::acquire(const std::atomic<bool> *cancelled) {
  std::unique_lock<std::mutex> lk(mu_);
  if (cancelled && cancelled->load())
    return false;
  if (in_use_ < capacity_ && queue_.empty()) {
    grant_locked();
    return true;
  }

  auto w = std::make_shared<Waiter>();
  queue_.push_back(w);
  w->cv.wait(lk, [&] {
    return w->granted || (cancelled && cancelled->load());
  });
  if (w->granted)
    return true;

  queue_.erase(std::remove(queue_.begin(), queue_.end(), w), queue_.end());
  return false;
}

void ConcurrencyLimiter::release() {
  std::lock_guard<std::mutex> lk(mu_);
  if (in_use_ == 0)
    return;
  if (!queue_.empty()) {
    // in_use_ stays the same: the permit moves to the oldest waiter.
    auto w = queue_.front();
    queue_.pop_front();
    w->granted = true;
    w->cv.notify_one();
    return;
  }
  in_use_--;
}

void ConcurrencyLimiter::interrupt() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto &w : queue_)
    w->cv.notify_one();
}

size_t ConcurrencyLimiter::in_use() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_use_;
}

size_t ConcurrencyLimiter::peak_in_use() const {
  std::lock_guard<std::mutex> lk(mu_);
  return peak_;
}

size_t ConcurrencyLimiter::waiting() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

} // namespace visionsync

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace visionsync {

// Counting semaphore with FIFO hand-off. release() transfers the permit
// directly to the oldest waiter, so a newly arriving acquire() can never
// overtake a queued one.
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(size_t permits);
  ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
  ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

  // Blocks until a permit is granted. Returns false, holding nothing and with
  // the queue entry removed, if `cancelled` is observed set (checked on entry
  // and whenever interrupt() is called).
  bool acquire(const std::atomic<bool> *cancelled = nullptr);
  bool try_acquire();
  void release();

  // Wakes every waiter so it re-checks its cancel flag.
  void interrupt();

  size_t capacity() const { return capacity_; }
  size_t in_use() const;
  size_t peak_in_use() const;
  size_t waiting() const;

private:
  struct Waiter {
    bool granted = false;
    std::condition_variable cv;
  };

  const size_t capacity_;
  mutable std::mutex mu_;
  size_t in_use_ = 0;
  size_t peak_ = 0;
  std::deque<std::shared_ptr<Waiter>> queue_;

  void grant_locked();
};

// RAII permit holder.
class Permit {
public:
  Permit() = default;
  explicit Permit(ConcurrencyLimiter *l) : l_(l) {}
  Permit(Permit &&o) noexcept : l_(o.l_) { o.l_ = nullptr; }
  Permit &operator=(Permit &&o) noexcept {
    if (this != &o) {
      reset();
      l_ = o.l_;
      o.l_ = nullptr;
    }
    return *this;
  }
  Permit(const Permit &) = delete;
  Permit &operator=(const Permit &) = delete;
  ~Permit() { reset(); }

  void reset() {
    if (l_) {
      l_->release();
      l_ = nullptr;
    }
  }
  explicit operator bool() const { return l_ != nullptr; }

private:
  ConcurrencyLimiter *l_ = nullptr;
};

} // namespace visionsync

#include "WriteLock.h"

#include <algorithm>

namespace hc {

WriteLock::Guard::Guard(WriteLock &lock) : lock_(lock) {
  lock_.acquire();
  owns_ = true;
}

WriteLock::Guard::Guard(WriteLock &lock, uint64_t timeoutMs) : lock_(lock) {
  if (timeoutMs == 0) {
    lock_.acquire();
    owns_ = true;
  } else {
    owns_ = lock_.tryAcquireFor(std::chrono::milliseconds(timeoutMs));
  }
}

WriteLock::Guard::~Guard() {
  if (owns_) {
    lock_.release();
  }
}

void WriteLock::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!held_ && waiters_.empty()) {
    held_ = true;
    return;
  }

  Waiter waiter;
  waiters_.push_back(&waiter);
  waiter.cv.wait(lock, [&waiter] { return waiter.granted; });
  // release() already popped us and left held_ set on our behalf
}

bool WriteLock::tryAcquireFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!held_ && waiters_.empty()) {
    held_ = true;
    return true;
  }

  Waiter waiter;
  waiters_.push_back(&waiter);
  if (waiter.cv.wait_for(lock, timeout, [&waiter] { return waiter.granted; })) {
    return true;
  }

  // Timed out and not granted: leave the queue without touching held_
  waiters_.erase(std::find(waiters_.begin(), waiters_.end(), &waiter));
  return false;
}

void WriteLock::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (waiters_.empty()) {
    held_ = false;
    return;
  }

  Waiter *next = waiters_.front();
  waiters_.pop_front();
  next->granted = true;
  next->cv.notify_one();
}

bool WriteLock::isHeld() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_;
}

size_t WriteLock::getWaiterCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiters_.size();
}

} // namespace hc

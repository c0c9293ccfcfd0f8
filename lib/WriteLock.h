#ifndef HC_CHAIN_WRITE_LOCK_H
#define HC_CHAIN_WRITE_LOCK_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>

namespace hc {

/**
 * WriteLock - single-holder, FIFO-fair mutual exclusion
 *
 * Waiters queue in arrival order. On release, ownership is handed directly
 * to the oldest waiter, so a thread arriving later can never overtake a
 * queued one. Not reentrant: a holder must release before acquiring again.
 *
 * A timed acquisition that expires removes the waiter from the queue and
 * returns without owning the lock.
 */
class WriteLock {
public:
  /**
   * RAII holder. Acquires in the constructor (optionally with a timeout)
   * and releases in the destructor if ownership was obtained.
   */
  class Guard {
  public:
    explicit Guard(WriteLock &lock);
    // timeoutMs == 0 waits without limit
    Guard(WriteLock &lock, uint64_t timeoutMs);
    ~Guard();

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

    bool owns() const { return owns_; }

  private:
    WriteLock &lock_;
    bool owns_{ false };
  };

  WriteLock() = default;
  ~WriteLock() = default;

  WriteLock(const WriteLock &) = delete;
  WriteLock &operator=(const WriteLock &) = delete;

  /**
   * Block until the lock is owned by the caller
   */
  void acquire();

  /**
   * Block for at most timeout
   * @return true if the caller now owns the lock
   */
  bool tryAcquireFor(std::chrono::milliseconds timeout);

  /**
   * Release ownership and hand the lock to the next waiter, if any
   */
  void release();

  bool isHeld() const;
  size_t getWaiterCount() const;

private:
  struct Waiter {
    std::condition_variable cv;
    bool granted{ false };
  };

  mutable std::mutex mutex_;
  bool held_{ false };
  std::list<Waiter *> waiters_;
};

} // namespace hc

#endif // HC_CHAIN_WRITE_LOCK_H

#pragma once

#include "hal/hal_defines.hpp"
#include "hal/util/intrinsics.hpp"

#include <atomic>

namespace hal::util {

/**
 * Classic, portable spinlock. Implements the 'Lockable' interface so that it can stand in for a
 * mutex with std::scoped_lock. Intended for very short critical sections, such as appending a
 * single entry to one of a Message's outcome sequences.
 */
class Spinlock {
public:
  /**
   * Initializes the spinlock in an unacquired state.
   */
  Spinlock() noexcept : lock_ ATOMIC_FLAG_INIT { }

  /**
   * N.B. no attempt is made to unlock the spinlock; this is in line with how std::mutex behaves.
   */
  ~Spinlock() = default;

  Spinlock(const Spinlock &)            = delete;
  Spinlock &operator=(const Spinlock &) = delete;
  Spinlock(Spinlock &&)                 = delete;
  Spinlock &operator=(Spinlock &&)      = delete;

  /**
   * Blocks until the spinlock is acquired.
   */
  HAL_FORCEINLINE void lock() noexcept {
    while(!try_lock()) {
      [[unlikely]] HAL_INTRIN_PAUSE();
    }
  }

  /**
   * @return Whether or not the spinlock was acquired.
   */
  HAL_FORCEINLINE bool try_lock() noexcept {
    return !(lock_.test_and_set(std::memory_order_acquire));
  }

  HAL_FORCEINLINE void unlock() noexcept { lock_.clear(std::memory_order_release); }

private:
  std::atomic_flag lock_;

}; /* class Spinlock */

} /* namespace hal::util */

#pragma once
#include <atomic>

struct SpinLock {
  std::atomic_flag _latch = ATOMIC_FLAG_INIT;
  void Lock() {
    while (_latch.test_and_set(std::memory_order_acquire)) ;
  }
  void Unlock() {
    _latch.clear(std::memory_order_release);
  }
};

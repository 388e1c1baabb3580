#pragma once
#include <shared_mutex>

struct RWLock {
  std::shared_timed_mutex _time_latch;
  void Wlock()   { _time_latch.lock(); }
  void Wunlock() { _time_latch.unlock(); }
  void Rlock()   { _time_latch.lock_shared(); }
  void Runlock() { _time_latch.unlock_shared(); }
};

// scoped holders, so a throwing index operation never leaves the latch held
class ReadGuard {
  RWLock & _l;
 public:
  explicit ReadGuard(RWLock & l) : _l(l) { _l.Rlock(); }
  ~ReadGuard() { _l.Runlock(); }
  ReadGuard(const ReadGuard &) = delete;
  ReadGuard & operator=(const ReadGuard &) = delete;
};

class WriteGuard {
  RWLock & _l;
 public:
  explicit WriteGuard(RWLock & l) : _l(l) { _l.Wlock(); }
  ~WriteGuard() { _l.Wunlock(); }
  WriteGuard(const WriteGuard &) = delete;
  WriteGuard & operator=(const WriteGuard &) = delete;
};

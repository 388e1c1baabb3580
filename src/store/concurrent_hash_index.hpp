#pragma once
#include "rwlock.hpp"
#include "exceptions.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

template<typename KeyT, typename ValT>
class ConcurrentHashIndex {
  std::unordered_map<KeyT, ValT> _index;
  mutable RWLock _latch;
 public:
  void Insert(const KeyT & key, const ValT & val) {
    WriteGuard g(_latch);
    auto iter = _index.find(key);
    if (iter != _index.end()) {
      throw IndexException(Formatter() << "Key already exists : " << key);
    }
    _index.emplace(key, val);
  }
  ValT Read(const KeyT & key) const {
    ReadGuard g(_latch);
    auto iter = _index.find(key);
    if (iter == _index.end()) {
      throw IndexException(Formatter() << "No such key : " << key);
    }
    return iter->second;
  }
  void ReadAll(std::vector<ValT> & rsts) const {
    ReadGuard g(_latch);
    for (auto iter = _index.begin(); iter != _index.end(); iter++) {
      rsts.push_back(iter->second);
    }
  }
  ValT Delete(const KeyT & key) {
    WriteGuard g(_latch);
    auto iter = _index.find(key);
    if (iter == _index.end()) {
      throw IndexException(Formatter() << "No such key : " << key);
    }
    ValT val = iter->second;
    _index.erase(iter);
    return val;
  }
  size_t Size() const {
    ReadGuard g(_latch);
    return _index.size();
  }
};

#pragma once
#include "formatter.hpp"
#include <string>
#include <exception>
#include <cstdlib>
#include <execinfo.h>

#define MAX_TRACE_DEPTH 10

/**
 * @brief base of every exception thrown by relaynode. the call stack is
 * captured on construction and appended to the message on first what().
 */
class RelayException: public std::exception {
 private:
  mutable std::string _msg;
  mutable bool _trace_appended = false;
  void* _stack_pointers[MAX_TRACE_DEPTH];
  int _size;
 public:
  RelayException(std::string msg) : std::exception(), _msg(std::move(msg)), _size(backtrace(_stack_pointers, MAX_TRACE_DEPTH)) {}
  const std::string & msg() const { return _msg; }
  virtual char const * what() const throw() {
    if (_trace_appended) return _msg.c_str();
    _trace_appended = true;
    char** stacks = backtrace_symbols(_stack_pointers, _size);
    if (stacks == nullptr) return _msg.c_str();
    _msg += "\nTrace back:\n";
    for (int i = 0; i < _size; i++) {
      _msg += stacks[i];
      _msg += "\n";
    }
    std::free(stacks);
    return _msg.c_str();
  }
};

// broken invariant or precondition. the caller is wrong, not the input.
class FatalException: public RelayException {
 public:
  using RelayException::RelayException;
};

class RegistryException: public RelayException {
 public:
  using RelayException::RelayException;
};

class IndexException: public RelayException {
 public:
  using RelayException::RelayException;
};

class ContextException: public RelayException {
 public:
  using RelayException::RelayException;
};

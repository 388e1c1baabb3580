#pragma once
#include <sstream>
#include <string>

/**
 * @brief build an exception or log message inline:
 *   throw FatalException(Formatter() << "bad tag " << tag);
 */
class Formatter {
 private:
  std::stringstream _ss;
 public:
  Formatter() : _ss() {}
  Formatter(const Formatter &) = delete;
  Formatter & operator=(const Formatter &) = delete;

  template <typename T>
  Formatter & operator <<(const T & v) {
    _ss << v;
    return *this;
  }
  std::string str() const         { return _ss.str(); }
  operator std::string () const   { return _ss.str(); }
};

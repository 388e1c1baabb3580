#pragma once
#include "exceptions.hpp"
#include <boost/any.hpp>
#include <typeinfo>

/**
 * @brief ambient request state handed to every loader, e.g. a handle to the
 * object store or the caller's connection. Loaders may suspend, so it is
 * passed by value; keep the payload cheap to copy (a pointer or shared_ptr).
 */
class RelayContext {
 private:
  boost::any _data;
  explicit RelayContext(boost::any data) : _data(std::move(data)) {}
 public:
  RelayContext() {}

  static RelayContext nil() { return RelayContext(); }

  template<typename T>
  static RelayContext of(T data) {
    return RelayContext(boost::any(std::move(data)));
  }

  bool empty() const { return _data.empty(); }

  template<typename T>
  const T & get() const {
    const T* ptr = boost::any_cast<T>(&_data);
    if (ptr == nullptr) {
      throw ContextException(Formatter() << "relay context does not hold a " << typeid(T).name()
                                         << ", holds " << _data.type().name());
    }
    return *ptr;
  }

  template<typename T>
  const T * try_get() const {
    return boost::any_cast<T>(&_data);
  }
};

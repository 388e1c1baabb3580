#pragma once
#include "type.hpp"
#include "exceptions.hpp"
#include "spinlock.hpp"
#include "concurrent_hash_index.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief in-memory store of one node type, keyed by local id.
 * The store is the only place local ids are made: random (v4) uuids in
 * canonical lowercase form.
 */
template<typename ObjT>
class ObjectStore {
 private:
  ConcurrentHashIndex<local_id_t, ObjT> _index;
  boost::uuids::random_generator _uuid_gen;
  SpinLock _gen_latch;
 public:
  local_id_t NewId() {
    _gen_latch.Lock();
    boost::uuids::uuid u = _uuid_gen();
    _gen_latch.Unlock();
    return boost::uuids::to_string(u);
  }
  /**
   * @brief make(id) builds the object around a freshly assigned local id
   */
  template<typename MakeT>
  ObjT Create(MakeT && make) {
    local_id_t id = NewId();
    ObjT obj = make(id);
    try {
      _index.Insert(id, obj);
    } catch (IndexException &) {
      throw FatalException(Formatter() << "Unexpected reuse of local id " << id);
    }
    return obj;
  }
  std::optional<ObjT> Read(const local_id_t & id) const {
    try {
      return _index.Read(id);
    } catch (IndexException &) {
      return std::nullopt;
    }
  }
  bool Delete(const local_id_t & id) {
    try {
      _index.Delete(id);
      return true;
    } catch (IndexException &) {
      return false;
    }
  }
  std::vector<ObjT> ReadAll() const {
    std::vector<ObjT> rsts;
    _index.ReadAll(rsts);
    return rsts;
  }
  size_t Size() const { return _index.Size(); }
};

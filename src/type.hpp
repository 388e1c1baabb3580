#pragma once
#include <cstdint>
#include <functional>
#include <string>

/**
 * position of a node type in the registered type list, starting from 1.
 * 0 is reserved and never assigned to a real type.
 */
using node_tag_t = uint32_t;
const node_tag_t kUnknownTag = 0;

// canonical 36-char uuid. only unique inside the domain of one node type!
using local_id_t = std::string;

/**
 * @brief the id field of every schema object. crosses the api boundary as
 * its global id string, see operator<< in global_id.hpp
 */
struct relay_id_t {
  local_id_t id;
  node_tag_t tag = kUnknownTag;
  relay_id_t() {}
  relay_id_t(local_id_t id, const node_tag_t tag) : id(std::move(id)), tag(tag) {}
};

inline bool operator==(const relay_id_t & l, const relay_id_t & r) {
  return l.tag == r.tag && l.id == r.id;
}
inline bool operator!=(const relay_id_t & l, const relay_id_t & r) {
  return !(l == r);
}

namespace std {
template<>
struct hash<relay_id_t> {
  std::size_t operator()(relay_id_t const & id) const noexcept {
    return hash<std::string>()(id.id) ^ (hash<uint32_t>()(id.tag) << 1);
  }
};
};

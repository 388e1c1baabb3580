#pragma once
#include "type.hpp"
#include "uuid_canonical.hpp"
#include <optional>
#include <ostream>
#include <string>

/**
 * Global id wire format:
 *
 *   <compact local id, 32 chars><tag, plain decimal>
 *
 * e.g. 123e4567-e89b-12d3-a456-426614174000 with tag 2 is
 *      123e4567e89b12d3a4564266141740002
 *
 * Never persisted, always recomputed from (local id, tag).
 */

struct decoded_id_t {
  local_id_t id;
  // everything after the 32nd char, verbatim. not parsed as a number.
  std::string tag_str;
};

/**
 * @brief only feed ids that come from an object store. a local id shorter
 * than the canonical form throws FatalException.
 */
inline std::string EncodeGlobalId(const local_id_t & id, const node_tag_t tag) {
  return CompactUuid(id) + std::to_string(tag);
}

inline std::string EncodeGlobalId(const relay_id_t & id) {
  return EncodeGlobalId(id.id, id.tag);
}

/**
 * @brief split at char 32 and expand the id part.
 * @return nullopt if the input is shorter than a compact uuid
 */
inline std::optional<decoded_id_t> DecodeGlobalId(const std::string & global_id) {
  if (global_id.size() < kCompactUuidLen) return std::nullopt;
  decoded_id_t decoded;
  decoded.id = ExpandUuid(global_id.substr(0, kCompactUuidLen));
  decoded.tag_str = global_id.substr(kCompactUuidLen);
  return decoded;
}

inline std::ostream & operator<<(std::ostream & os, relay_id_t const & id) {
  return os << EncodeGlobalId(id);
}

#pragma once
#include "exceptions.hpp"
#include <cstddef>
#include <string>

const size_t kCanonicalUuidLen = 36;
const size_t kCompactUuidLen = 32;
// hyphen offsets of the canonical form 8-4-4-4-12
const size_t kUuidHyphenPos[4] = {8, 13, 18, 23};

/**
 * @brief drop the four structural hyphens of a canonical uuid.
 * The characters at the hyphen offsets are removed by position, nothing is
 * validated beyond the length.
 */
inline std::string CompactUuid(const std::string & canonical) {
  if (canonical.size() < kCanonicalUuidLen) {
    throw FatalException(Formatter() << "uuid must be in canonical form, got \"" << canonical << "\"");
  }
  std::string compact(canonical);
  for (int i = 3; i >= 0; i--) {
    compact.erase(kUuidHyphenPos[i], 1);
  }
  return compact;
}

/**
 * @brief inverse of CompactUuid. Structural only: the input must be exactly
 * 32 characters, but they are not checked to be hex digits.
 */
inline std::string ExpandUuid(const std::string & compact) {
  if (compact.size() != kCompactUuidLen) {
    throw FatalException(Formatter() << "compact uuid must be " << kCompactUuidLen << " chars, got " << compact.size());
  }
  std::string canonical;
  canonical.reserve(kCanonicalUuidLen);
  canonical.append(compact, 0, 8).push_back('-');
  canonical.append(compact, 8, 4).push_back('-');
  canonical.append(compact, 12, 4).push_back('-');
  canonical.append(compact, 16, 4).push_back('-');
  canonical.append(compact, 20, 12);
  return canonical;
}

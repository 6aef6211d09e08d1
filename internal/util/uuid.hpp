#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace avatarpool::util {

/*
  Avatar ids: random RFC4122 v4 UUIDs, lowercase canonical form
  (8-4-4-4-12 hex digits).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateUUIDString();

// True for lowercase canonical UUID strings only; used to reject
// ids that could never have been issued before touching storage.
bool IsCanonicalUUID(const std::string& text);

} // namespace avatarpool::util

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace artifact::util {

/*
  UUID helpers

  Random RFC4122 v4 identifiers, used for temp file names and
  lock holder tokens.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace artifact::util

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace graphflow::util {

/*
  UUID helpers

  Invocation and record ids are RFC4122 version 4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace graphflow::util

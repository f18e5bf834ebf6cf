#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace localdisk::util {

/*
  UUID helpers

  Lease ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Random [a-z0-9] string, used for queue delete tokens.
std::string RandomToken(std::size_t length);

} // namespace localdisk::util

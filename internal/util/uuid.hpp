#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace routebroker::util {

/*
  UUID helpers

  Job ids are RFC4122 v4 UUIDs in their canonical 36 character form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical string of a fresh v4 UUID.
std::string NewTaskId();

} // namespace routebroker::util

#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace routebroker::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewTaskId() {
  return ToString(GenerateUUID());
}

} // namespace routebroker::util

#include "identity.hpp"

#include <iomanip>
#include <sstream>

namespace slotwatch::util {

uint64_t Fnv1a64(const std::string& value) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : value) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string StableKey(const std::string& email) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << Fnv1a64(email);
  return oss.str();
}

} // namespace slotwatch::util

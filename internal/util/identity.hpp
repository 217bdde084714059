#pragma once

#include <cstdint>
#include <string>

namespace slotwatch::util {

/*
  Identity helpers

  A user key is the 16 hex digit FNV-1a 64 hash of the email. It is stable
  across processes and platforms, and safe to use in file names.
*/

uint64_t Fnv1a64(const std::string& value);

std::string StableKey(const std::string& email);

} // namespace slotwatch::util

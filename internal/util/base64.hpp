#pragma once

#include <string>
#include <string_view>

namespace slotwatch::util {

// Decodes standard base64, ignoring whitespace. Throws std::runtime_error on invalid input.
std::string DecodeBase64(std::string_view encoded);

} // namespace slotwatch::util

#include "text.hpp"

#include <algorithm>
#include <cctype>

namespace slotwatch::util {

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Trim(std::string_view value) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto begin = value.begin();
  auto end   = value.end();
  while (begin != end && is_space(*begin)) ++begin;
  while (end != begin && is_space(*(end - 1))) --end;
  return std::string(begin, end);
}

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

bool ContainsAnyIgnoreCase(std::string_view text, const std::vector<std::string>& markers) {
  const auto lowered = ToLower(text);
  for (const auto& marker : markers) {
    if (marker.empty()) continue;
    if (lowered.find(ToLower(marker)) != std::string::npos) return true;
  }
  return false;
}

} // namespace slotwatch::util

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace slotwatch::util {

std::string ToLower(std::string_view value);
std::string Trim(std::string_view value);

bool Contains(std::string_view haystack, std::string_view needle);
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// True if any marker occurs in text, ignoring case. Empty markers never match.
bool ContainsAnyIgnoreCase(std::string_view text, const std::vector<std::string>& markers);

} // namespace slotwatch::util

#include "base64.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>

namespace slotwatch::util {

namespace {

constexpr std::array<int, 256> BuildTable() {
  std::array<int, 256> table{};
  for (auto& v : table) v = -1;

  constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  for (int i = 0; i < 64; ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = i;
  }
  return table;
}

constexpr auto kDecodeTable = BuildTable();

} // namespace

std::string DecodeBase64(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size() * 3 / 4);

  uint32_t buffer = 0;
  int      bits   = 0;
  for (char c : encoded) {
    if (c == '=') break;
    if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;

    const int value = kDecodeTable[static_cast<unsigned char>(c)];
    if (value < 0) throw std::runtime_error("Invalid base64 input");

    buffer = (buffer << 6) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
    }
  }
  return out;
}

} // namespace slotwatch::util

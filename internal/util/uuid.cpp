#include "uuid.hpp"

#include <stdexcept>

namespace chunkcam::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

bool IsDashPosition(size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t half = 0; half < 2; ++half) {
    uint64_t bits = rng();
    for (size_t i = 0; i < 8; ++i, bits >>= 8) id[half * 8 + i] = static_cast<uint8_t>(bits);
  }

  // version 4, RFC4122 variant
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  if (str.size() != 36) throw std::invalid_argument("invalid UUID string: " + str);

  UUID   id{};
  size_t nibble = 0;
  for (size_t pos = 0; pos < str.size(); ++pos) {
    if (IsDashPosition(pos)) {
      if (str[pos] != '-') throw std::invalid_argument("invalid UUID string: " + str);
      continue;
    }

    const int v = HexValue(str[pos]);
    if (v < 0) throw std::invalid_argument("invalid UUID string: " + str);

    auto& byte = id[nibble / 2];
    byte       = static_cast<uint8_t>(nibble % 2 == 0 ? v << 4 : byte | v);
    ++nibble;
  }
  return id;
}

} // namespace chunkcam::util

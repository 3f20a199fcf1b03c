#include "core/ids/Guid.hpp"

#include <cmath>
#include <random>

#include "core/random/PseudoRandom.hpp"

namespace cft {

static std::string hexn(std::uint64_t v, int n) {
  static const char* k = "0123456789ABCDEF";
  std::string s(n, '0');
  for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
  return s;
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static Guid withVersion4(std::uint64_t high, std::uint64_t low) {
  // version 4
  high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx...
  low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return Guid(high, low);
}

GuidFormatError::GuidFormatError(std::string_view value)
  : std::invalid_argument("Couldn't parse Guid, expected grouped hex string, but got '" +
                          std::string(value) + "'.") {}

Guid Guid::newGuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t a = rng();
  const std::uint64_t b = rng();
  return withVersion4(a, b);
}

Guid Guid::fromRandom(PseudoRandom& random) {
  std::uint64_t words[2] = {0, 0};
  for (int i = 0; i < 16; ++i) {
    const auto byte = static_cast<std::uint64_t>(std::floor(random.random() * 256.0)) & 0xff;
    words[i / 8] = (words[i / 8] << 8) | byte;
  }
  return withVersion4(words[0], words[1]);
}

std::optional<Guid> Guid::tryParse(std::string_view value) {
  if (value.size() != 36) return std::nullopt;
  std::uint64_t words[2] = {0, 0};
  int nibbles = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return std::nullopt;
      continue;
    }
    const int v = hexValue(c);
    if (v < 0) return std::nullopt;
    auto& word = words[nibbles / 16];
    word = (word << 4) | static_cast<std::uint64_t>(v);
    ++nibbles;
  }
  return Guid(words[0], words[1]);
}

Guid Guid::fromString(std::string_view value) {
  if (auto guid = tryParse(value)) return *guid;
  throw GuidFormatError(value);
}

std::string Guid::guidString() const {
  return hexn(high_ >> 32, 8) + "-" + hexn((high_ >> 16) & 0xffffULL, 4) + "-" +
         hexn(high_ & 0xffffULL, 4) + "-" + hexn(low_ >> 48, 4) + "-" +
         hexn(low_ & 0xffffffffffffULL, 12);
}

} // namespace cft

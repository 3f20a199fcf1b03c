#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cft {

class PseudoRandom;

// Thrown when a string isn't a grouped-hex identifier.
class GuidFormatError : public std::invalid_argument {
public:
  explicit GuidFormatError(std::string_view value);
};

// 128-bit identifier, canonical form XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX (uppercase).
class Guid {
public:
  Guid() = default;
  Guid(std::uint64_t high, std::uint64_t low) : high_(high), low_(low) {}

  // Random version 4 identifier.
  static Guid newGuid();

  // Version 4 identifier drawn from a seeded generator, reproducible per seed.
  static Guid fromRandom(PseudoRandom& random);

  // Accepts either hex case, throws GuidFormatError otherwise.
  static Guid fromString(std::string_view value);
  static std::optional<Guid> tryParse(std::string_view value);

  std::string guidString() const;

  std::uint64_t high() const { return high_; }
  std::uint64_t low() const { return low_; }

  bool operator==(const Guid& other) const { return high_ == other.high_ && low_ == other.low_; }
  bool operator!=(const Guid& other) const { return !(*this == other); }

  // Same order as the canonical strings compare lexicographically.
  bool operator<(const Guid& other) const {
    return high_ != other.high_ ? high_ < other.high_ : low_ < other.low_;
  }

private:
  std::uint64_t high_ = 0;
  std::uint64_t low_ = 0;
};

struct GuidHash {
  std::size_t operator()(const Guid& guid) const {
    return std::hash<std::uint64_t>{}(guid.high() ^ (guid.low() * 0x9e3779b97f4a7c15ULL));
  }
};

} // namespace cft

namespace std {
template <>
struct hash<cft::Guid> : cft::GuidHash {};
} // namespace std

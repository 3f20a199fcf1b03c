#include "core/random/PseudoRandom.hpp"

#include <cmath>
#include <vector>

namespace cft {

static constexpr double kInitialMash = 4022871197.0; // 0xefc8249d
static constexpr double kTwoPow32 = 4294967296.0;
static constexpr double kTwoPowMinus32 = 2.3283064365386963e-10;

// ECMAScript ToUint32.
static double toUint32(double value) {
  double v = std::fmod(std::trunc(value), kTwoPow32);
  if (v < 0) v += kTwoPow32;
  return v;
}

// ECMAScript ToInt32.
static double toInt32(double value) {
  const double v = toUint32(value);
  return v >= 2147483648.0 ? v - kTwoPow32 : v;
}

static std::vector<std::uint16_t> utf16Units(std::string_view utf8) {
  std::vector<std::uint16_t> units;
  units.reserve(utf8.size());
  std::size_t i = 0;
  while (i < utf8.size()) {
    const auto c = static_cast<unsigned char>(utf8[i]);
    std::uint32_t cp = c;
    std::size_t len = 1;
    if (c >= 0xf0 && i + 3 < utf8.size()) {
      cp = ((c & 0x07u) << 18) | ((utf8[i + 1] & 0x3fu) << 12) | ((utf8[i + 2] & 0x3fu) << 6) | (utf8[i + 3] & 0x3fu);
      len = 4;
    } else if (c >= 0xe0 && i + 2 < utf8.size()) {
      cp = ((c & 0x0fu) << 12) | ((utf8[i + 1] & 0x3fu) << 6) | (utf8[i + 2] & 0x3fu);
      len = 3;
    } else if (c >= 0xc0 && i + 1 < utf8.size()) {
      cp = ((c & 0x1fu) << 6) | (utf8[i + 1] & 0x3fu);
      len = 2;
    }
    if (cp >= 0x10000) {
      cp -= 0x10000;
      units.push_back(static_cast<std::uint16_t>(0xd800 + (cp >> 10)));
      units.push_back(static_cast<std::uint16_t>(0xdc00 + (cp & 0x3ff)));
    } else {
      units.push_back(static_cast<std::uint16_t>(cp));
    }
    i += len;
  }
  return units;
}

PseudoRandom::PseudoRandom(std::string_view seed) {
  double n = kInitialMash;
  state0_ = mashResult(n = mash(" ", n));
  state1_ = mashResult(n = mash(" ", n));
  state2_ = mashResult(n = mash(" ", n));
  state0_ -= mashResult(n = mash(seed, n));
  if (state0_ < 0) state0_ += 1;
  state1_ -= mashResult(n = mash(seed, n));
  if (state1_ < 0) state1_ += 1;
  state2_ -= mashResult(n = mash(seed, n));
  if (state2_ < 0) state2_ += 1;
  constant_ = 1;
}

double PseudoRandom::mash(std::string_view data, double n) {
  for (const std::uint16_t unit : utf16Units(data)) {
    n += unit;
    double h = 0.02519603282416938 * n;
    n = toUint32(h);
    h -= n;
    h *= n;
    n = toUint32(h);
    h -= n;
    n += h * kTwoPow32;
  }
  return n;
}

double PseudoRandom::mashResult(double n) {
  return toUint32(n) * kTwoPowMinus32;
}

double PseudoRandom::random() {
  const double t = 2091639 * state0_ + constant_ * kTwoPowMinus32;
  state0_ = state1_;
  state1_ = state2_;
  constant_ = toInt32(t);
  state2_ = t - constant_;
  return state2_;
}

} // namespace cft

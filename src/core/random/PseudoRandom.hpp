#pragma once
#include <cstdint>
#include <string_view>

namespace cft {

// Seeded "Alea" generator. The same seed yields the same sequence on every
// platform, so it is only used for reproducible fixtures and identifiers.
class PseudoRandom {
public:
  explicit PseudoRandom(std::string_view seed);

  // Next value in [0, 1).
  double random();

private:
  // Mixes the UTF-16 code units of data into n.
  static double mash(std::string_view data, double n);
  static double mashResult(double n);

  double state0_ = 0;
  double state1_ = 0;
  double state2_ = 0;
  double constant_ = 1;
};

} // namespace cft

#include "league_core/random.hpp"

#include <algorithm>
#include <cmath>

namespace league_core {

static constexpr double kTwoPi = 6.283185307179586;

int RandomSource::uniform_int(int lo, int hi) {
  if (hi <= lo)
    return lo;
  const double span = static_cast<double>(hi) - static_cast<double>(lo) + 1.0;
  const int offset = static_cast<int>(std::floor(uniform() * span));
  return std::min(hi, lo + offset);
}

double RandomSource::normal() {
  double u1 = uniform();
  const double u2 = uniform();
  if (u1 < 1e-12)
    u1 = 1e-12;
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
}

double SeededRandom::uniform() {
  const double u = unif_(rng_);
  // Some standard libraries can return exactly 1.0.
  return u < 1.0 ? u : 0.0;
}

std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

} // namespace league_core

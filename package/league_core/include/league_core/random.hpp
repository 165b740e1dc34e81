#pragma once

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace league_core {

// Source of randomness injected into every stage. Only uniform() is
// virtual; everything else is derived from it so a scripted source can
// steer any decision.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform double in [0, 1).
  virtual double uniform() = 0;

  // Uniform integer in [lo, hi], inclusive.
  int uniform_int(int lo, int hi);

  // Uniform double in [lo, hi).
  double uniform_real(double lo, double hi) { return lo + (hi - lo) * uniform(); }

  // Standard normal deviate (Box-Muller).
  double normal();

  bool chance(double p) { return uniform() < p; }

  template <typename T> void shuffle(std::vector<T> &v) {
    for (int i = static_cast<int>(v.size()) - 1; i > 0; --i) {
      const int j = uniform_int(0, i);
      std::swap(v[i], v[j]);
    }
  }
};

class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(std::uint64_t seed) : seed_(seed), rng_(seed) {}

  double uniform() override;

  std::uint64_t seed() const { return seed_; }

private:
  std::uint64_t seed_{0};
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unif_{0.0, 1.0};
};

// splitmix64-style combination, used to derive independent sub-seeds.
std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b);

} // namespace league_core

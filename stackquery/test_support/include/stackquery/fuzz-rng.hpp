#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace stackquery::test {

// Deterministic PRNG for reproducibility of randomized tests.
class FuzzRng {
 public:
  explicit FuzzRng(uint64_t seed) : _gen(seed) {}

  uint8_t byte() { return static_cast<uint8_t>(_dist(_gen)); }

  uint32_t u32() {
    uint32_t ret = 0;
    for (int idx = 0; idx < 4; ++idx) {
      ret = (ret << 8) | byte();
    }
    return ret;
  }

  // Returns a value in [lo, hi), or lo if the range is empty.
  std::size_t range(std::size_t lo, std::size_t hi) {
    if (lo >= hi) {
      return lo;
    }
    return lo + (u32() % (hi - lo));
  }

  bool coin() { return (byte() & 1) != 0; }

 private:
  std::mt19937_64 _gen;
  std::uniform_int_distribution<uint16_t> _dist{0, 255};
};

}  // namespace stackquery::test

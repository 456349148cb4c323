#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "command.h"

namespace lockstep {

// Mulberry32. Identical seed + identical call sequence gives identical output on
// every peer. Only the simulation may draw from it, and only while processing a
// command or a tick; never from rendering, UI or timers.
class DeterministicRNG {
 public:
  explicit DeterministicRNG(uint32_t seed);

  DeterministicRNG(const DeterministicRNG&) = delete;
  DeterministicRNG& operator=(const DeterministicRNG&) = delete;

  uint32_t Seed() const;

  // [0, 1)
  double Next();
  // [min, max], inclusive on both ends.
  int NextInt(int min, int max);
  // [min, max)
  double NextFloat(double min, double max);
  bool NextBool(double probability = 0.5);
  // [0, 2*pi)
  double NextAngle();
  // Point on the unit circle at a uniform angle.
  Point NextUnitCircle();
  // Uniform over the unit disc.
  Point NextInUnitCircle();

  // Null for an empty vector, and then nothing is drawn.
  template <typename T>
  const T* Choice(const std::vector<T>& items) {
    if (items.empty()) return nullptr;
    return &items[static_cast<size_t>(NextInt(0, static_cast<int>(items.size()) - 1))];
  }

  template <typename T>
  void Shuffle(std::vector<T>& items) {
    for (size_t i = items.size(); i > 1; --i) {
      const size_t j = static_cast<size_t>(NextInt(0, static_cast<int>(i - 1)));
      std::swap(items[i - 1], items[j]);
    }
  }

 private:
  uint32_t NextU32();

  const uint32_t seed_;
  uint32_t state_;
};

// Host-side seed derivation: wall clock milliseconds folded into 32 bits.
uint32_t GenerateMatchSeed();

}  // namespace lockstep

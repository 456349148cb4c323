#include "deterministic_rng.h"

#include <chrono>
#include <cmath>

namespace lockstep {

namespace {

constexpr double kTwoPow32 = 4294967296.0;
constexpr double kPi = 3.14159265358979323846;

}  // namespace

DeterministicRNG::DeterministicRNG(uint32_t seed) : seed_(seed), state_(seed) {}

uint32_t DeterministicRNG::Seed() const {
  return seed_;
}

uint32_t DeterministicRNG::NextU32() {
  state_ += 0x6D2B79F5u;
  uint32_t t = state_;
  t = (t ^ (t >> 15)) * (t | 1u);
  t ^= t + (t ^ (t >> 7)) * (t | 61u);
  return t ^ (t >> 14);
}

double DeterministicRNG::Next() {
  return static_cast<double>(NextU32()) / kTwoPow32;
}

int DeterministicRNG::NextInt(int min, int max) {
  const double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
  return static_cast<int>(static_cast<int64_t>(std::floor(Next() * span)) + min);
}

double DeterministicRNG::NextFloat(double min, double max) {
  return Next() * (max - min) + min;
}

bool DeterministicRNG::NextBool(double probability) {
  return Next() < probability;
}

double DeterministicRNG::NextAngle() {
  return Next() * kPi * 2.0;
}

Point DeterministicRNG::NextUnitCircle() {
  const double angle = NextAngle();
  return Point{std::cos(angle), std::sin(angle)};
}

Point DeterministicRNG::NextInUnitCircle() {
  const double angle = NextAngle();
  const double radius = std::sqrt(Next());
  return Point{std::cos(angle) * radius, std::sin(angle) * radius};
}

uint32_t GenerateMatchSeed() {
  using namespace std::chrono;
  const uint64_t ms = static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
  return static_cast<uint32_t>(ms % 0xFFFFFFFFull);
}

}  // namespace lockstep

#include "Pill.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <random>

namespace {
constexpr char charset[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"};

// One generator per thread, parallel workers each make their own pills.
std::mt19937_64& rng()
{
  thread_local std::mt19937_64 gen{[] {
    std::random_device rd;
    std::array<std::seed_seq::result_type, 8> seeds;
    std::generate(begin(seeds), end(seeds), std::ref(rd));
    std::seed_seq seq(begin(seeds), end(seeds));
    return std::mt19937_64{seq};
  }()};
  return gen;
}
} // namespace

Pill::Pill()
{
  std::uniform_int_distribution<std::size_t> uni_dist{0, sizeof(charset) - 2};

  auto& gen{rng()};
  for (auto i{std::size_t{0}}; i < ndigits; ++i) {
    str_[i] = charset[uni_dist(gen)];
  }
  str_[ndigits] = '\0';
}

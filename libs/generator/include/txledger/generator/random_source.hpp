#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace txledger {
namespace generator {

// libsodium seed size (randombytes_SEEDBYTES)
constexpr std::size_t kSeedSize = 32;

using Seed = std::array<std::uint8_t, kSeedSize>;

// Uniform random numbers backed by libsodium. Unseeded sources draw from the
// system CSPRNG; seeded sources produce the same stream for the same seed.
class RandomSource {
 public:
  RandomSource();
  explicit RandomSource(const Seed& seed);

  // Hashes arbitrary text into a seed (BLAKE2b).
  [[nodiscard]] static Seed derive_seed(std::string_view text);

  // Uniform in [0, upper_bound). upper_bound must be non-zero.
  [[nodiscard]] std::uint32_t uniform(std::uint32_t upper_bound);

  // Uniform in [low, high).
  [[nodiscard]] std::uint32_t between(std::uint32_t low, std::uint32_t high);

  template <typename T>
  void shuffle(std::span<T> items) {
    for (std::size_t i = items.size(); i > 1; --i) {
      const auto j = uniform(static_cast<std::uint32_t>(i));
      using std::swap;
      swap(items[i - 1], items[j]);
    }
  }

  [[nodiscard]] bool deterministic() const noexcept { return seed_.has_value(); }

 private:
  static constexpr std::size_t kPoolSize = 1024;

  std::optional<Seed> seed_{};
  std::array<std::uint8_t, kPoolSize> pool_{};
  std::size_t pool_offset_{kPoolSize};

  std::uint32_t next_u32();
  void refill();
};

}  // namespace generator
}  // namespace txledger

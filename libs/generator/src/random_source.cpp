#include "txledger/generator/random_source.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>

namespace txledger {
namespace generator {

namespace {

static_assert(kSeedSize == randombytes_SEEDBYTES);

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

RandomSource::RandomSource() {
  ensure_sodium_init();
}

RandomSource::RandomSource(const Seed& seed) : seed_(seed) {
  ensure_sodium_init();
}

Seed RandomSource::derive_seed(std::string_view text) {
  ensure_sodium_init();
  Seed seed{};
  if (crypto_generichash(seed.data(), seed.size(), reinterpret_cast<const unsigned char*>(text.data()),
                         text.size(), nullptr, 0) != 0) {
    throw std::runtime_error("failed to derive generator seed");
  }
  return seed;
}

std::uint32_t RandomSource::uniform(std::uint32_t upper_bound) {
  if (upper_bound == 0) {
    throw std::invalid_argument("uniform() upper bound must be non-zero");
  }
  if (!seed_) {
    return randombytes_uniform(upper_bound);
  }

  // Same rejection sampling randombytes_uniform() performs, over the
  // deterministic stream.
  if (upper_bound < 2) {
    return 0;
  }
  const std::uint32_t min = (1U + ~upper_bound) % upper_bound;
  std::uint32_t value = 0;
  do {
    value = next_u32();
  } while (value < min);
  return value % upper_bound;
}

std::uint32_t RandomSource::between(std::uint32_t low, std::uint32_t high) {
  if (high <= low) {
    throw std::invalid_argument("between() needs low < high");
  }
  return low + uniform(high - low);
}

std::uint32_t RandomSource::next_u32() {
  if (pool_offset_ + sizeof(std::uint32_t) > kPoolSize - kSeedSize) {
    refill();
  }
  std::uint32_t value = 0;
  std::memcpy(&value, pool_.data() + pool_offset_, sizeof(value));
  pool_offset_ += sizeof(value);
  return value;
}

void RandomSource::refill() {
  // The pool's tail becomes the seed of the next block.
  randombytes_buf_deterministic(pool_.data(), pool_.size(), seed_->data());
  std::memcpy(seed_->data(), pool_.data() + kPoolSize - kSeedSize, kSeedSize);
  pool_offset_ = 0;
}

}  // namespace generator
}  // namespace txledger

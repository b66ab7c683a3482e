#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>

namespace wrsel::common {

// SipHash-2-4 of a single 8-byte block
uint64_t siphash_2_4(const uint8_t key[16], const uint8_t msg[8]);

// Seed = 24 bytes: SipHash key[16] + OFB initial state[8]
using DrbgSeed = std::array<uint8_t, 24>;

// Fresh seed from OpenSSL RAND_bytes. Throws std::runtime_error on failure.
DrbgSeed random_seed();

// Deterministic SipHash-2-4 OFB generator.
// Each output is SipHash(key, previous output), so identical seeds give
// identical streams. Satisfies std::uniform_random_bit_generator.
class HashDrbg {
public:
    using result_type = uint64_t;

    // Seeds from the CSPRNG
    HashDrbg();
    explicit HashDrbg(const DrbgSeed& seed);

    void seed(const DrbgSeed& seed);
    void seed(std::span<const uint8_t, 24> seed);

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()() { return next_u64(); }

    uint64_t next_u64();

    // Uniform integer in [low, high], both inclusive. Requires low <= high.
    int64_t uniform(int64_t low, int64_t high);

private:
    std::array<uint8_t, 16> key_{};
    std::array<uint8_t, 8> ofb_{};
};

}  // namespace wrsel::common

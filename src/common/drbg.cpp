#include "wrsel/common/drbg.hpp"
#include <openssl/rand.h>
#include <cstring>
#include <stdexcept>

namespace wrsel::common {

namespace {

inline uint64_t rotl64(uint64_t v, int n) {
    return (v << n) | (v >> (64 - n));
}

inline void sipround(uint64_t& v0, uint64_t& v1, uint64_t& v2, uint64_t& v3) {
    v0 += v1; v1 = rotl64(v1, 13); v1 ^= v0; v0 = rotl64(v0, 32);
    v2 += v3; v3 = rotl64(v3, 16); v3 ^= v2;
    v0 += v3; v3 = rotl64(v3, 21); v3 ^= v0;
    v2 += v1; v1 = rotl64(v1, 17); v1 ^= v2; v2 = rotl64(v2, 32);
}

inline uint64_t load_le64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline void store_le64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

}  // namespace

uint64_t siphash_2_4(const uint8_t key[16], const uint8_t msg[8]) {
    const uint64_t k0 = load_le64(key);
    const uint64_t k1 = load_le64(key + 8);

    uint64_t v0 = k0 ^ 0x736f6d6570736575ULL;
    uint64_t v1 = k1 ^ 0x646f72616e646f6dULL;
    uint64_t v2 = k0 ^ 0x6c7967656e657261ULL;
    uint64_t v3 = k1 ^ 0x7465646279746573ULL;

    // Compression: one 8-byte block
    const uint64_t m = load_le64(msg);
    v3 ^= m;
    sipround(v0, v1, v2, v3);
    sipround(v0, v1, v2, v3);
    v0 ^= m;

    // Final block carries only the message length (8) in the top byte
    const uint64_t b = static_cast<uint64_t>(8) << 56;
    v3 ^= b;
    sipround(v0, v1, v2, v3);
    sipround(v0, v1, v2, v3);
    v0 ^= b;

    v2 ^= 0xff;
    for (int i = 0; i < 4; ++i) {
        sipround(v0, v1, v2, v3);
    }

    return v0 ^ v1 ^ v2 ^ v3;
}

DrbgSeed random_seed() {
    DrbgSeed seed;
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return seed;
}

HashDrbg::HashDrbg() {
    seed(random_seed());
}

HashDrbg::HashDrbg(const DrbgSeed& seed_bytes) {
    seed(seed_bytes);
}

void HashDrbg::seed(const DrbgSeed& seed_bytes) {
    seed(std::span<const uint8_t, 24>(seed_bytes));
}

void HashDrbg::seed(std::span<const uint8_t, 24> seed_bytes) {
    std::memcpy(key_.data(), seed_bytes.data(), key_.size());
    std::memcpy(ofb_.data(), seed_bytes.data() + key_.size(), ofb_.size());
}

uint64_t HashDrbg::next_u64() {
    const uint64_t output = siphash_2_4(key_.data(), ofb_.data());
    store_le64(ofb_.data(), output);
    return output;
}

int64_t HashDrbg::uniform(int64_t low, int64_t high) {
    const uint64_t span = static_cast<uint64_t>(high) - static_cast<uint64_t>(low);
    if (span == max()) {
        return static_cast<int64_t>(next_u64());
    }

    // threshold = 2^64 mod range; the values at or above it split evenly
    const uint64_t range = span + 1;
    const uint64_t threshold = (0 - range) % range;
    uint64_t v = next_u64();
    while (v < threshold) {
        v = next_u64();
    }
    return static_cast<int64_t>(static_cast<uint64_t>(low) + v % range);
}

}  // namespace wrsel::common

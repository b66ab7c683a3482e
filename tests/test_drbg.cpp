#include <catch2/catch_test_macros.hpp>
#include "wrsel/common/drbg.hpp"
#include <limits>
#include <random>
#include <set>

using namespace wrsel::common;

static DrbgSeed counting_seed() {
    DrbgSeed seed{};
    for (int i = 0; i < 24; ++i) seed[i] = static_cast<uint8_t>(i);
    return seed;
}

TEST_CASE("SipHash-2-4 reference vector", "[drbg]") {
    // Reference implementation vector: key 00..0f, message 00..07
    uint8_t key[16];
    uint8_t msg[8];
    for (int i = 0; i < 16; ++i) key[i] = static_cast<uint8_t>(i);
    for (int i = 0; i < 8; ++i) msg[i] = static_cast<uint8_t>(i);

    REQUIRE(siphash_2_4(key, msg) == 0x93f5f5799a932462ULL);
}

TEST_CASE("HashDrbg same seed gives same stream", "[drbg]") {
    HashDrbg a(counting_seed());
    HashDrbg b(counting_seed());

    for (int i = 0; i < 100; ++i) {
        REQUIRE(a() == b());
    }
}

TEST_CASE("HashDrbg reseed restarts the stream", "[drbg]") {
    HashDrbg drbg(counting_seed());
    const uint64_t first = drbg.next_u64();
    drbg.next_u64();

    drbg.seed(counting_seed());
    REQUIRE(drbg.next_u64() == first);
}

TEST_CASE("HashDrbg different seeds diverge", "[drbg]") {
    DrbgSeed other = counting_seed();
    other[0] ^= 0xff;

    HashDrbg a(counting_seed());
    HashDrbg b(other);
    REQUIRE(a.next_u64() != b.next_u64());
}

TEST_CASE("HashDrbg consecutive outputs differ", "[drbg]") {
    HashDrbg drbg(counting_seed());
    std::set<uint64_t> seen;
    for (int i = 0; i < 64; ++i) seen.insert(drbg.next_u64());
    REQUIRE(seen.size() == 64);
}

TEST_CASE("HashDrbg uniform stays within inclusive bounds", "[drbg]") {
    HashDrbg drbg(counting_seed());

    bool saw_low = false;
    bool saw_high = false;
    for (int i = 0; i < 2000; ++i) {
        int64_t v = drbg.uniform(1, 6);
        REQUIRE(v >= 1);
        REQUIRE(v <= 6);
        saw_low |= (v == 1);
        saw_high |= (v == 6);
    }
    REQUIRE(saw_low);
    REQUIRE(saw_high);

    REQUIRE(drbg.uniform(42, 42) == 42);
    REQUIRE(drbg.uniform(0, 1) <= 1);
    int64_t negative = drbg.uniform(-10, -5);
    REQUIRE(negative >= -10);
    REQUIRE(negative <= -5);
}

TEST_CASE("HashDrbg uniform covers power-of-two and full ranges", "[drbg]") {
    HashDrbg drbg(counting_seed());

    std::set<int64_t> seen;
    for (int i = 0; i < 400; ++i) {
        int64_t v = drbg.uniform(0, 3);
        REQUIRE(v >= 0);
        REQUIRE(v <= 3);
        seen.insert(v);
    }
    REQUIRE(seen.size() == 4);

    const int64_t lo = std::numeric_limits<int64_t>::min();
    const int64_t hi = std::numeric_limits<int64_t>::max();
    std::set<int64_t> wide;
    for (int i = 0; i < 16; ++i) wide.insert(drbg.uniform(lo, hi));
    REQUIRE(wide.size() > 1);
}

TEST_CASE("HashDrbg works with standard distributions", "[drbg]") {
    static_assert(std::uniform_random_bit_generator<HashDrbg>);

    HashDrbg drbg(counting_seed());
    std::uniform_int_distribution<int> dist(0, 9);
    for (int i = 0; i < 100; ++i) {
        int v = dist(drbg);
        REQUIRE(v >= 0);
        REQUIRE(v <= 9);
    }
}

TEST_CASE("random_seed draws fresh material", "[drbg]") {
    auto a = random_seed();
    auto b = random_seed();
    REQUIRE(a != b);
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <utility>

namespace space_sampling {

// PCG random number generator (permuted congruential generator)
// Every draw in the library goes through an instance passed by reference,
// so a seed fully determines the sequence of samples.
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_(seed | 1) {
        (void)next();  // Discard for seeding
        state_ += seed;
        (void)next();  // Discard for seeding
    }

    // Generate next 32-bit random number
    [[nodiscard]] uint64_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // Generate a full 64-bit random number (two 32-bit outputs, high word first)
    [[nodiscard]] uint64_t next64() {
        uint64_t hi = next();
        uint64_t lo = next();
        return (hi << 32) | lo;
    }

    // Generate random double in [0, 1) with 53 bits of precision
    [[nodiscard]] double uniform() {
        return static_cast<double>(next64() >> 11) * 0x1.0p-53;
    }

    // Generate random double in [min, max)
    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    // Generate random integer in [min, max] (inclusive)
    [[nodiscard]] int64_t randint(int64_t min, int64_t max) {
        if (min > max) std::swap(min, max);
        uint64_t range = static_cast<uint64_t>(max) - static_cast<uint64_t>(min) + 1;
        if (range == 0) {
            // [min, max] covers all 64-bit values
            return static_cast<int64_t>(next64());
        }
        return static_cast<int64_t>(static_cast<uint64_t>(min) + bounded(range));
    }

    // Choose a random index in [0, n)
    [[nodiscard]] size_t index(size_t n) {
        return static_cast<size_t>(bounded(static_cast<uint64_t>(n)));
    }

    // Unbiased integer in [0, range), range > 0. Outputs below 2^64 mod range
    // are redrawn so every residue has the same number of preimages.
    [[nodiscard]] uint64_t bounded(uint64_t range) {
        const uint64_t threshold = (0 - range) % range;
        uint64_t r = next64();
        while (r < threshold) {
            r = next64();
        }
        return r % range;
    }

    [[nodiscard]] uint64_t state() const { return state_; }
    [[nodiscard]] uint64_t increment() const { return inc_; }

private:
    uint64_t state_;
    uint64_t inc_;
};

// Build a generator from an optional seed. Without a seed the generator is
// seeded from std::random_device and the results are not reproducible.
[[nodiscard]] inline RNG make_rng(std::optional<uint64_t> seed) {
    if (seed) {
        return RNG(*seed);
    }
    std::random_device device;
    uint64_t entropy = (static_cast<uint64_t>(device()) << 32) | device();
    return RNG(entropy);
}

}  // namespace space_sampling

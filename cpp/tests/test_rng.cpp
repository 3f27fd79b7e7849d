#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "space_sampling/random/rng.hpp"

using namespace space_sampling;
using Catch::Approx;

TEST_CASE("RNG", "[rng]") {
    SECTION("Reproducibility") {
        RNG rng1(42);
        RNG rng2(42);

        for (int i = 0; i < 100; ++i) {
            REQUIRE(rng1.next() == rng2.next());
        }
    }

    SECTION("Different seeds diverge") {
        RNG rng1(42);
        RNG rng2(43);

        bool any_different = false;
        for (int i = 0; i < 10; ++i) {
            if (rng1.next64() != rng2.next64()) any_different = true;
        }
        REQUIRE(any_different);
    }

    SECTION("Uniform distribution") {
        RNG rng(123);
        double sum = 0.0;
        int n = 10000;

        for (int i = 0; i < n; ++i) {
            double v = rng.uniform();
            REQUIRE(v >= 0.0);
            REQUIRE(v < 1.0);
            sum += v;
        }

        // Mean should be close to 0.5
        double mean = sum / n;
        REQUIRE(mean == Approx(0.5).margin(0.05));
    }

    SECTION("Uniform range") {
        RNG rng(7);
        for (int i = 0; i < 1000; ++i) {
            double v = rng.uniform(-2.0, 3.0);
            REQUIRE(v >= -2.0);
            REQUIRE(v < 3.0);
        }
    }

    SECTION("Randint covers both ends") {
        RNG rng(42);
        bool seen_low = false;
        bool seen_high = false;
        for (int i = 0; i < 1000; ++i) {
            int64_t v = rng.randint(1, 3);
            REQUIRE(v >= 1);
            REQUIRE(v <= 3);
            if (v == 1) seen_low = true;
            if (v == 3) seen_high = true;
        }
        REQUIRE(seen_low);
        REQUIRE(seen_high);
    }

    SECTION("Randint with a single value") {
        RNG rng(42);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(rng.randint(5, 5) == 5);
        }
    }

    SECTION("Bounded draws are unbiased") {
        // 2^64 mod 3 * 2^62 is 2^62: a plain modulo would map two draws onto every
        // value below 2^62 and land there half of the time instead of a third
        const uint64_t quarter = uint64_t{1} << 62;
        const uint64_t range = 3 * quarter;
        RNG rng(42);
        int below = 0;
        const int n = 4000;
        for (int i = 0; i < n; ++i) {
            uint64_t v = rng.bounded(range);
            REQUIRE(v < range);
            if (v < quarter) ++below;
        }
        REQUIRE(static_cast<double>(below) / n == Approx(1.0 / 3.0).margin(0.05));
    }

    SECTION("Randint spans the full int64 range") {
        RNG rng(7);
        int negative = 0;
        for (int i = 0; i < 1000; ++i) {
            if (rng.randint(INT64_MIN, INT64_MAX) < 0) ++negative;
        }
        REQUIRE(negative > 400);
        REQUIRE(negative < 600);
    }

    SECTION("Index stays in range") {
        RNG rng(42);
        for (int i = 0; i < 1000; ++i) {
            REQUIRE(rng.index(4) < 4);
        }
    }
}

TEST_CASE("make_rng", "[rng]") {
    SECTION("Seeded generator matches direct construction") {
        RNG a = make_rng(uint64_t{42});
        RNG b(42);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(a.next() == b.next());
        }
    }

    SECTION("Unseeded generator works") {
        RNG rng = make_rng(std::nullopt);
        double v = rng.uniform();
        REQUIRE(v >= 0.0);
        REQUIRE(v < 1.0);
    }
}

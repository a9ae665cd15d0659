// include/frontier/core/Rng.hpp
#pragma once
#include <cstdint>

namespace frontier::rng {

using Seed = std::uint64_t;

// 64-bit mixing (turns settlement ids / step counters into scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

inline Seed derive(Seed parent, std::uint64_t id) noexcept {
    return mix64(parent ^ mix64(id));
}

// PCG32 (XSH-RR). Used for immigration/emigration rolls and disaster targeting
// so that a (seed, settlement, step) triple always replays identically.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        const std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    std::uint64_t next_u64() {
        const auto hi = static_cast<std::uint64_t>(next_u32());
        const auto lo = static_cast<std::uint64_t>(next_u32());
        return (hi << 32) | lo;
    }

    // [0,1)
    double next_double01() {
        return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform on [0, bound) without modulo bias
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound == 0) return 0;
        const std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            const std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }

    // Inclusive [lo, hi]
    int next_int(int lo, int hi) {
        if (hi <= lo) return lo;
        return lo + static_cast<int>(next_bounded(static_cast<std::uint32_t>(hi - lo + 1)));
    }

    bool chance(double p) { return next_double01() < p; }
};

// Dedicated stream for one settlement/event at one step.
inline Pcg32 make_rng(Seed worldSeed, std::uint64_t ownerId, std::uint64_t step) {
    return Pcg32(derive(worldSeed, ownerId), step);
}

} // namespace frontier::rng

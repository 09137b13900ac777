/**
 * @file seed.hpp
 * @brief Seed derivation and the permutation table behind lattice noise
 *
 * All randomness in the library flows from 32-bit seeds. Composite nodes
 * (fractals, turbulence) never reuse their own seed for every child:
 * they draw child seeds from a SeedSequence constructed fresh from their
 * own seed, so child k's seed depends only on (owner seed, k).
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace finenoise {

// ============================================================================
// SeedSequence
// ============================================================================

/// Deterministic stream of sub-seeds derived from one owner seed
class SeedSequence {
public:
    explicit SeedSequence(uint32_t seed) : rng_(seed) {}

    /// Next sub-seed in the stream
    [[nodiscard]] uint32_t next() { return static_cast<uint32_t>(rng_()); }

    /// First `count` sub-seeds of the stream for `seed`
    [[nodiscard]] static std::vector<uint32_t> take(uint32_t seed, size_t count);

private:
    std::mt19937 rng_;
};

// ============================================================================
// PermutationTable
// ============================================================================

/// Seeded shuffle of 0..255 used to hash integer lattice coordinates
class PermutationTable {
public:
    static constexpr size_t SIZE = 256;

    explicit PermutationTable(uint32_t seed);

    /// Reduce lattice coordinates to one byte: each coordinate is masked to
    /// the table size and folded in with a lookup + xor.
    [[nodiscard]] uint8_t hash(std::span<const int32_t> coords) const;

    [[nodiscard]] uint8_t hash2D(int32_t x, int32_t y) const {
        return values_[values_[x & 0xFF] ^ (y & 0xFF)];
    }

    [[nodiscard]] uint8_t hash3D(int32_t x, int32_t y, int32_t z) const {
        return values_[values_[values_[x & 0xFF] ^ (y & 0xFF)] ^ (z & 0xFF)];
    }

    [[nodiscard]] uint8_t hash4D(int32_t x, int32_t y, int32_t z, int32_t w) const {
        return values_[values_[values_[values_[x & 0xFF] ^ (y & 0xFF)] ^ (z & 0xFF)] ^ (w & 0xFF)];
    }

    [[nodiscard]] uint8_t operator[](size_t i) const { return values_[i]; }

    [[nodiscard]] const std::array<uint8_t, SIZE>& values() const { return values_; }

private:
    std::array<uint8_t, SIZE> values_;
};

}  // namespace finenoise

/**
 * @file seed.cpp
 * @brief SeedSequence and PermutationTable
 */

#include "finenoise/seed.hpp"

#include <numeric>
#include <utility>

namespace finenoise {

// ============================================================================
// SeedSequence
// ============================================================================

std::vector<uint32_t> SeedSequence::take(uint32_t seed, size_t count) {
    SeedSequence sequence(seed);
    std::vector<uint32_t> seeds;
    seeds.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        seeds.push_back(sequence.next());
    }
    return seeds;
}

// ============================================================================
// PermutationTable
// ============================================================================

PermutationTable::PermutationTable(uint32_t seed) {
    std::iota(values_.begin(), values_.end(), uint8_t{0});

    // Fisher-Yates on raw mt19937 output; the distributions in <random> are
    // implementation-defined, the engine itself is not.
    std::mt19937 rng(seed);
    for (size_t i = SIZE - 1; i > 0; --i) {
        size_t j = static_cast<size_t>(rng() % static_cast<uint32_t>(i + 1));
        std::swap(values_[i], values_[j]);
    }
}

uint8_t PermutationTable::hash(std::span<const int32_t> coords) const {
    if (coords.empty()) {
        return values_[0];
    }

    size_t index = static_cast<size_t>(coords[0] & 0xFF);
    for (size_t i = 1; i < coords.size(); ++i) {
        index = values_[index] ^ static_cast<size_t>(coords[i] & 0xFF);
    }
    return values_[index];
}

}  // namespace finenoise

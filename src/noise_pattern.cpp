/**
 * @file noise_pattern.cpp
 * @brief Checkerboard and Cylinders pattern generators
 */

#include "finenoise/generators.hpp"

#include <stdexcept>
#include <string>

namespace finenoise {

Checkerboard::Checkerboard(uint32_t sizeExponent) {
    // Cell indices are signed 64-bit; bit 63 is the sign
    if (sizeExponent >= 63) {
        throw std::invalid_argument("Checkerboard: size exponent " + std::to_string(sizeExponent) +
                                    " out of range (max 62)");
    }
    size_ = uint64_t{1} << sizeExponent;
}

double Cylinders::rings(double x, double y) const {
    double center = std::sqrt(x * x + y * y) * frequency_;
    double smaller = center - std::floor(center);
    double larger = 1.0 - smaller;
    double nearest = smaller < larger ? smaller : larger;
    return 1.0 - nearest * 4.0;
}

}  // namespace finenoise

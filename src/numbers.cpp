/**
 * @file numbers.cpp
 * @brief Bitstring to number conversions.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/numbers.hpp>

#include <cstring>
#include <string>

namespace qrngkit {

namespace {

std::uint64_t to_unsigned(const Bitstring& bits, std::size_t width) {
    if (bits.size() != width) {
        throw InvalidParameterException("expected " + std::to_string(width) + " bits, got " +
                                        std::to_string(bits.size()));
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value = (value << 1) | static_cast<std::uint64_t>(bits[i]);
    }
    return value;
}

} // namespace

std::uint32_t to_uint32(const Bitstring& bits) {
    return static_cast<std::uint32_t>(to_unsigned(bits, 32));
}

std::uint64_t to_uint64(const Bitstring& bits) {
    return to_unsigned(bits, 64);
}

float to_float(const Bitstring& bits, float min_val, float max_val) {
    std::uint32_t packed = 0x3F800000U | (to_uint32(bits) >> 9);
    float unit = 0.0F;
    std::memcpy(&unit, &packed, sizeof(unit));
    unit -= 1.0F;
    return (max_val - min_val) * unit + min_val;
}

double to_double(const Bitstring& bits, double min_val, double max_val) {
    std::uint64_t packed = 0x3FF0000000000000ULL | (to_uint64(bits) >> 12);
    double unit = 0.0;
    std::memcpy(&unit, &packed, sizeof(unit));
    unit -= 1.0;
    return (max_val - min_val) * unit + min_val;
}

} // namespace qrngkit

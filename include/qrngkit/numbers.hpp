/**
 * @file numbers.hpp
 * @brief Integer and floating-point values from bitstrings.
 *
 * Floats are built by placing random bits into the mantissa of a number in
 * [1, 2) and subtracting 1, which gives a uniform value in [0, 1) without
 * division rounding bias.
 */

#ifndef QRNGKIT_NUMBERS_HPP
#define QRNGKIT_NUMBERS_HPP

#include <cstdint>

#include "bitstring.hpp"

namespace qrngkit {

/**
 * @brief Interpret exactly 32 bits as an unsigned integer, MSB first.
 * @throws InvalidParameterException if bits.size() != 32
 */
[[nodiscard]] std::uint32_t to_uint32(const Bitstring& bits);

/**
 * @brief Interpret exactly 64 bits as an unsigned integer, MSB first.
 * @throws InvalidParameterException if bits.size() != 64
 */
[[nodiscard]] std::uint64_t to_uint64(const Bitstring& bits);

/**
 * @brief Uniform float in [min_val, max_val) from 32 bits.
 *
 * Uses the top 23 bits as mantissa: 0x3F800000 | (x >> 9).
 */
[[nodiscard]] float to_float(const Bitstring& bits, float min_val = 0.0F, float max_val = 1.0F);

/**
 * @brief Uniform double in [min_val, max_val) from 64 bits.
 *
 * Uses the top 52 bits as mantissa: 0x3FF0000000000000 | (x >> 12).
 */
[[nodiscard]] double to_double(const Bitstring& bits, double min_val = 0.0, double max_val = 1.0);

} // namespace qrngkit

#endif // QRNGKIT_NUMBERS_HPP

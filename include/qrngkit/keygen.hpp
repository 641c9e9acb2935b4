/**
 * @file keygen.hpp
 * @brief Symmetric key generation from debiased bits.
 *
 * Debiased bits are hashed with SHA-256 (privacy amplification) and the
 * digest is truncated to the key length. Classical keys hash a single PRNG
 * draw the same way and serve as the baseline for comparison.
 */

#ifndef QRNGKIT_KEYGEN_HPP
#define QRNGKIT_KEYGEN_HPP

#include "bitstring.hpp"
#include "cipher.hpp"
#include "extractor.hpp"

#include <random>

namespace qrngkit {

struct KeyMaterial {
    Bytes key;               ///< Final key bytes
    Bitstring source_bits;   ///< Bits hashed into the key
    double key_entropy = 0.0; ///< Shannon entropy of the final key bits
};

/**
 * @brief SHA-256 of the packed bits, truncated to @p key_bytes.
 *
 * @throws InvalidParameterException unless key_bytes is 16, 24 or 32
 * @throws CipherException if the digest cannot be computed
 */
[[nodiscard]] Bytes derive_key(const Bitstring& bits, std::size_t key_bytes = 32);

/**
 * @brief Draw @p key_bits debiased bits and derive a key from them.
 *
 * @throws InvalidParameterException unless key_bits is 128, 192 or 256
 */
KeyMaterial generate_key(Extractor& extractor, std::size_t key_bits = 256);

/**
 * @brief Classical baseline key from one 64-bit PRNG draw.
 *
 * With @p fixed_seed the engine is first reseeded with CLASSICAL_FIXED_SEED,
 * so every call yields the same key. The engine is left advanced past the
 * draw and can go on to pick avalanche flip positions.
 *
 * @throws InvalidParameterException unless key_bits is 128, 192 or 256
 */
KeyMaterial generate_classical_key(std::mt19937_64& engine, bool fixed_seed,
                                   std::size_t key_bits = 256);

} // namespace qrngkit

#endif // QRNGKIT_KEYGEN_HPP

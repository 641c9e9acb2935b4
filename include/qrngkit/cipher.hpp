/**
 * @file cipher.hpp
 * @brief Symmetric cipher capability consumed by the avalanche analyzer.
 */

#ifndef QRNGKIT_CIPHER_HPP
#define QRNGKIT_CIPHER_HPP

#include <cstdint>
#include <vector>

namespace qrngkit {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Deterministic symmetric cipher.
 *
 * Identical (key, iv, input) must always give identical output.
 * Implementations throw QrngException subclasses on failure.
 */
class BlockCipher {
public:
    virtual ~BlockCipher() = default;

    virtual Bytes encrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) const = 0;
    virtual Bytes decrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext) const = 0;
};

} // namespace qrngkit

#endif // QRNGKIT_CIPHER_HPP

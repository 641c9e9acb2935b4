/**
 * @file aes_cbc.hpp
 * @brief AES-CBC adapter over OpenSSL EVP.
 *
 * The key length selects the variant (16, 24 or 32 bytes for AES-128, -192
 * or -256). Plaintext is PKCS#7 padded, so ciphertext is always a whole
 * number of 16-byte blocks and at least one block long.
 */

#ifndef QRNGKIT_AES_CBC_HPP
#define QRNGKIT_AES_CBC_HPP

#include "cipher.hpp"

namespace qrngkit {

inline constexpr std::size_t AES_BLOCK_BYTES = 16U;

class AesCbc : public BlockCipher {
public:
    /**
     * @throws InvalidParameterException for unsupported key or IV sizes
     * @throws CipherException if OpenSSL reports a failure
     */
    Bytes encrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) const override;

    /**
     * @throws CipherException on bad padding or any OpenSSL failure
     */
    Bytes decrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext) const override;
};

} // namespace qrngkit

#endif // QRNGKIT_AES_CBC_HPP

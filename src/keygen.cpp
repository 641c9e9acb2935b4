/**
 * @file keygen.cpp
 * @brief Key derivation with SHA-256.
 */

#include <qrngkit/error.hpp>
#include <qrngkit/keygen.hpp>
#include <qrngkit/logging.hpp>
#include <qrngkit/statistics.hpp>

#include <openssl/evp.h>

#include <string>

namespace qrngkit {

namespace {

void check_key_bits(std::size_t key_bits) {
    if (key_bits != 128 && key_bits != 192 && key_bits != 256) {
        throw InvalidParameterException("key size must be 128, 192 or 256 bits, got " +
                                        std::to_string(key_bits));
    }
}

void check_key_bytes(std::size_t key_bytes) {
    if (key_bytes != 16 && key_bytes != 24 && key_bytes != 32) {
        throw InvalidParameterException("key length must be 16, 24 or 32 bytes, got " +
                                        std::to_string(key_bytes));
    }
}

} // namespace

Bytes derive_key(const Bitstring& bits, std::size_t key_bytes) {
    check_key_bytes(key_bytes);

    Bytes packed = bits.to_bytes();
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_Digest(packed.data(), packed.size(), digest.data(), &digest_len, EVP_sha256(),
                   nullptr) != 1) {
        throw CipherException("SHA-256 digest failed");
    }

    digest.resize(key_bytes);
    return digest;
}

KeyMaterial generate_key(Extractor& extractor, std::size_t key_bits) {
    check_key_bits(key_bits);

    KeyMaterial material;
    material.source_bits = extractor.extract_fixed_length(key_bits);
    material.key = derive_key(material.source_bits, key_bits / 8U);
    material.key_entropy = shannon_entropy(Bitstring::from_bytes(material.key));

    logger().debug("generated {}-bit key, entropy {:.6f}", key_bits, material.key_entropy);
    return material;
}

KeyMaterial generate_classical_key(std::mt19937_64& engine, bool fixed_seed,
                                   std::size_t key_bits) {
    check_key_bits(key_bits);
    if (fixed_seed) {
        engine.seed(CLASSICAL_FIXED_SEED);
    }

    std::uint64_t draw = engine();
    Bytes packed(8);
    for (std::size_t i = 0; i < packed.size(); ++i) {
        packed[i] = static_cast<std::uint8_t>(draw >> (56U - 8U * i));
    }

    KeyMaterial material;
    material.source_bits = Bitstring::from_bytes(packed);
    material.key = derive_key(material.source_bits, key_bits / 8U);
    material.key_entropy = shannon_entropy(Bitstring::from_bytes(material.key));

    logger().debug("generated {}-bit classical key ({} seed), entropy {:.6f}", key_bits,
                   fixed_seed ? "fixed" : "running", material.key_entropy);
    return material;
}

} // namespace qrngkit

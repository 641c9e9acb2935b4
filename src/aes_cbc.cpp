/**
 * @file aes_cbc.cpp
 * @brief AES-CBC via OpenSSL EVP.
 */

#include <qrngkit/aes_cbc.hpp>
#include <qrngkit/error.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace qrngkit {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        EVP_CIPHER_CTX_free(ctx);
    }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const EVP_CIPHER* select_cipher(std::size_t key_bytes) {
    switch (key_bytes) {
    case 16:
        return EVP_aes_128_cbc();
    case 24:
        return EVP_aes_192_cbc();
    case 32:
        return EVP_aes_256_cbc();
    default:
        throw InvalidParameterException("AES key must be 16, 24 or 32 bytes, got " +
                                        std::to_string(key_bytes));
    }
}

void check_iv(const Bytes& iv) {
    if (iv.size() != AES_BLOCK_BYTES) {
        throw InvalidParameterException("AES-CBC IV must be 16 bytes, got " +
                                        std::to_string(iv.size()));
    }
}

[[noreturn]] void fail(const char* step) {
    unsigned long code = ERR_get_error();
    std::string detail;
    if (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        detail = std::string(": ") + buffer;
    }
    throw CipherException(std::string(step) + " failed" + detail);
}

Bytes run(const Bytes& key, const Bytes& iv, const Bytes& input, bool encrypting) {
    const EVP_CIPHER* cipher = select_cipher(key.size());
    check_iv(iv);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        fail("EVP_CIPHER_CTX_new");
    }

    int enc = encrypting ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), cipher, nullptr, key.data(), iv.data(), enc) != 1) {
        fail("EVP_CipherInit_ex");
    }

    Bytes output(input.size() + AES_BLOCK_BYTES);
    int written = 0;
    if (EVP_CipherUpdate(ctx.get(), output.data(), &written, input.data(),
                         static_cast<int>(input.size())) != 1) {
        fail("EVP_CipherUpdate");
    }
    int total = written;

    if (EVP_CipherFinal_ex(ctx.get(), output.data() + total, &written) != 1) {
        fail(encrypting ? "EVP_EncryptFinal_ex" : "EVP_DecryptFinal_ex");
    }
    total += written;

    output.resize(static_cast<std::size_t>(total));
    return output;
}

} // namespace

Bytes AesCbc::encrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) const {
    return run(key, iv, plaintext, true);
}

Bytes AesCbc::decrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext) const {
    return run(key, iv, ciphertext, false);
}

} // namespace qrngkit

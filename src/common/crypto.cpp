/*
 * LanChat - cryptographic helpers implementation
 */

#include "crypto.hpp"

#include "errors.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace lanchat {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr new_gcm_context(const std::vector<uint8_t>& key,
                             const std::vector<uint8_t>& nonce,
                             bool encrypt) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    const int enc = encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }
    return ctx;
}

} // namespace

KeyPair generate_x25519_keypair() {
    PkeyCtxPtr context(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!context) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen_init(context.get()) <= 0 ||
        EVP_PKEY_keygen(context.get(), &raw) <= 0) {
        throw std::runtime_error("EVP_PKEY_keygen failed");
    }
    PkeyPtr pkey(raw);

    KeyPair kp;
    kp.public_key.resize(kX25519KeySize);
    kp.private_key.resize(kX25519KeySize);
    std::size_t pub_len = kX25519KeySize;
    std::size_t priv_len = kX25519KeySize;
    if (EVP_PKEY_get_raw_public_key(pkey.get(), kp.public_key.data(), &pub_len) <= 0 ||
        EVP_PKEY_get_raw_private_key(pkey.get(), kp.private_key.data(), &priv_len) <= 0) {
        throw std::runtime_error("Failed to extract X25519 key material");
    }
    return kp;
}

std::vector<uint8_t> compute_x25519_shared(const std::vector<uint8_t>& private_key,
                                           const std::vector<uint8_t>& peer_public_key) {
    if (private_key.size() != kX25519KeySize || peer_public_key.size() != kX25519KeySize) {
        throw HandshakeError("X25519 keys must be 32 bytes");
    }

    PkeyPtr my_key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519,
                                                nullptr,
                                                private_key.data(),
                                                private_key.size()));
    if (!my_key) {
        throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
    }

    PkeyPtr peer_key(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519,
                                                 nullptr,
                                                 peer_public_key.data(),
                                                 peer_public_key.size()));
    if (!peer_key) {
        throw HandshakeError("Peer public share rejected");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(my_key.get(), nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new failed");
    }
    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer_key.get()) <= 0) {
        throw HandshakeError("X25519 derive init failed");
    }

    std::size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) <= 0) {
        throw std::runtime_error("EVP_PKEY_derive length query failed");
    }

    // OpenSSL refuses an all-zero result, i.e. a low-order peer share.
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
        throw HandshakeError("X25519 derivation failed");
    }
    secret.resize(secret_len);
    return secret;
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& shared_secret,
                                 const std::vector<uint8_t>& salt,
                                 const std::string& info,
                                 std::size_t length) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id(HKDF) failed");
    }

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(),
                                   shared_secret.data(),
                                   static_cast<int>(shared_secret.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("HKDF setup failed");
    }

    std::vector<uint8_t> output(length);
    if (EVP_PKEY_derive(ctx.get(), output.data(), &length) <= 0) {
        throw std::runtime_error("HKDF derive failed");
    }
    output.resize(length);
    return output;
}

namespace {
void require_gcm_inputs(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce) {
    if (key.size() != kSessionKeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
    if (nonce.size() != kGcmNonceSize) {
        throw std::invalid_argument("AES-GCM nonce must be 12 bytes");
    }
}

// Feeds aad then input through an initialised context. With decryption the
// expected tag must already be set; a false return means it did not verify.
bool gcm_pass(EVP_CIPHER_CTX* ctx,
              const std::vector<uint8_t>& aad,
              const std::vector<uint8_t>& input,
              std::vector<uint8_t>& output) {
    int chunk = 0;
    if (!aad.empty() && EVP_CipherUpdate(ctx, nullptr, &chunk, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-GCM AAD update failed");
    }
    output.resize(input.size());
    int produced = 0;
    if (!input.empty()) {
        if (EVP_CipherUpdate(ctx, output.data(), &chunk, input.data(), static_cast<int>(input.size())) != 1) {
            throw std::runtime_error("AES-GCM update failed");
        }
        produced = chunk;
    }
    unsigned char tail[16];
    if (EVP_CipherFinal_ex(ctx, tail, &chunk) != 1) {
        return false;
    }
    output.resize(static_cast<std::size_t>(produced));
    return true;
}
} // namespace

Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& nonce,
                              const std::vector<uint8_t>& plaintext,
                              const std::vector<uint8_t>& aad) {
    require_gcm_inputs(key, nonce);

    Ciphertext sealed;
    sealed.nonce = nonce;
    sealed.tag.resize(kGcmTagSize);

    auto ctx = new_gcm_context(key, nonce, true);
    if (!gcm_pass(ctx.get(), aad, plaintext, sealed.data)) {
        throw std::runtime_error("AES-GCM finalization failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kGcmTagSize, sealed.tag.data()) != 1) {
        throw std::runtime_error("AES-GCM get tag failed");
    }
    return sealed;
}

std::vector<uint8_t> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                        const Ciphertext& ciphertext,
                                        const std::vector<uint8_t>& aad) {
    if (ciphertext.nonce.size() != kGcmNonceSize || ciphertext.tag.size() != kGcmTagSize) {
        throw CryptoError("malformed AES-GCM nonce or tag");
    }
    require_gcm_inputs(key, ciphertext.nonce);

    auto ctx = new_gcm_context(key, ciphertext.nonce, false);
    std::vector<uint8_t> tag(ciphertext.tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kGcmTagSize, tag.data()) != 1) {
        throw std::runtime_error("AES-GCM set tag failed");
    }

    std::vector<uint8_t> plaintext;
    if (!gcm_pass(ctx.get(), aad, ciphertext.data, plaintext)) {
        throw CryptoError("AES-GCM authentication failed");
    }
    return plaintext;
}

} // namespace lanchat

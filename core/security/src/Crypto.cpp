#include "Crypto.h"

#include "Logger.h"
#include "MetricsCollector.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace GlobalSend {

// ============================================================================
// Sha256
// ============================================================================

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const uint8_t* data, std::size_t length) {
    if (finished_) {
        throw std::logic_error("Sha256::update after finish");
    }
    if (length > 0 && EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

Digest256 Sha256::finish() {
    if (finished_) {
        throw std::logic_error("Sha256::finish called twice");
    }
    finished_ = true;

    Digest256 out;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.bytes.data(), &len) != 1 || len != Digest256::SIZE) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return out;
}

// ============================================================================
// Crypto
// ============================================================================

Digest256 Crypto::sha256(const uint8_t* data, std::size_t length) {
    Sha256 hasher;
    hasher.update(data, length);
    return hasher.finish();
}

std::vector<uint8_t> Crypto::hkdfSha256(const std::vector<uint8_t>& ikm,
                                        const std::vector<uint8_t>& salt,
                                        const std::string& info,
                                        std::size_t outputLength) {
    if (ikm.empty()) {
        throw std::invalid_argument("HKDF input keying material is empty");
    }

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw std::runtime_error("Failed to create HKDF context");
    }

    std::vector<uint8_t> out(outputLength);
    size_t outLen = outputLength;

    bool ok = EVP_PKEY_derive_init(pctx) == 1 &&
              EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) == 1 &&
              EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) == 1 &&
              (salt.empty() ||
               EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) == 1) &&
              EVP_PKEY_CTX_add1_hkdf_info(pctx, reinterpret_cast<const unsigned char*>(info.data()),
                                          static_cast<int>(info.size())) == 1 &&
              EVP_PKEY_derive(pctx, out.data(), &outLen) == 1 &&
              outLen == outputLength;

    EVP_PKEY_CTX_free(pctx);

    if (!ok) {
        secureWipe(out);
        Logger::instance().error("HKDF derivation failed for label '" + info + "'", "Crypto");
        throw std::runtime_error("HKDF derivation failed");
    }
    return out;
}

std::vector<uint8_t> Crypto::aeadSeal(const std::vector<uint8_t>& key,
                                      const uint8_t* nonce,
                                      const std::vector<uint8_t>& aad,
                                      const uint8_t* plaintext, std::size_t plaintextLength) {
    auto& metrics = MetricsCollector::instance();

    if (key.size() != KEY_SIZE) {
        metrics.incrementEncryptionErrors();
        throw std::runtime_error("Invalid AEAD key size");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        metrics.incrementEncryptionErrors();
        throw std::runtime_error("Failed to create cipher context");
    }

    std::vector<uint8_t> out(plaintextLength + TAG_SIZE);
    int len = 0;
    int total = 0;

    bool ok = EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) == 1;

    if (ok && !aad.empty()) {
        ok = EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) == 1;
    }
    if (ok && plaintextLength > 0) {
        ok = EVP_EncryptUpdate(ctx, out.data(), &len, plaintext, static_cast<int>(plaintextLength)) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(ctx, out.data() + total, &len) == 1;
        total += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE), out.data() + total) == 1;
    }

    EVP_CIPHER_CTX_free(ctx);

    if (!ok || static_cast<std::size_t>(total) != plaintextLength) {
        metrics.incrementEncryptionErrors();
        Logger::instance().error("AEAD encryption failed", "Crypto");
        throw std::runtime_error("AEAD encryption failed");
    }
    return out;
}

std::optional<std::vector<uint8_t>> Crypto::aeadOpen(const std::vector<uint8_t>& key,
                                                     const uint8_t* nonce,
                                                     const std::vector<uint8_t>& aad,
                                                     const uint8_t* ciphertext, std::size_t ciphertextLength) {
    if (key.size() != KEY_SIZE) {
        throw std::runtime_error("Invalid AEAD key size");
    }
    if (ciphertextLength < TAG_SIZE) {
        return std::nullopt;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    const std::size_t bodyLength = ciphertextLength - TAG_SIZE;
    std::vector<uint8_t> out(bodyLength);
    int len = 0;
    int total = 0;

    bool setup = EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1 &&
                 EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) == 1 &&
                 EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) == 1;
    if (!setup) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize AEAD decryption");
    }

    bool ok = true;
    if (!aad.empty()) {
        ok = EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) == 1;
    }
    if (ok && bodyLength > 0) {
        ok = EVP_DecryptUpdate(ctx, out.data(), &len, ciphertext, static_cast<int>(bodyLength)) == 1;
        total = len;
    }
    if (ok) {
        // The tag setter takes a non-const pointer but does not write through it.
        ok = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE),
                                 const_cast<uint8_t*>(ciphertext + bodyLength)) == 1;
    }
    if (ok) {
        ok = EVP_DecryptFinal_ex(ctx, out.data() + total, &len) == 1;
        total += len;
    }

    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        secureWipe(out);
        MetricsCollector::instance().incrementAuthFailures();
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(total));
    return out;
}

std::vector<uint8_t> Crypto::randomBytes(std::size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return out;
}

bool Crypto::constantTimeCompare(const uint8_t* a, const uint8_t* b, std::size_t length) {
    return CRYPTO_memcmp(a, b, length) == 0;
}

void Crypto::secureWipe(std::vector<uint8_t>& buffer) {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
    buffer.clear();
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

std::vector<uint8_t> Crypto::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

} // namespace GlobalSend

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Digest.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace GlobalSend {

/**
 * @brief Incremental SHA-256.
 *
 * Owns its EVP context; finish() may be called once.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, std::size_t length);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
    void update(const Digest256& digest) { update(digest.bytes.data(), digest.bytes.size()); }
    void update(const std::string& text) {
        update(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    Digest256 finish();

private:
    EVP_MD_CTX* ctx_;
    bool finished_{false};
};

/**
 * @brief OpenSSL-backed primitives used by the manifest and session layers.
 *
 * All failures of the underlying library surface as std::runtime_error;
 * only AEAD authentication failure is reported through the return value.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    static Digest256 sha256(const uint8_t* data, std::size_t length);
    static Digest256 sha256(const std::vector<uint8_t>& data) { return sha256(data.data(), data.size()); }

    /**
     * @brief HKDF-SHA256 (extract + expand).
     * @param ikm Input keying material (the shared secret)
     * @param salt Optional salt; empty means HKDF's all-zero default
     * @param info Context label
     * @param outputLength Bytes to produce
     */
    static std::vector<uint8_t> hkdfSha256(const std::vector<uint8_t>& ikm,
                                           const std::vector<uint8_t>& salt,
                                           const std::string& info,
                                           std::size_t outputLength);

    /**
     * @brief ChaCha20-Poly1305 encryption.
     * @return ciphertext followed by the 16-byte tag
     * @throws std::runtime_error on bad key/nonce size or library failure
     */
    static std::vector<uint8_t> aeadSeal(const std::vector<uint8_t>& key,
                                         const uint8_t* nonce,
                                         const std::vector<uint8_t>& aad,
                                         const uint8_t* plaintext, std::size_t plaintextLength);

    /**
     * @brief ChaCha20-Poly1305 decryption of ciphertext||tag.
     * @return plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> aeadOpen(const std::vector<uint8_t>& key,
                                                        const uint8_t* nonce,
                                                        const std::vector<uint8_t>& aad,
                                                        const uint8_t* ciphertext, std::size_t ciphertextLength);

    static std::vector<uint8_t> randomBytes(std::size_t count);

    static bool constantTimeCompare(const uint8_t* a, const uint8_t* b, std::size_t length);

    /// Overwrite with zeros in a way the optimizer keeps, then clear.
    static void secureWipe(std::vector<uint8_t>& buffer);

    static std::string toHex(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> fromHex(const std::string& hex);
};

} // namespace GlobalSend

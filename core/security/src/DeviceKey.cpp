#include "DeviceKey.h"

#include "Logger.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cstring>
#include <stdexcept>

namespace GlobalSend {

DeviceKey DeviceKey::generate() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!ctx) {
        throw std::runtime_error("Failed to create X25519 context");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("X25519 key generation failed");
    }
    EVP_PKEY_CTX_free(ctx);

    DeviceKey key;
    size_t privLen = KEY_SIZE;
    size_t pubLen = KEY_SIZE;
    bool ok = EVP_PKEY_get_raw_private_key(pkey, key.privateKey_.data(), &privLen) == 1 &&
              EVP_PKEY_get_raw_public_key(pkey, key.publicKey_.data(), &pubLen) == 1 &&
              privLen == KEY_SIZE && pubLen == KEY_SIZE;
    EVP_PKEY_free(pkey);

    if (!ok) {
        throw std::runtime_error("Failed to export X25519 key pair");
    }
    return key;
}

DeviceKey DeviceKey::fromPrivateKey(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != KEY_SIZE) {
        throw std::invalid_argument("X25519 private key must be 32 bytes");
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, privateKey.data(), privateKey.size());
    if (!pkey) {
        throw std::runtime_error("Invalid X25519 private key");
    }

    DeviceKey key;
    std::memcpy(key.privateKey_.data(), privateKey.data(), KEY_SIZE);
    size_t pubLen = KEY_SIZE;
    bool ok = EVP_PKEY_get_raw_public_key(pkey, key.publicKey_.data(), &pubLen) == 1 && pubLen == KEY_SIZE;
    EVP_PKEY_free(pkey);

    if (!ok) {
        throw std::runtime_error("Failed to derive X25519 public key");
    }
    return key;
}

DeviceKey::~DeviceKey() {
    wipe();
}

DeviceKey::DeviceKey(DeviceKey&& other) noexcept
    : privateKey_(other.privateKey_), publicKey_(other.publicKey_) {
    other.wipe();
}

DeviceKey& DeviceKey::operator=(DeviceKey&& other) noexcept {
    if (this != &other) {
        privateKey_ = other.privateKey_;
        publicKey_ = other.publicKey_;
        other.wipe();
    }
    return *this;
}

void DeviceKey::wipe() {
    OPENSSL_cleanse(privateKey_.data(), privateKey_.size());
}

std::vector<uint8_t> DeviceKey::sharedSecret(const PublicKey& peerPublicKey) const {
    EVP_PKEY* priv = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, privateKey_.data(), KEY_SIZE);
    EVP_PKEY* peer = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peerPublicKey.data(), KEY_SIZE);
    if (!priv || !peer) {
        EVP_PKEY_free(priv);
        EVP_PKEY_free(peer);
        throw std::runtime_error("Failed to load X25519 keys");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(priv, nullptr);
    std::vector<uint8_t> secret(KEY_SIZE);
    size_t secretLen = secret.size();

    bool ok = ctx &&
              EVP_PKEY_derive_init(ctx) == 1 &&
              EVP_PKEY_derive_set_peer(ctx, peer) == 1 &&
              EVP_PKEY_derive(ctx, secret.data(), &secretLen) == 1 &&
              secretLen == KEY_SIZE;

    EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(priv);
    EVP_PKEY_free(peer);

    if (!ok) {
        OPENSSL_cleanse(secret.data(), secret.size());
        Logger::instance().error("X25519 key agreement failed", "DeviceKey");
        throw std::runtime_error("X25519 key agreement failed");
    }
    return secret;
}

} // namespace GlobalSend

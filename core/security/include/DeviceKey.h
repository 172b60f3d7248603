#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace GlobalSend {

/**
 * @brief X25519 key pair of a device.
 *
 * The pairing collaborator exchanges public keys and confirms them out of
 * band; sharedSecret() then yields the input for SessionCipher.
 */
class DeviceKey {
public:
    static constexpr std::size_t KEY_SIZE = 32;
    using PublicKey = std::array<uint8_t, KEY_SIZE>;

    static DeviceKey generate();
    /// Rebuild from a stored private key (the caller keeps it encrypted at rest).
    static DeviceKey fromPrivateKey(const std::vector<uint8_t>& privateKey);

    ~DeviceKey();
    DeviceKey(DeviceKey&& other) noexcept;
    DeviceKey& operator=(DeviceKey&& other) noexcept;
    DeviceKey(const DeviceKey&) = delete;
    DeviceKey& operator=(const DeviceKey&) = delete;

    const PublicKey& publicKey() const { return publicKey_; }

    /**
     * @brief ECDH with the peer's public key.
     * @throws std::runtime_error if the peer key is invalid (e.g. low order)
     */
    std::vector<uint8_t> sharedSecret(const PublicKey& peerPublicKey) const;

private:
    DeviceKey() = default;
    void wipe();

    std::array<uint8_t, KEY_SIZE> privateKey_{};
    PublicKey publicKey_{};
};

} // namespace GlobalSend

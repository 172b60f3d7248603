#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>

namespace GlobalSend {

/**
 * @brief 256-bit SHA-256 value. Used for chunk ids, file digests,
 *        manifest digests and plan digests.
 */
struct Digest256 {
    static constexpr std::size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};

    bool isZero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    std::string toHex() const {
        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(SIZE * 2);
        for (auto b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0f]);
        }
        return out;
    }

    /// First 8 bytes in hex, for log lines and temp file names.
    std::string shortHex() const {
        return toHex().substr(0, 16);
    }

    static std::optional<Digest256> fromHex(const std::string& hex) {
        if (hex.size() != SIZE * 2) {
            return std::nullopt;
        }
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        Digest256 d;
        for (std::size_t i = 0; i < SIZE; ++i) {
            int hi = nibble(hex[2 * i]);
            int lo = nibble(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            d.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return d;
    }

    static Digest256 fromBytes(const uint8_t* data) {
        Digest256 d;
        std::memcpy(d.bytes.data(), data, SIZE);
        return d;
    }

    bool operator==(const Digest256& other) const { return bytes == other.bytes; }
    bool operator!=(const Digest256& other) const { return bytes != other.bytes; }
    bool operator<(const Digest256& other) const { return bytes < other.bytes; }
};

using ChunkId = Digest256;

} // namespace GlobalSend

namespace std {
template<>
struct hash<GlobalSend::Digest256> {
    size_t operator()(const GlobalSend::Digest256& d) const noexcept {
        // Uniformly distributed already; the first word is enough.
        size_t h;
        std::memcpy(&h, d.bytes.data(), sizeof(h));
        return h;
    }
};
} // namespace std

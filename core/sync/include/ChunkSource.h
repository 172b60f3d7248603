#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "Payload.h"
#include "TransferPlan.h"

namespace GlobalSend {

/**
 * @brief Where the sender reads chunk bytes from.
 *
 * read() is called concurrently from the engine's worker pool and must be
 * safe to call from several threads at once.
 */
class IChunkSource {
public:
    virtual ~IChunkSource() = default;

    /**
     * @brief Bytes [ref.offset, ref.offset + ref.size) of ref.path.
     * @throws std::runtime_error if the range cannot be read in full
     */
    virtual std::vector<uint8_t> read(const ChunkRef& ref) const = 0;
};

/// Reads from the files of a scanned directory.
class DirectoryChunkSource : public IChunkSource {
public:
    explicit DirectoryChunkSource(std::filesystem::path root) : root_(std::move(root)) {}

    std::vector<uint8_t> read(const ChunkRef& ref) const override;

private:
    std::filesystem::path root_;
};

/// Reads from the payloads a manifest was built with by ManifestBuilder::buildForPayloads().
class PayloadChunkSource : public IChunkSource {
public:
    explicit PayloadChunkSource(const std::vector<Payload>& payloads);

    std::vector<uint8_t> read(const ChunkRef& ref) const override;

private:
    std::map<std::string, Payload> byPath_;
};

/// pread() the exact range or throw.
std::vector<uint8_t> readFileRange(const std::filesystem::path& path, uint64_t offset, uint64_t size);

} // namespace GlobalSend

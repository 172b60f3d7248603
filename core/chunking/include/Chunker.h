#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

#include "Result.h"

namespace GlobalSend {

class Config;

/**
 * @brief Chunk size bounds. Boundaries land between minSize and maxSize;
 *        the mean chunk size lies between (minSize + targetSize) / 2 and
 *        targetSize.
 */
struct ChunkerParams {
    size_t minSize;
    size_t targetSize;
    size_t maxSize;

    static ChunkerParams defaults();

    /**
     * @brief Read chunk.min_size / chunk.target_size / chunk.max_size.
     */
    static Result<ChunkerParams> fromConfig(const Config& config);

    /// 64 <= min < target <= max
    VoidResult validate() const;

    bool operator==(const ChunkerParams& other) const {
        return minSize == other.minSize && targetSize == other.targetSize && maxSize == other.maxSize;
    }
};

/**
 * @brief A chunk's bytes and where they sit in the stream.
 */
struct ChunkRange {
    uint64_t offset{0};
    std::vector<uint8_t> data;
};

/**
 * @brief Content-defined chunker using a gear rolling hash.
 *
 * The hash is h = (h << 1) + GEAR[byte] over 64 bits, so its value at any
 * position depends only on the preceding 64 bytes. A boundary is declared
 * after byte i when the top `bits` bits of h are zero and the chunk is at
 * least minSize long; maxSize forces a cut. The hash restarts at every chunk
 * start, so boundaries never depend on absolute stream position.
 */
class Chunker {
public:
    /**
     * @throws std::invalid_argument if params do not validate
     */
    explicit Chunker(const ChunkerParams& params);

    const ChunkerParams& params() const { return params_; }
    uint64_t mask() const { return mask_; }

    /**
     * @brief Length of the chunk starting at data[0].
     * @param endOfStream true if no bytes follow data[length - 1]
     * @return chunk length, or 0 if more input is needed to decide
     */
    size_t findBoundary(const uint8_t* data, size_t length, bool endOfStream) const;

    /// Convenience for in-memory buffers: (offset, length) of every chunk.
    std::vector<std::pair<uint64_t, size_t>> split(const uint8_t* data, size_t length) const;

private:
    ChunkerParams params_;
    uint64_t mask_;
};

/**
 * @brief Lazy chunk sequence over an input stream.
 *
 * Holds at most maxSize plus one read block in memory. restart() seeks the
 * stream back to an earlier boundary (or 0) and continues from there; the
 * chunks that follow are identical to the first pass.
 */
class ChunkStream {
public:
    ChunkStream(const Chunker& chunker, std::istream& input, uint64_t startOffset = 0);

    /**
     * @return false once the stream is exhausted
     * @throws std::runtime_error on read failure
     */
    bool next(ChunkRange& out);

    void restart(uint64_t offset);

    uint64_t position() const { return offset_; }

private:
    void fill();

    const Chunker& chunker_;
    std::istream& input_;
    std::vector<uint8_t> buffer_;
    size_t begin_{0};
    uint64_t offset_{0};
    bool eof_{false};
};

} // namespace GlobalSend

#include "Chunker.h"

#include "Config.h"
#include "Constants.h"

#include <array>
#include <stdexcept>

namespace GlobalSend {

namespace {

// splitmix64; fixed seed so every build and every peer shares the table.
constexpr std::array<uint64_t, 256> makeGearTable() {
    std::array<uint64_t, 256> table{};
    uint64_t state = 0x676c6f62616c7364ULL;
    for (size_t i = 0; i < table.size(); ++i) {
        state += 0x9E3779B97F4A7C15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        table[i] = z ^ (z >> 31);
    }
    return table;
}

constexpr std::array<uint64_t, 256> GEAR = makeGearTable();

int floorLog2(size_t value) {
    int bits = 0;
    while (value > 1) {
        value >>= 1;
        ++bits;
    }
    return bits;
}

} // namespace

// ============================================================================
// ChunkerParams
// ============================================================================

ChunkerParams ChunkerParams::defaults() {
    return ChunkerParams{config::DEFAULT_MIN_CHUNK_SIZE, config::DEFAULT_TARGET_CHUNK_SIZE,
                         config::DEFAULT_MAX_CHUNK_SIZE};
}

Result<ChunkerParams> ChunkerParams::fromConfig(const Config& cfg) {
    ChunkerParams params{
        cfg.getSize(config::keys::CHUNK_MIN_SIZE, config::DEFAULT_MIN_CHUNK_SIZE),
        cfg.getSize(config::keys::CHUNK_TARGET_SIZE, config::DEFAULT_TARGET_CHUNK_SIZE),
        cfg.getSize(config::keys::CHUNK_MAX_SIZE, config::DEFAULT_MAX_CHUNK_SIZE)};

    auto valid = params.validate();
    if (valid.isError()) {
        return valid.error();
    }
    return params;
}

VoidResult ChunkerParams::validate() const {
    if (minSize < config::GEAR_WINDOW_SIZE) {
        return Error("chunk min size must be at least " + std::to_string(config::GEAR_WINDOW_SIZE),
                     ErrorCode::INVALID_CONFIGURATION, "Chunker");
    }
    if (minSize >= targetSize) {
        return Error("chunk min size must be below target size", ErrorCode::INVALID_CONFIGURATION, "Chunker");
    }
    if (targetSize > maxSize) {
        return Error("chunk target size must not exceed max size", ErrorCode::INVALID_CONFIGURATION, "Chunker");
    }
    if (maxSize > config::MAX_FRAME_SIZE / 2) {
        return Error("chunk max size too large for a frame", ErrorCode::INVALID_CONFIGURATION, "Chunker");
    }
    return Ok();
}

// ============================================================================
// Chunker
// ============================================================================

Chunker::Chunker(const ChunkerParams& params) : params_(params), mask_(0) {
    auto valid = params_.validate();
    if (valid.isError()) {
        throw std::invalid_argument(valid.error().toString());
    }

    // Past minSize a cut is expected every 2^bits bytes.
    int bits = floorLog2(params_.targetSize - params_.minSize);
    if (bits < 1) {
        bits = 1;
    }
    mask_ = ~uint64_t(0) << (64 - bits);
}

size_t Chunker::findBoundary(const uint8_t* data, size_t length, bool endOfStream) const {
    if (length == 0) {
        return 0;
    }
    if (!endOfStream && length < params_.maxSize) {
        // A boundary found now could still move: only decide with maxSize bytes in view.
        return 0;
    }

    const size_t limit = length < params_.maxSize ? length : params_.maxSize;
    if (limit <= params_.minSize) {
        return limit;
    }

    uint64_t hash = 0;
    for (size_t i = params_.minSize - config::GEAR_WINDOW_SIZE; i < limit; ++i) {
        hash = (hash << 1) + GEAR[data[i]];
        if (i + 1 >= params_.minSize && (hash & mask_) == 0) {
            return i + 1;
        }
    }
    return limit;
}

std::vector<std::pair<uint64_t, size_t>> Chunker::split(const uint8_t* data, size_t length) const {
    std::vector<std::pair<uint64_t, size_t>> ranges;
    size_t pos = 0;
    while (pos < length) {
        size_t cut = findBoundary(data + pos, length - pos, true);
        ranges.emplace_back(pos, cut);
        pos += cut;
    }
    return ranges;
}

// ============================================================================
// ChunkStream
// ============================================================================

ChunkStream::ChunkStream(const Chunker& chunker, std::istream& input, uint64_t startOffset)
    : chunker_(chunker), input_(input) {
    restart(startOffset);
}

void ChunkStream::restart(uint64_t offset) {
    input_.clear();
    input_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!input_) {
        throw std::runtime_error("Cannot seek chunk stream to offset " + std::to_string(offset));
    }
    buffer_.clear();
    begin_ = 0;
    offset_ = offset;
    eof_ = false;
}

void ChunkStream::fill() {
    const size_t want = chunker_.params().maxSize;

    if (begin_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(begin_));
        begin_ = 0;
    }

    while (!eof_ && buffer_.size() < want) {
        size_t old = buffer_.size();
        buffer_.resize(old + config::SCAN_READ_SIZE);
        input_.read(reinterpret_cast<char*>(buffer_.data() + old), static_cast<std::streamsize>(config::SCAN_READ_SIZE));
        size_t got = static_cast<size_t>(input_.gcount());
        buffer_.resize(old + got);

        if (input_.eof()) {
            eof_ = true;
        } else if (!input_) {
            throw std::runtime_error("Read error while chunking at offset " + std::to_string(offset_ + old));
        }
    }
}

bool ChunkStream::next(ChunkRange& out) {
    if (buffer_.size() - begin_ < chunker_.params().maxSize && !eof_) {
        fill();
    }

    const size_t available = buffer_.size() - begin_;
    if (available == 0) {
        return false;
    }

    size_t cut = chunker_.findBoundary(buffer_.data() + begin_, available, eof_);
    if (cut == 0) {
        // fill() stops short of maxSize only at end of stream.
        throw std::logic_error("Chunk boundary undecidable after fill");
    }

    out.offset = offset_;
    out.data.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(begin_),
                    buffer_.begin() + static_cast<std::ptrdiff_t>(begin_ + cut));
    begin_ += cut;
    offset_ += cut;
    return true;
}

} // namespace GlobalSend

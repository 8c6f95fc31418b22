#pragma once

#include <algorithm>
#include <cstdint>
#include <utility>

#include "ByteView.hpp"

namespace cfd::io {

/**
 * @brief The chunk currently being drained and how far into it we are
 *
 * Shared bookkeeping of the chunk feed readers. Starts drained, holding an
 * empty chunk.
 */
template<typename ChunkT>
class ChunkCursor {
    static_assert(is_byte_chunk_v<ChunkT>,
                  "ChunkT needs a ByteView specialization and a default (empty) value");

public:
    // Copies as much of the rest of the chunk as fits, returns the count
    size_t drain_into(nonstd::span<uint8_t> dst) {
        nonstd::span<const uint8_t> chunk = bytes_of(chunk_);

        size_t count = std::min(dst.size(), chunk.size() - offset_);
        std::copy_n(chunk.begin() + offset_, count, dst.begin());
        offset_ += count;

        return count;
    }

    bool drained() const {
        return offset_ == bytes_of(chunk_).size();
    }

    // Drops the chunk. Must precede the producer call, so an unwinding
    // producer leaves nothing to replay.
    void release() {
        chunk_ = ChunkT {};
        offset_ = 0;
    }

    void load(ChunkT&& chunk) {
        chunk_ = std::move(chunk);
        offset_ = 0;
    }

private:
    ChunkT chunk_ {};
    size_t offset_ = 0;
};

} // namespace cfd::io

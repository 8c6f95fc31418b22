#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include "ChunkCursor.hpp"
#include "Reader.hpp"

namespace cfd::io {

/**
 * @brief Reader pulling its bytes from a producer, one chunk at a time
 *
 * The producer is a no-argument callable returning std::optional<ChunkT>.
 * std::nullopt ends the stream: the producer is never called again and every
 * later read() returns an empty span. Empty chunks are valid and skipped.
 *
 * Only the chunk being drained is kept; the producer is called exactly when
 * that chunk runs out and the caller's buffer still has room.
 *
 * Not thread safe. Wrap it in a GuardedReader for shared access.
 */
template<typename ProducerFn, typename ChunkT>
class ChunkFeedReader: public Reader {
    static_assert(std::is_invocable_r_v<std::optional<ChunkT>, ProducerFn&>,
                  "Producer must be callable with no arguments and return std::optional<ChunkT>");

public:
    explicit ChunkFeedReader(ProducerFn producer) : producer_(std::move(producer)) {}

    nonstd::span<uint8_t> read(nonstd::span<uint8_t> buf) override {
        size_t written = 0;

        while (!finished_ && written < buf.size()) {
            written += cursor_.drain_into(buf.subspan(written));

            if (cursor_.drained()) {
                pull();
            }
        }

        bytes_read_ += written;
        return buf.first(written);
    }

    bool finished() const {
        return finished_;
    }

    // Total bytes returned by read(). Bytes copied by a call that threw are
    // not counted.
    uint64_t bytes_read() const {
        return bytes_read_;
    }

    // Number of producer calls that returned a chunk, empty ones included
    uint64_t chunks_pulled() const {
        return chunks_pulled_;
    }

private:
    void pull() {
        cursor_.release();

        std::optional<ChunkT> next = producer_();
        if (next) {
            cursor_.load(std::move(*next));
            ++chunks_pulled_;
        } else {
            finished_ = true;
        }
    }

    ProducerFn producer_;
    ChunkCursor<ChunkT> cursor_;
    bool finished_ = false;

    uint64_t bytes_read_ = 0;
    uint64_t chunks_pulled_ = 0;
};

// Deduction guide: ChunkT is the value type of the producer's optional
template<typename ProducerFn>
ChunkFeedReader(ProducerFn)
    -> ChunkFeedReader<ProducerFn, typename std::invoke_result_t<ProducerFn&>::value_type>;

template<typename ProducerFn>
auto make_chunk_feed_reader(ProducerFn&& producer) {
    using FnT = std::decay_t<ProducerFn>;
    using ChunkT = typename std::invoke_result_t<FnT&>::value_type;

    return ChunkFeedReader<FnT, ChunkT>(std::forward<ProducerFn>(producer));
}

} // namespace cfd::io

#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include "ChunkCursor.hpp"
#include "TryReader.hpp"

namespace cfd::io {

/**
 * @brief ChunkFeedReader for producers that can fail
 *
 * The producer returns Expected<std::optional<ChunkT>, ET>: a chunk, the end
 * of the stream, or an error.
 *
 * An error is never mixed with data. If the producer fails after some bytes
 * were already copied by the current call, those bytes are returned and the
 * error is reported by the next call instead, without calling the producer.
 * Once reported, the reader is usable again: the following call asks the
 * producer for a chunk as usual. No retry happens inside a single call.
 */
template<typename ProducerFn, typename ChunkT>
class FallibleChunkFeedReader: public TryReader {
public:
    explicit FallibleChunkFeedReader(ProducerFn producer) : producer_(std::move(producer)) {}

    AnyExpected<nonstd::span<uint8_t>> try_read(nonstd::span<uint8_t> buf) override {
        if (pending_) {
            AnyError err = std::move(*pending_);
            pending_.reset();
            return nonstd::make_unexpected(std::move(err));
        }

        size_t written = 0;

        while (!finished_ && written < buf.size()) {
            written += cursor_.drain_into(buf.subspan(written));

            if (!cursor_.drained()) {
                continue;
            }

            cursor_.release();

            auto next = producer_();
            if (!next.has_value()) {
                AnyError err = std::move(next).error();
                if (written == 0) {
                    return nonstd::make_unexpected(std::move(err));
                }

                pending_ = std::move(err);
                break;
            }

            if (*next) {
                cursor_.load(std::move(**next));
                ++chunks_pulled_;
            } else {
                finished_ = true;
            }
        }

        bytes_read_ += written;
        return buf.first(written);
    }

    bool finished() const {
        return finished_;
    }

    // An error is waiting to be reported by the next try_read()
    bool has_pending_error() const {
        return pending_.has_value();
    }

    uint64_t bytes_read() const {
        return bytes_read_;
    }

    uint64_t chunks_pulled() const {
        return chunks_pulled_;
    }

private:
    ProducerFn producer_;
    ChunkCursor<ChunkT> cursor_;
    bool finished_ = false;

    std::optional<AnyError> pending_;

    uint64_t bytes_read_ = 0;
    uint64_t chunks_pulled_ = 0;
};

// Deduction guide: ChunkT is the value type of the optional inside the
// producer's Expected
template<typename ProducerFn>
FallibleChunkFeedReader(ProducerFn) -> FallibleChunkFeedReader<
    ProducerFn,
    typename std::invoke_result_t<ProducerFn&>::value_type::value_type>;

} // namespace cfd::io

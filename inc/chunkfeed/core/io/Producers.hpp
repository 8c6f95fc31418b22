#pragma once

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>

#include "ByteView.hpp"
#include "chunkfeed/core/types/NonZero.hpp"

namespace cfd::io {

/**
 * @brief Interface form of a producer, for sources that are easier to write
 * as a class with state than as a closure
 */
template<typename ChunkT>
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // std::nullopt once the source is exhausted
    virtual std::optional<ChunkT> next() = 0;
};

// Producer calling into a source owned by the caller
template<typename ChunkT>
auto source_fn(ChunkSource<ChunkT>& source) {
    return [&source]() -> std::optional<ChunkT> { return source.next(); };
}

// Producer owning its source
template<typename ChunkT>
auto source_fn(std::unique_ptr<ChunkSource<ChunkT>> source) {
    return [source = std::move(source)]() -> std::optional<ChunkT> { return source->next(); };
}

/**
 * @brief Producer yielding a view of every element of a container of chunks,
 * in order
 *
 * Nothing is copied: the container must outlive the producer and must not be
 * modified while it is in use.
 */
template<typename Container>
auto chunks_of(const Container& chunks) {
    using ElemT = std::decay_t<decltype(*std::begin(chunks))>;
    static_assert(is_byte_chunk_v<ElemT>, "Container elements need a ByteView specialization");

    return [it = std::begin(chunks),
            end = std::end(chunks)]() mutable -> std::optional<nonstd::span<const uint8_t>> {
        if (it == end) {
            return std::nullopt;
        }
        return bytes_of<ElemT>(*it++);
    };
}

// The producer would outlive a temporary container
template<typename Container>
auto chunks_of(const Container&& chunks) = delete;

/**
 * @brief Producer cutting data into consecutive slices of slice_size bytes.
 * The last slice may be shorter. Empty data yields no slice at all.
 */
inline auto slices_of(nonstd::span<const uint8_t> data, NonZero<size_t> slice_size) {
    return [data, size = slice_size.v]() mutable -> std::optional<nonstd::span<const uint8_t>> {
        if (data.empty()) {
            return std::nullopt;
        }

        size_t n = std::min(size, data.size());
        nonstd::span<const uint8_t> slice = data.first(n);
        data = data.subspan(n);

        return slice;
    };
}

} // namespace cfd::io

#pragma once

#include <cstdint>
#include <nonstd/span.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cfd::io {

/**
 * @brief Contiguous byte view over a chunk value
 *
 * Specialize for every type a producer may hand out. bytes() must not copy
 * and the view stays valid as long as the chunk is neither modified nor
 * destroyed. A default-constructed chunk must view as empty.
 */
template <typename ChunkT>
struct ByteView;

template <>
struct ByteView<std::vector<uint8_t>> {
    static nonstd::span<const uint8_t> bytes(const std::vector<uint8_t>& chunk) {
        return {chunk.data(), chunk.size()};
    }
};

template <>
struct ByteView<std::vector<char>> {
    static nonstd::span<const uint8_t> bytes(const std::vector<char>& chunk) {
        return {reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size()};
    }
};

template <>
struct ByteView<std::string> {
    static nonstd::span<const uint8_t> bytes(const std::string& chunk) {
        return {reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size()};
    }
};

template <>
struct ByteView<std::string_view> {
    static nonstd::span<const uint8_t> bytes(std::string_view chunk) {
        return {reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size()};
    }
};

template <>
struct ByteView<nonstd::span<const uint8_t>> {
    static nonstd::span<const uint8_t> bytes(nonstd::span<const uint8_t> chunk) {
        return chunk;
    }
};

template <typename ChunkT, typename = void>
struct is_byte_chunk : std::false_type {};

template <typename ChunkT>
struct is_byte_chunk<
    ChunkT,
    std::void_t<decltype(ByteView<ChunkT>::bytes(std::declval<const ChunkT&>()))>>
    : std::is_default_constructible<ChunkT> {};

template <typename ChunkT>
inline constexpr bool is_byte_chunk_v = is_byte_chunk<ChunkT>::value;

template <typename ChunkT>
nonstd::span<const uint8_t> bytes_of(const ChunkT& chunk) {
    return ByteView<ChunkT>::bytes(chunk);
}

} // namespace cfd::io

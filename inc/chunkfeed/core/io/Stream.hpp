#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Reader.hpp"
#include "TryReader.hpp"
#include "Writer.hpp"
#include "chunkfeed/core/errors/Error.hpp"
#include "chunkfeed/core/types/NonZero.hpp"

namespace cfd::io {

static constexpr size_t DefaultCopyBufSize = 8 * 1024;

/**
 * @brief Moves every byte of reader into writer
 *
 * @return Number of bytes copied
 */
uint64_t copy(Reader& reader, Writer& writer, NonZero<size_t> buf_size = DefaultCopyBufSize);

/**
 * @brief Same as copy(), stopping at the first failed read
 *
 * Bytes read before the failure have already been written.
 */
AnyExpected<uint64_t>
try_copy(TryReader& reader, Writer& writer, NonZero<size_t> buf_size = DefaultCopyBufSize);

std::vector<uint8_t> read_to_end(Reader& reader);

struct ReadExactShortfall {
    size_t wanted;
    size_t got;
};

// Fills buf completely, or fails with ErrorCode::UnexpectedEof
Expected<void, ReadExactShortfall> read_exact(Reader& reader, nonstd::span<uint8_t> buf);

} // namespace cfd::io

template <>
struct cfd::ErrorDataToString<cfd::io::ReadExactShortfall> {
    static std::string data_string(const cfd::io::ReadExactShortfall& data);
};

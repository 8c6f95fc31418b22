#pragma once

#include <cstdint>
#include <nonstd/span.hpp>

#include "chunkfeed/core/errors/Error.hpp"

namespace cfd::io {

/**
 * @brief Sequential byte source whose reads can fail
 *
 * Same contract as Reader::read when successful. A failed read copied
 * nothing into buf.
 */
class TryReader {
public:
    TryReader() = default;

    virtual ~TryReader() = default;

    virtual AnyExpected<nonstd::span<uint8_t>> try_read(nonstd::span<uint8_t> buf) = 0;
};

} // namespace cfd::io

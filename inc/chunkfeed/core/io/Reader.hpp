#pragma once

#include <cstdint>
#include <nonstd/span.hpp>

namespace cfd::io {

/**
 * @brief Sequential byte source
 *
 * read() fills a prefix of buf and returns it. An empty result for a
 * non-empty buf means end of stream.
 */
class Reader {
public:
    Reader() = default;

    virtual ~Reader() = default;

    virtual nonstd::span<uint8_t> read(nonstd::span<uint8_t> buf) = 0;
};

} // namespace cfd::io

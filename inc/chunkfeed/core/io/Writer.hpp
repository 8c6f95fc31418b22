#pragma once

#include <cstdint>
#include <nonstd/span.hpp>

namespace cfd::io {
class Writer {
public:
    virtual ~Writer() = default;

    virtual void write(nonstd::span<const uint8_t> data) = 0;
};

} // namespace cfd::io

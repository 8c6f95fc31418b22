#pragma once

#include <cstdio>

#include "Writer.hpp"

namespace cfd::io {

/**
 * @brief Writes to a stdio stream it does not own
 *
 * Throws std::system_error when the stream accepts fewer bytes than given.
 */
class FileWriter: public Writer {
public:
    explicit FileWriter(std::FILE* file) : file_(file) {}

    void write(nonstd::span<const uint8_t> data) override;

    void flush();

private:
    std::FILE* file_;
};

} // namespace cfd::io

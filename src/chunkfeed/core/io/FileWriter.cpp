#include "chunkfeed/core/io/FileWriter.hpp"

#include <cerrno>
#include <system_error>

namespace cfd::io {

void FileWriter::write(nonstd::span<const uint8_t> data) {
    if (data.empty()) {
        return;
    }

    size_t n = std::fwrite(data.data(), 1, data.size(), file_);
    if (n != data.size()) {
        throw std::system_error(errno, std::generic_category(), "FileWriter: short write");
    }
}

void FileWriter::flush() {
    if (std::fflush(file_) != 0) {
        throw std::system_error(errno, std::generic_category(), "FileWriter: flush failed");
    }
}

} // namespace cfd::io

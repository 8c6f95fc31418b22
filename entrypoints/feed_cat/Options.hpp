#pragma once

#include <string>
#include <vector>

#include "chunkfeed/core/errors/Error.hpp"
#include "chunkfeed/core/io/Stream.hpp"

namespace cfd::feed_cat {

struct Options {
    bool newline    = false;
    size_t buf_size = io::DefaultCopyBufSize;
    std::vector<std::string> words;
};

// Fails with ErrorCode::InvalidArgument on a bad option
Expected<Options, std::string> parse_args(int argc, const char* const argv[]);

// Positive decimal number, no sign, nothing after the digits
Expected<size_t, std::string> parse_size(const std::string& text);

} // namespace cfd::feed_cat

#include "Options.hpp"

#include <fmt/format.h>

#include <cctype>
#include <exception>
#include <string_view>

#include "chunkfeed/core/errors/Try.hpp"

namespace cfd::feed_cat {

Expected<size_t, std::string> parse_size(const std::string& text) {
    // stoull would take a sign (wrapping "-1" around) and leading blanks
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return make_error(ErrorCode::InvalidArgument, fmt::format("'{}' is not a number", text));
    }

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::InvalidArgument, fmt::format("'{}': {}", text, e.what()));
    }

    if (pos != text.size()) {
        return make_error(ErrorCode::InvalidArgument, fmt::format("'{}' has trailing characters", text));
    }
    if (value == 0) {
        return make_error(ErrorCode::InvalidArgument, "buffer size must be greater than zero");
    }

    return static_cast<size_t>(value);
}

Expected<Options, std::string> parse_args(int argc, const char* const argv[]) {
    Options opts {};

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-n") {
            opts.newline = true;
        } else if (arg == "-b") {
            if (i + 1 >= argc) {
                return make_error(ErrorCode::InvalidArgument, "missing value for -b");
            }
            opts.buf_size = TRY(parse_size(argv[++i]));
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                opts.words.emplace_back(argv[i]);
            }
        } else {
            opts.words.emplace_back(arg);
        }
    }

    return opts;
}

} // namespace cfd::feed_cat

#include <fmt/core.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "chunkfeed/core/io/ChunkFeedReader.hpp"
#include "chunkfeed/core/io/FileWriter.hpp"
#include "chunkfeed/core/io/Stream.hpp"
#include "Options.hpp"

using namespace cfd;

namespace {

void usage(const char* argv0) {
    fmt::print(stderr, "usage: {} [-n] [-b <bytes>] [word...]\n", argv0);
    fmt::print(stderr, "  -n          append a newline to every word\n");
    fmt::print(stderr, "  -b <bytes>  read buffer size (default {})\n", io::DefaultCopyBufSize);
    fmt::print(stderr, "With no words, stdin is streamed line by line.\n");
}

} // namespace

int main(int argc, char* argv[]) {
    Expected<feed_cat::Options, std::string> opts = feed_cat::parse_args(argc, argv);
    if (!opts) {
        fmt::print(stderr, "feed_cat: {}\n", opts.error().message());
        usage(argv[0]);
        return 1;
    }

    io::FileWriter out {stdout};
    uint64_t total = 0;

    try {
        if (!opts->words.empty()) {
            size_t pos = 0;
            io::ChunkFeedReader reader {[&]() -> std::optional<std::string> {
                if (pos == opts->words.size()) {
                    return std::nullopt;
                }

                std::string chunk = opts->words[pos++];
                if (opts->newline) {
                    chunk += '\n';
                }
                return chunk;
            }};

            total = io::copy(reader, out, opts->buf_size);
        } else {
            io::ChunkFeedReader reader {[]() -> std::optional<std::string> {
                std::string line;
                if (!std::getline(std::cin, line)) {
                    return std::nullopt;
                }
                return line + '\n';
            }};

            total = io::copy(reader, out, opts->buf_size);
        }

        out.flush();
    } catch (const std::exception& e) {
        fmt::print(stderr, "feed_cat: {}\n", e.what());
        return 1;
    }

    fmt::print(stderr, "feed_cat: {} bytes\n", total);
    return 0;
}

#include "chunkfeed/core/io/Stream.hpp"

#include <fmt/format.h>

#include "chunkfeed/core/errors/Try.hpp"
#include "chunkfeed/core/io/VecWriter.hpp"

namespace cfd::io {

uint64_t copy(Reader& reader, Writer& writer, NonZero<size_t> buf_size) {
    std::vector<uint8_t> buf(buf_size.v);
    uint64_t total = 0;

    while (true) {
        nonstd::span<uint8_t> bytes = reader.read(buf);
        if (bytes.empty()) {
            break;
        }

        writer.write(bytes);
        total += bytes.size();
    }

    return total;
}

AnyExpected<uint64_t> try_copy(TryReader& reader, Writer& writer, NonZero<size_t> buf_size) {
    std::vector<uint8_t> buf(buf_size.v);
    uint64_t total = 0;

    while (true) {
        nonstd::span<uint8_t> bytes = TRY(reader.try_read(buf));
        if (bytes.empty()) {
            break;
        }

        writer.write(bytes);
        total += bytes.size();
    }

    return total;
}

std::vector<uint8_t> read_to_end(Reader& reader) {
    std::vector<uint8_t> out;
    VecWriter writer {out};

    copy(reader, writer);

    return out;
}

Expected<void, ReadExactShortfall> read_exact(Reader& reader, nonstd::span<uint8_t> buf) {
    size_t got = 0;

    while (got < buf.size()) {
        nonstd::span<uint8_t> bytes = reader.read(buf.subspan(got));
        if (bytes.empty()) {
            return make_error(
                ErrorCode::UnexpectedEof,
                ReadExactShortfall {.wanted = buf.size(), .got = got}
            );
        }

        got += bytes.size();
    }

    return {};
}

} // namespace cfd::io

std::string cfd::ErrorDataToString<cfd::io::ReadExactShortfall>::data_string(
    const cfd::io::ReadExactShortfall& data
) {
    return fmt::format("wanted {} bytes, stream ended after {}", data.wanted, data.got);
}

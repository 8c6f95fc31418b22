#include <lest/lest.hpp>

#define CASE(name) lest_CASE(specification(), name)
extern lest::tests& specification();

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "TestUtils.hpp"
#include "chunkfeed/core/io/ChunkFeedReader.hpp"
#include "chunkfeed/core/io/Stream.hpp"
#include "chunkfeed/core/io/VecWriter.hpp"

using namespace cfd;
using cfd::test::as_string;
using cfd::test::ListProducer;

namespace {

// Drains the reader with reads of buf_size bytes
std::string drain(io::Reader& reader, size_t buf_size)
{
    std::vector<uint8_t> buf(buf_size);
    std::string out;

    while (true) {
        nonstd::span<uint8_t> bytes = reader.read(buf);
        if (bytes.empty()) {
            break;
        }
        out += as_string(bytes);
    }

    return out;
}

}  // namespace

CASE(
    "Borrowed string views are concatenated in order"
    "[ChunkFeedReader]")
{
    const std::array<std::string_view, 3> many_strings = {"one", "two", "three"};
    size_t pos = 0;

    io::ChunkFeedReader reader {[&]() -> std::optional<std::string_view> {
        if (pos == many_strings.size()) {
            return std::nullopt;
        }
        return many_strings[pos++];
    }};

    std::vector<uint8_t> output;
    io::VecWriter writer {output};
    uint64_t n = io::copy(reader, writer);

    EXPECT(n == 11);
    EXPECT(as_string(output) == "onetwothree");
}

CASE(
    "Owned strings are concatenated in order"
    "[ChunkFeedReader]")
{
    const std::array<std::string_view, 3> many_strings = {"one", "two", "three"};
    size_t pos = 0;

    io::ChunkFeedReader reader {[&]() -> std::optional<std::string> {
        if (pos == many_strings.size()) {
            return std::nullopt;
        }
        return std::string(many_strings[pos++]) + "\n";
    }};

    EXPECT(as_string(io::read_to_end(reader)) == "one\ntwo\nthree\n");
}

CASE(
    "Empty chunk does not end the stream"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"", "x"}, calls}};

    EXPECT(drain(reader, 64) == "x");
    EXPECT(calls == 3u);
    EXPECT(reader.chunks_pulled() == 2u);
}

CASE(
    "Small buffer splits a chunk across reads"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"abcde"}, calls}};

    std::array<uint8_t, 2> buf {};

    nonstd::span<uint8_t> r1 = reader.read(buf);
    EXPECT(r1.size() == 2u);
    EXPECT(as_string(r1) == "ab");

    nonstd::span<uint8_t> r2 = reader.read(buf);
    EXPECT(r2.size() == 2u);
    EXPECT(as_string(r2) == "cd");

    nonstd::span<uint8_t> r3 = reader.read(buf);
    EXPECT(r3.size() == 1u);
    EXPECT(as_string(r3) == "e");

    EXPECT(reader.read(buf).size() == 0u);
    EXPECT(reader.finished());
}

CASE(
    "Returned span is a prefix of the destination"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"abc"}, calls}};

    std::array<uint8_t, 8> buf {};
    nonstd::span<uint8_t> bytes = reader.read(buf);

    EXPECT((bytes.data() == buf.data()));
    EXPECT(bytes.size() == 3u);
}

CASE(
    "Zero-sized read has no side effect"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"abc"}, calls}};

    nonstd::span<uint8_t> empty {};

    EXPECT(reader.read(empty).size() == 0u);
    EXPECT(calls == 0u);
    EXPECT_NOT(reader.finished());

    // The stream is still intact afterwards
    EXPECT(drain(reader, 16) == "abc");

    // And stays side effect free once exhausted
    size_t calls_at_end = calls;
    EXPECT(reader.read(empty).size() == 0u);
    EXPECT(calls == calls_at_end);
}

CASE(
    "Exhaustion is permanent"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"ab", "c"}, calls}};

    EXPECT(drain(reader, 4) == "abc");
    EXPECT(reader.finished());
    EXPECT(calls == 3u);

    std::array<uint8_t, 4> buf {};
    for (int i = 0; i < 5; ++i) {
        EXPECT(reader.read(buf).size() == 0u);
    }

    EXPECT(calls == 3u);
}

CASE(
    "Producer is called only once the current chunk is drained"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"abc", "def"}, calls}};

    std::array<uint8_t, 1> one {};
    std::array<uint8_t, 2> two {};

    // Initial empty chunk counts as drained
    EXPECT(as_string(reader.read(one)) == "a");
    EXPECT(calls == 1u);

    // Draining "abc" exactly pulls "def" before returning
    EXPECT(as_string(reader.read(two)) == "bc");
    EXPECT(calls == 2u);

    EXPECT(as_string(reader.read(two)) == "de");
    EXPECT(calls == 2u);

    // Draining the last chunk pulls the end of stream
    EXPECT(as_string(reader.read(two)) == "f");
    EXPECT(calls == 3u);
    EXPECT(reader.finished());
}

CASE(
    "Output does not depend on the buffer size"
    "[ChunkFeedReader]")
{
    const std::vector<std::string> chunks = {"lorem", "", "ipsum", "d", "", "", "olor sit", "amet", ""};

    std::string expected;
    for (const std::string& c : chunks) {
        expected += c;
    }

    for (size_t buf_size = 1; buf_size <= expected.size() + 3; ++buf_size) {
        size_t calls = 0;
        io::ChunkFeedReader reader {ListProducer<> {chunks, calls}};

        EXPECT(drain(reader, buf_size) == expected);
        EXPECT(calls == chunks.size() + 1);
        EXPECT(reader.bytes_read() == expected.size());
    }
}

CASE(
    "Runs of empty chunks are skipped within a single read"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"", "", "", "", "ab", "", "", "cd"}, calls}};

    std::array<uint8_t, 16> buf {};
    nonstd::span<uint8_t> bytes = reader.read(buf);

    EXPECT(as_string(bytes) == "abcd");
    EXPECT(calls == 9u);
    EXPECT(reader.finished());
}

CASE(
    "A producer ending immediately yields an empty stream"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{}, calls}};

    std::array<uint8_t, 4> buf {};
    EXPECT(reader.read(buf).size() == 0u);
    EXPECT(calls == 1u);
    EXPECT(reader.finished());
    EXPECT(reader.chunks_pulled() == 0u);
}

CASE(
    "Only empty chunks yield an empty stream"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    io::ChunkFeedReader reader {ListProducer<> {{"", "", ""}, calls}};

    EXPECT(io::read_to_end(reader).empty());
    EXPECT(calls == 4u);
}

CASE(
    "Byte vector chunks"
    "[ChunkFeedReader]")
{
    int n = 0;
    io::ChunkFeedReader reader {[&n]() -> std::optional<std::vector<uint8_t>> {
        if (n == 3) {
            return std::nullopt;
        }
        ++n;
        return std::vector<uint8_t>(static_cast<size_t>(n), static_cast<uint8_t>(n));
    }};

    std::vector<uint8_t> expected = {1, 2, 2, 3, 3, 3};
    EXPECT(io::read_to_end(reader) == expected);
}

CASE(
    "Char vector chunks"
    "[ChunkFeedReader]")
{
    bool done = false;
    auto reader = io::make_chunk_feed_reader([&done]() -> std::optional<std::vector<char>> {
        if (done) {
            return std::nullopt;
        }
        done = true;
        return std::vector<char> {'h', 'i'};
    });

    EXPECT(as_string(io::read_to_end(reader)) == "hi");
}

CASE(
    "Producer exceptions propagate without replaying bytes"
    "[ChunkFeedReader]")
{
    int call = 0;
    io::ChunkFeedReader reader {[&call]() -> std::optional<std::string> {
        ++call;
        switch (call) {
            case 1:
                return std::string("abc");
            case 2:
                throw std::runtime_error("source went away");
            case 3:
                return std::string("def");
            default:
                return std::nullopt;
        }
    }};

    std::array<uint8_t, 8> buf {};
    EXPECT_THROWS_AS(reader.read(buf), std::runtime_error);
    EXPECT_NOT(reader.finished());

    // "abc" was copied by the call that threw, the caller never got it
    EXPECT(reader.bytes_read() == 0u);

    EXPECT(as_string(reader.read(buf)) == "def");
    EXPECT(reader.read(buf).size() == 0u);
    EXPECT(call == 4);
    EXPECT(reader.bytes_read() == 3u);
}

CASE(
    "Reader is usable through the base interface"
    "[ChunkFeedReader]")
{
    size_t calls = 0;
    auto reader = io::make_chunk_feed_reader(ListProducer<> {{"x", "y", "z"}, calls});

    io::Reader& base = reader;
    EXPECT(drain(base, 2) == "xyz");
    EXPECT(reader.bytes_read() == 3u);
    EXPECT(reader.chunks_pulled() == 3u);
}

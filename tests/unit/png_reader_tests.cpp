#include <doctest/doctest.h>
#include <cardkit/png.hpp>

#include "test_helpers.hpp"

using namespace cardkit;
using namespace cardkit::test;

TEST_CASE("read_chunks walks a well-formed PNG") {
    auto png = make_png();
    auto result = read_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.saw_iend);
    REQUIRE(result.chunks.size() == 3);
    CHECK(result.chunks[0].type == "IHDR");
    CHECK(result.chunks[0].length == 13);
    CHECK(result.chunks[0].offset == 8);
    CHECK(result.chunks[1].type == "IDAT");
    CHECK(result.chunks[2].type == "IEND");
    CHECK(result.chunks[2].length == 0);
    CHECK(result.chunks[2].crc == 0xAE426082u);
}

TEST_CASE("read_chunks rejects a bad signature") {
    auto png = make_png();
    png[1] = 'X';
    auto result = read_chunks(png);
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);

    auto short_buffer = read_chunks({0x89, 0x50, 0x4E});
    CHECK_FALSE(short_buffer.ok);
    CHECK(short_buffer.error == ContainerError::MalformedContainer);
}

TEST_CASE("read_chunks rejects a chunk length that overruns the buffer") {
    auto png = signature();
    append_be32(png, 1000);
    png.insert(png.end(), {'t', 'E', 'X', 't'});
    png.insert(png.end(), 10, 'a');

    auto result = read_chunks(png);
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);
    CHECK(result.message.find("overruns") != std::string::npos);
}

TEST_CASE("read_chunks rejects a truncated chunk header") {
    auto png = make_png_body();
    png.insert(png.end(), {0, 0, 0});

    auto result = read_chunks(png);
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);
}

TEST_CASE("read_chunks rejects lengths above 2^31-1") {
    auto png = signature();
    append_be32(png, 0x80000000u);
    png.insert(png.end(), {'I', 'D', 'A', 'T'});
    png.insert(png.end(), 4, 0);

    auto result = read_chunks(png);
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);
}

TEST_CASE("read_chunks ignores bytes after IEND") {
    auto png = make_png();
    png.insert(png.end(), {'g', 'a', 'r', 'b', 'a', 'g', 'e'});

    auto result = read_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.saw_iend);
    CHECK(result.chunks.size() == 3);
}

TEST_CASE("read_chunks accepts a stream without IEND that ends on a chunk boundary") {
    auto png = make_png_body();
    auto result = read_chunks(png);
    REQUIRE(result.ok);
    CHECK_FALSE(result.saw_iend);
    CHECK(result.chunks.size() == 2);
}

TEST_CASE("read_text_chunks collects keyword and text") {
    auto png = make_png_with_text("chara", "{\"name\":\"Alice\"}");
    auto result = read_text_chunks(png);
    REQUIRE(result.ok);
    REQUIRE(result.text.count("chara") == 1);
    CHECK(result.text.at("chara") == "{\"name\":\"Alice\"}");
}

TEST_CASE("read_text_chunks keeps the later chunk for a repeated keyword") {
    auto png = make_png_body();
    append_chunk(png, "tEXt", text_payload("chara", "first"));
    append_chunk(png, "tEXt", text_payload("chara", "second"));
    append_chunk(png, "IEND", {});

    auto result = read_text_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.text.at("chara") == "second");
}

TEST_CASE("read_text_chunks skips tEXt chunks with no separator") {
    auto png = make_png_body();
    append_chunk(png, "tEXt", bytes_of("noseparator"));
    append_chunk(png, "tEXt", text_payload("Comment", "hello"));
    append_chunk(png, "IEND", {});

    auto result = read_text_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.text.size() == 1);
    CHECK(result.text.at("Comment") == "hello");
}

TEST_CASE("read_text_chunks decodes Latin-1 keywords") {
    auto png = make_png_with_text(std::string("caf\xE9"), "x");
    auto result = read_text_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.text.count("caf\xC3\xA9") == 1);
}

TEST_CASE("read_chunks copies payloads of tEXt chunks only") {
    auto result = read_chunks(make_png_with_text("Comment", "hi"));
    REQUIRE(result.ok);
    REQUIRE(result.chunks.size() == 4);
    CHECK(result.chunks[0].data.empty());   // IHDR
    CHECK(result.chunks[1].data.empty());   // IDAT
    CHECK(result.chunks[1].length == 10);
    CHECK(result.chunks[2].data == text_payload("Comment", "hi"));
}

TEST_CASE("read_text_chunks replaces ill-formed UTF-8 in text") {
    auto png = make_png_with_text("Comment", "Ren\xE9" "e \xF0\x9F\x8C\x99 ok");
    auto result = read_text_chunks(png);
    REQUIRE(result.ok);
    CHECK(result.text.at("Comment") == "Ren\xEF\xBF\xBD" "e \xF0\x9F\x8C\x99 ok");
}

TEST_CASE("read_text_chunks propagates container errors") {
    auto png = make_png_with_text("chara", "payload");
    png.resize(png.size() - 20);  // cut into the tEXt chunk

    auto result = read_text_chunks(png);
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);
}

TEST_CASE("validate_png_size enforces limits") {
    PngSizeLimits limits;  // 4MB max, 2MB warn

    auto small = validate_png_size(100 * 1024, limits);
    CHECK(small.valid);
    CHECK(small.warnings.empty());

    auto large = validate_png_size(3 * 1024 * 1024, limits);
    CHECK(large.valid);
    REQUIRE(large.warnings.size() == 1);
    CHECK(large.warnings[0].find("is large") != std::string::npos);

    auto too_big = validate_png_size(5 * 1024 * 1024, limits);
    CHECK_FALSE(too_big.valid);
    REQUIRE(too_big.warnings.size() == 1);
    CHECK(too_big.warnings[0] == "PNG size (5.00MB) exceeds maximum (4MB)");
}

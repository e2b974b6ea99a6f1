#include <doctest/doctest.h>
#include <cardkit/crc32.hpp>
#include <cardkit/png.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace cardkit;
using namespace cardkit::test;

TEST_CASE("build_text_chunk frames keyword and text with a valid CRC") {
    auto chunk = build_text_chunk("chara", "abc");
    REQUIRE(chunk.size() == 12 + 9);

    CHECK(chunk[0] == 0);
    CHECK(chunk[3] == 9);
    CHECK(std::string(chunk.begin() + 4, chunk.begin() + 8) == "tEXt");
    CHECK(chunk[13] == 0);  // keyword separator

    std::vector<uint8_t> covered(chunk.begin() + 4, chunk.end() - 4);
    uint32_t crc = crc32(covered);
    CHECK(chunk[chunk.size() - 4] == ((crc >> 24) & 0xFF));
    CHECK(chunk[chunk.size() - 1] == (crc & 0xFF));
}

TEST_CASE("embed_text_chunk inserts immediately before IEND and leaves the rest intact") {
    auto png = make_png();
    size_t iend = png.size() - 12;

    auto result = embed_text_chunk(png, "chara", "hello");
    REQUIRE(result.ok);

    auto chunk = build_text_chunk("chara", "hello");
    REQUIRE(result.png.size() == png.size() + chunk.size());

    CHECK(std::equal(png.begin(), png.begin() + static_cast<std::ptrdiff_t>(iend), result.png.begin()));
    CHECK(std::equal(chunk.begin(), chunk.end(), result.png.begin() + static_cast<std::ptrdiff_t>(iend)));
    CHECK(std::equal(png.begin() + static_cast<std::ptrdiff_t>(iend), png.end(),
                     result.png.end() - 12));

    auto chunks = read_chunks(result.png);
    REQUIRE(chunks.ok);
    REQUIRE(chunks.chunks.size() == 4);
    CHECK(chunks.chunks[2].type == "tEXt");
    CHECK(chunks.chunks[3].type == "IEND");
}

TEST_CASE("embed_text_chunk keeps trailing bytes after IEND") {
    auto png = make_png();
    png.insert(png.end(), {'x', 'y'});

    auto result = embed_text_chunk(png, "chara", "t");
    REQUIRE(result.ok);
    CHECK(result.png[result.png.size() - 2] == 'x');
    CHECK(result.png[result.png.size() - 1] == 'y');
}

TEST_CASE("embed_text_chunk fails without IEND") {
    auto png = make_png_body();
    auto result = embed_text_chunk(png, "chara", "hello");
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MissingTerminalChunk);
    CHECK(result.png.empty());
}

TEST_CASE("embed_text_chunk fails on a bad signature") {
    auto png = make_png();
    png[0] = 0;
    auto result = embed_text_chunk(png, "chara", "hello");
    CHECK_FALSE(result.ok);
    CHECK(result.error == ContainerError::MalformedContainer);
}

TEST_CASE("find_iend_offset locates the terminal chunk") {
    auto png = make_png();
    size_t offset = 0;
    REQUIRE(find_iend_offset(png, offset));
    CHECK(offset == png.size() - 12);

    size_t unused = 0;
    CHECK_FALSE(find_iend_offset(make_png_body(), unused));
}

TEST_CASE("remove_text_chunks drops only the named keywords") {
    auto png = make_png_body();
    append_chunk(png, "tEXt", text_payload("chara", "old card"));
    append_chunk(png, "tEXt", text_payload("Comment", "keep me"));
    append_chunk(png, "tEXt", text_payload("ccv3", "old v3"));
    append_chunk(png, "IEND", {});

    auto result = remove_text_chunks(png, {"chara", "ccv3"});
    REQUIRE(result.ok);

    auto text = read_text_chunks(result.png);
    REQUIRE(text.ok);
    CHECK(text.text.size() == 1);
    CHECK(text.text.count("Comment") == 1);

    auto chunks = read_chunks(result.png);
    REQUIRE(chunks.ok);
    CHECK(chunks.saw_iend);
}

TEST_CASE("remove_text_chunks is a no-op when nothing matches") {
    auto png = make_png_with_text("Comment", "x");
    auto result = remove_text_chunks(png, {"chara"});
    REQUIRE(result.ok);
    CHECK(result.png == png);
}

TEST_CASE("replace_text_chunks swaps named keywords for a new chunk before IEND") {
    auto png = make_png_body();
    append_chunk(png, "tEXt", text_payload("chara", "old card"));
    append_chunk(png, "tEXt", text_payload("Comment", "keep me"));
    append_chunk(png, "IEND", {});
    png.push_back(0x42);  // trailing byte after IEND

    auto result = replace_text_chunks(png, {"chara", "ccv3"}, "ccv3", "new card");
    REQUIRE(result.ok);
    CHECK(result.png.back() == 0x42);

    auto chunks = read_chunks(result.png);
    REQUIRE(chunks.ok);
    REQUIRE(chunks.chunks.size() == 6);
    CHECK(chunks.chunks[2].type == "tEXt");
    CHECK(chunks.chunks[4].type == "tEXt");
    CHECK(chunks.chunks[5].type == "IEND");

    auto text = read_text_chunks(result.png);
    REQUIRE(text.ok);
    CHECK(text.text.count("chara") == 0);
    CHECK(text.text.at("Comment") == "keep me");
    CHECK(text.text.at("ccv3") == "new card");
}

TEST_CASE("replace_text_chunks requires a terminated chunk stream") {
    auto missing_iend = replace_text_chunks(make_png_body(), {"chara"}, "chara", "{}");
    CHECK_FALSE(missing_iend.ok);
    CHECK(missing_iend.error == ContainerError::MissingTerminalChunk);

    auto bad_signature = replace_text_chunks(bytes_of("not a png at all"), {"chara"}, "chara", "{}");
    CHECK_FALSE(bad_signature.ok);
    CHECK(bad_signature.error == ContainerError::MalformedContainer);
}

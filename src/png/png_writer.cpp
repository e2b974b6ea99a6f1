#include "cardkit/png.hpp"
#include "cardkit/crc32.hpp"
#include "cardkit/encoding.hpp"

#include <algorithm>
#include <cstring>

#include <spdlog/spdlog.h>

namespace cardkit {

namespace {

const uint8_t TEXT_CHUNK_TYPE[4] = {'t', 'E', 'X', 't'};

void write_be32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

bool has_png_signature(const std::vector<uint8_t>& buffer) {
    return buffer.size() >= PNG_SIGNATURE_SIZE &&
           std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), buffer.begin());
}

// Append png[0, end) to out, leaving out tEXt chunks whose keyword is listed.
// Returns the number of chunks left out.
size_t copy_without_keywords(const std::vector<uint8_t>& png,
                             const std::vector<PngChunk>& chunks,
                             const std::vector<std::string>& keywords,
                             size_t end,
                             std::vector<uint8_t>& out) {
    size_t copied_to = 0;
    size_t removed = 0;

    for (const auto& chunk : chunks) {
        if (chunk.offset >= end) break;
        if (chunk.type != "tEXt") continue;

        std::string keyword;
        std::string text;
        if (!parse_text_chunk(chunk.data, keyword, text)) continue;
        if (std::find(keywords.begin(), keywords.end(), keyword) == keywords.end()) continue;

        out.insert(out.end(),
                   png.begin() + static_cast<std::ptrdiff_t>(copied_to),
                   png.begin() + static_cast<std::ptrdiff_t>(chunk.offset));
        copied_to = chunk.offset + PNG_CHUNK_FRAMING + chunk.length;
        ++removed;
    }

    out.insert(out.end(),
               png.begin() + static_cast<std::ptrdiff_t>(copied_to),
               png.begin() + static_cast<std::ptrdiff_t>(end));
    return removed;
}

} // namespace

std::vector<uint8_t> build_text_chunk(const std::string& keyword, const std::string& text) {
    std::vector<uint8_t> data;
    std::string latin1_keyword = utf8_to_latin1(keyword);
    data.reserve(latin1_keyword.size() + 1 + text.size());
    data.insert(data.end(), latin1_keyword.begin(), latin1_keyword.end());
    data.push_back(0);
    data.insert(data.end(), text.begin(), text.end());

    uint32_t crc = crc32_update(crc32_init(), TEXT_CHUNK_TYPE, sizeof(TEXT_CHUNK_TYPE));
    crc = crc32_final(crc32_update(crc, data.data(), data.size()));

    std::vector<uint8_t> chunk;
    chunk.reserve(PNG_CHUNK_FRAMING + data.size());
    write_be32(chunk, static_cast<uint32_t>(data.size()));
    chunk.insert(chunk.end(), std::begin(TEXT_CHUNK_TYPE), std::end(TEXT_CHUNK_TYPE));
    chunk.insert(chunk.end(), data.begin(), data.end());
    write_be32(chunk, crc);
    return chunk;
}

bool find_iend_offset(const std::vector<uint8_t>& buffer, size_t& offset) {
    if (buffer.size() < PNG_SIGNATURE_SIZE + PNG_CHUNK_FRAMING) {
        return false;
    }

    // IEND is the terminal chunk, so the scan starts at the last position a
    // complete empty chunk could begin.
    for (size_t pos = buffer.size() - PNG_CHUNK_FRAMING;; --pos) {
        if (std::memcmp(buffer.data() + pos + 4, "IEND", 4) == 0) {
            offset = pos;
            return true;
        }
        if (pos == PNG_SIGNATURE_SIZE) break;
    }
    return false;
}

EmbedResult embed_text_chunk(const std::vector<uint8_t>& png,
                             const std::string& keyword,
                             const std::string& text) {
    EmbedResult result;

    if (!has_png_signature(png)) {
        result.error = ContainerError::MalformedContainer;
        result.message = "invalid PNG signature";
        spdlog::error("cannot embed '{}': {}", keyword, result.message);
        return result;
    }

    size_t iend = 0;
    if (!find_iend_offset(png, iend)) {
        result.error = ContainerError::MissingTerminalChunk;
        result.message = "IEND chunk not found";
        spdlog::error("cannot embed '{}': {}", keyword, result.message);
        return result;
    }

    auto chunk = build_text_chunk(keyword, text);

    result.png.reserve(png.size() + chunk.size());
    result.png.insert(result.png.end(), png.begin(), png.begin() + static_cast<std::ptrdiff_t>(iend));
    result.png.insert(result.png.end(), chunk.begin(), chunk.end());
    result.png.insert(result.png.end(), png.begin() + static_cast<std::ptrdiff_t>(iend), png.end());

    spdlog::debug("embedded tEXt '{}' ({} bytes) at offset {}", keyword, chunk.size(), iend);
    result.ok = true;
    return result;
}

EmbedResult remove_text_chunks(const std::vector<uint8_t>& png,
                               const std::vector<std::string>& keywords) {
    EmbedResult result;

    auto read = read_chunks(png);
    if (!read.ok) {
        result.error = read.error;
        result.message = read.message;
        return result;
    }

    result.png.reserve(png.size());
    size_t removed = copy_without_keywords(png, read.chunks, keywords, png.size(), result.png);

    if (removed > 0) {
        spdlog::debug("removed {} existing tEXt chunk(s)", removed);
    }
    result.ok = true;
    return result;
}

EmbedResult replace_text_chunks(const std::vector<uint8_t>& png,
                                const std::vector<std::string>& remove_keywords,
                                const std::string& keyword,
                                const std::string& text) {
    EmbedResult result;

    auto read = read_chunks(png);
    if (!read.ok) {
        result.error = read.error;
        result.message = read.message;
        spdlog::error("cannot embed '{}': {}", keyword, result.message);
        return result;
    }
    if (!read.saw_iend) {
        result.error = ContainerError::MissingTerminalChunk;
        result.message = "IEND chunk not found";
        spdlog::error("cannot embed '{}': {}", keyword, result.message);
        return result;
    }

    size_t iend = read.chunks.back().offset;
    auto chunk = build_text_chunk(keyword, text);

    result.png.reserve(png.size() + chunk.size());
    size_t removed = copy_without_keywords(png, read.chunks, remove_keywords, iend, result.png);
    result.png.insert(result.png.end(), chunk.begin(), chunk.end());
    result.png.insert(result.png.end(), png.begin() + static_cast<std::ptrdiff_t>(iend), png.end());

    spdlog::debug("embedded tEXt '{}' ({} bytes) at offset {}, replacing {} chunk(s)",
                  keyword, chunk.size(), iend, removed);
    result.ok = true;
    return result;
}

} // namespace cardkit

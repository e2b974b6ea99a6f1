#include "cardkit/png.hpp"
#include "cardkit/encoding.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace cardkit {

namespace {

// PNG caps chunk lengths at 2^31 - 1
constexpr uint32_t MAX_CHUNK_LENGTH = 0x7FFFFFFFu;

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

bool has_png_signature(const std::vector<uint8_t>& buffer) {
    return buffer.size() >= PNG_SIGNATURE_SIZE &&
           std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), buffer.begin());
}

} // namespace

const char* container_error_name(ContainerError error) {
    switch (error) {
        case ContainerError::None: return "none";
        case ContainerError::MalformedContainer: return "malformed_container";
        case ContainerError::MissingTerminalChunk: return "missing_terminal_chunk";
    }
    return "unknown";
}

ChunkReadResult read_chunks(const std::vector<uint8_t>& buffer) {
    ChunkReadResult result;

    if (!has_png_signature(buffer)) {
        result.error = ContainerError::MalformedContainer;
        result.message = "invalid PNG signature";
        return result;
    }

    size_t offset = PNG_SIGNATURE_SIZE;
    const size_t size = buffer.size();

    while (offset < size) {
        size_t remaining = size - offset;
        if (remaining < 8) {
            result.error = ContainerError::MalformedContainer;
            result.message = "truncated chunk header at offset " + std::to_string(offset);
            return result;
        }

        uint32_t length = read_be32(buffer.data() + offset);
        std::string type(reinterpret_cast<const char*>(buffer.data() + offset + 4), 4);

        if (length > MAX_CHUNK_LENGTH ||
            static_cast<uint64_t>(length) + PNG_CHUNK_FRAMING > remaining) {
            result.error = ContainerError::MalformedContainer;
            result.message = "chunk '" + type + "' at offset " + std::to_string(offset) +
                             " overruns buffer (length " + std::to_string(length) + ")";
            return result;
        }

        PngChunk chunk;
        chunk.type = type;
        chunk.length = length;
        chunk.offset = offset;
        const uint8_t* data_start = buffer.data() + offset + 8;
        if (type == "tEXt") {
            chunk.data.assign(data_start, data_start + length);
        }
        chunk.crc = read_be32(data_start + length);
        result.chunks.push_back(std::move(chunk));

        offset += PNG_CHUNK_FRAMING + length;

        if (type == "IEND") {
            result.saw_iend = true;
            if (offset < size) {
                spdlog::debug("ignoring {} trailing bytes after IEND", size - offset);
            }
            break;
        }
    }

    spdlog::debug("read {} PNG chunks ({} bytes)", result.chunks.size(), size);
    result.ok = true;
    return result;
}

bool parse_text_chunk(const std::vector<uint8_t>& data, std::string& keyword, std::string& text) {
    auto nul = std::find(data.begin(), data.end(), static_cast<uint8_t>(0));
    if (nul == data.end()) {
        return false;
    }
    keyword = latin1_to_utf8(std::string(data.begin(), nul));
    text.assign(nul + 1, data.end());
    return true;
}

TextChunkResult read_text_chunks(const std::vector<uint8_t>& buffer) {
    TextChunkResult result;

    auto chunks = read_chunks(buffer);
    if (!chunks.ok) {
        result.error = chunks.error;
        result.message = chunks.message;
        return result;
    }

    for (const auto& chunk : chunks.chunks) {
        if (chunk.type != "tEXt") continue;

        std::string keyword;
        std::string text;
        if (!parse_text_chunk(chunk.data, keyword, text)) {
            spdlog::debug("skipping tEXt chunk without keyword separator at offset {}", chunk.offset);
            continue;
        }
        result.text[keyword] = utf8_decode_lossy(text);
    }

    result.ok = true;
    return result;
}

PngSizeCheck validate_png_size(size_t size_bytes, const PngSizeLimits& limits) {
    PngSizeCheck check;
    double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);

    if (size_mb > limits.max_mb) {
        check.valid = false;
        check.warnings.push_back(
            fmt::format("PNG size ({:.2f}MB) exceeds maximum ({:g}MB)", size_mb, limits.max_mb));
        return check;
    }

    if (size_mb > limits.warn_mb) {
        check.warnings.push_back(
            fmt::format("PNG size ({:.2f}MB) is large (recommended: <{:g}MB)", size_mb, limits.warn_mb));
    }

    return check;
}

} // namespace cardkit

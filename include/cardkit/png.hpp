#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace cardkit {

// ============================================================================
// PNG container layout
// ============================================================================

constexpr std::array<uint8_t, 8> PNG_SIGNATURE = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr size_t PNG_SIGNATURE_SIZE = 8;

// length(4) + type(4) + crc(4)
constexpr size_t PNG_CHUNK_FRAMING = 12;

enum class ContainerError {
    None,
    MalformedContainer,     // bad signature, truncated framing, chunk overrun
    MissingTerminalChunk,   // no IEND (fatal for injection only)
};

const char* container_error_name(ContainerError error);

struct PngChunk {
    std::string type;           // 4 ASCII bytes, e.g. "IHDR"
    uint32_t length = 0;        // Declared data length
    std::vector<uint8_t> data;  // Copied for tEXt only; other payloads stay in the container
    uint32_t crc = 0;           // Stored CRC, not re-validated on read
    size_t offset = 0;          // Offset of the length field in the container
};

// keyword -> text; a repeated keyword keeps the later chunk's text
using TextChunkMap = std::unordered_map<std::string, std::string>;

// ============================================================================
// Chunk Reader
// ============================================================================

struct ChunkReadResult {
    bool ok = false;
    ContainerError error = ContainerError::None;
    std::string message;
    std::vector<PngChunk> chunks;   // In file order, IEND included when present
    bool saw_iend = false;
};

// Walk the chunk stream. Stops after IEND; trailing bytes are ignored.
// Running out of buffer exactly on a chunk boundary ends the stream without
// error (saw_iend stays false).
ChunkReadResult read_chunks(const std::vector<uint8_t>& buffer);

struct TextChunkResult {
    bool ok = false;
    ContainerError error = ContainerError::None;
    std::string message;
    TextChunkMap text;
};

// Collect tEXt chunks. Keyword is Latin-1 (returned as UTF-8). Text is decoded
// as UTF-8 with ill-formed bytes replaced by U+FFFD.
TextChunkResult read_text_chunks(const std::vector<uint8_t>& buffer);

// Split a tEXt payload at the first NUL. Returns false when there is no NUL.
bool parse_text_chunk(const std::vector<uint8_t>& data, std::string& keyword, std::string& text);

// ============================================================================
// Chunk Injector
// ============================================================================

struct EmbedResult {
    bool ok = false;
    ContainerError error = ContainerError::None;
    std::string message;
    std::vector<uint8_t> png;
};

// Serialize a complete tEXt chunk (length, type, data, crc)
std::vector<uint8_t> build_text_chunk(const std::string& keyword, const std::string& text);

// Locate the start of the IEND chunk by scanning backward from the end.
// Returns false when no IEND tag is found at or after offset 8.
bool find_iend_offset(const std::vector<uint8_t>& buffer, size_t& offset);

// Insert a tEXt chunk immediately before IEND. The input is not modified.
EmbedResult embed_text_chunk(const std::vector<uint8_t>& png,
                             const std::string& keyword,
                             const std::string& text);

// Copy of the container without the tEXt chunks whose keyword is listed.
// Every other chunk is kept byte-for-byte.
EmbedResult remove_text_chunks(const std::vector<uint8_t>& png,
                               const std::vector<std::string>& keywords);

// remove_text_chunks followed by an insert before IEND, building the output
// in a single copy. Needs a readable chunk stream that ends in IEND.
EmbedResult replace_text_chunks(const std::vector<uint8_t>& png,
                                const std::vector<std::string>& remove_keywords,
                                const std::string& keyword,
                                const std::string& text);

// ============================================================================
// Size limits
// ============================================================================

struct PngSizeLimits {
    double max_mb = 4.0;
    double warn_mb = 2.0;
};

struct PngSizeCheck {
    bool valid = true;
    std::vector<std::string> warnings;
};

PngSizeCheck validate_png_size(size_t size_bytes, const PngSizeLimits& limits);

} // namespace cardkit

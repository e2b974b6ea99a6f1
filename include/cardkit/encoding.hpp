#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// Base64 (RFC 4648, standard alphabet)
// ============================================================================

// Decode base64 text. ASCII whitespace is ignored and missing trailing
// padding is tolerated. Returns std::nullopt on any other invalid input.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);

// ============================================================================
// Latin-1 <-> UTF-8
// ============================================================================

// Each byte becomes the code point of the same value
std::string latin1_to_utf8(const std::string& latin1);

// Code points above U+00FF (and malformed sequences) become '?'
std::string utf8_to_latin1(const std::string& utf8);

// ============================================================================
// UTF-8 decoding
// ============================================================================

// Well-formed UTF-8 is returned unchanged. Each maximal ill-formed
// subsequence (stray continuation bytes, truncated sequences, overlongs,
// surrogates, code points above U+10FFFF) becomes U+FFFD.
std::string utf8_decode_lossy(const std::string& bytes);

// ============================================================================
// SHA-256
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);

} // namespace cardkit

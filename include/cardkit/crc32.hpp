#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// CRC-32 (IEEE 802.3, reflected, poly 0xEDB88320)
// ============================================================================

// Continue a running CRC. Start with crc32_init(), finish with crc32_final().
// Splitting the input across several calls yields the same value as one call.
constexpr uint32_t crc32_init() { return 0xFFFFFFFFu; }
constexpr uint32_t crc32_final(uint32_t crc) { return crc ^ 0xFFFFFFFFu; }

uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len);

// One-shot CRC-32 of a buffer
uint32_t crc32(const uint8_t* data, size_t len);
uint32_t crc32(const std::vector<uint8_t>& data);
uint32_t crc32(const std::string& data);

} // namespace cardkit

#include "cardkit/crc32.hpp"

#include <array>

namespace cardkit {

namespace {

constexpr uint32_t CRC32_POLY = 0xEDB88320u;

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t n = 0; n < 256; ++n) {
        uint32_t c = n;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (CRC32_POLY ^ (c >> 1)) : (c >> 1);
        }
        table[n] = c;
    }
    return table;
}

// Built on first use; static initialization is thread-safe
const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = make_crc_table();
    return table;
}

} // namespace

uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len) {
    const auto& table = crc_table();
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc;
}

uint32_t crc32(const uint8_t* data, size_t len) {
    return crc32_final(crc32_update(crc32_init(), data, len));
}

uint32_t crc32(const std::vector<uint8_t>& data) {
    return crc32(data.data(), data.size());
}

uint32_t crc32(const std::string& data) {
    return crc32(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace cardkit

#pragma once

#include <cardkit/crc32.hpp>
#include <cardkit/png.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace cardkit::test {

inline void append_be32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

// Append a correctly framed chunk (length, type, data, CRC over type+data)
inline void append_chunk(std::vector<uint8_t>& png, const std::string& type,
                         const std::vector<uint8_t>& data) {
    append_be32(png, static_cast<uint32_t>(data.size()));
    std::vector<uint8_t> crc_input(type.begin(), type.end());
    crc_input.insert(crc_input.end(), data.begin(), data.end());
    png.insert(png.end(), type.begin(), type.end());
    png.insert(png.end(), data.begin(), data.end());
    append_be32(png, crc32(crc_input));
}

inline std::vector<uint8_t> text_payload(const std::string& keyword, const std::string& text) {
    std::vector<uint8_t> data(keyword.begin(), keyword.end());
    data.push_back(0);
    data.insert(data.end(), text.begin(), text.end());
    return data;
}

inline std::vector<uint8_t> signature() {
    return std::vector<uint8_t>(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end());
}

// Signature + IHDR + IDAT, no IEND
inline std::vector<uint8_t> make_png_body() {
    std::vector<uint8_t> png = signature();
    // 1x1, 8-bit RGBA
    append_chunk(png, "IHDR", {0, 0, 0, 1, 0, 0, 0, 1, 8, 6, 0, 0, 0});
    append_chunk(png, "IDAT", {0x78, 0x9c, 0x63, 0x60, 0x00, 0x00, 0x00, 0x02, 0x00, 0x01});
    return png;
}

inline std::vector<uint8_t> make_png() {
    auto png = make_png_body();
    append_chunk(png, "IEND", {});
    return png;
}

// make_png() with a tEXt chunk before IEND
inline std::vector<uint8_t> make_png_with_text(const std::string& keyword, const std::string& text) {
    auto png = make_png_body();
    append_chunk(png, "tEXt", text_payload(keyword, text));
    append_chunk(png, "IEND", {});
    return png;
}

inline std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::uniform_int_distribution<uint64_t> dis;
        path_ = std::filesystem::temp_directory_path() /
                ("cardkit_test_" + std::to_string(dis(rd)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

    void write(const std::string& rel, const std::vector<uint8_t>& data) const {
        auto full = path_ / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    void write(const std::string& rel, const std::string& text) const {
        write(rel, bytes_of(text));
    }

private:
    std::filesystem::path path_;
};

} // namespace cardkit::test

#include "cardkit/zip.hpp"
#include "cardkit/crc32.hpp"

#include <cstring>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace cardkit {

// ============================================================================
// ZIP Format Constants (PKWARE APPNOTE 6.3)
// ============================================================================

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;     // 2.0: deflate
constexpr uint16_t VERSION_MADE_BY = 20;    // MS-DOS attribute compatibility
constexpr uint16_t FLAG_UTF8_NAMES = 0x0800;

// 1980-01-01 00:00:00 in DOS format
constexpr uint16_t DOS_EPOCH_TIME = 0x0000;
constexpr uint16_t DOS_EPOCH_DATE = (0 << 9) | (1 << 5) | 1;

constexpr size_t MAX_ENTRIES = 0xFFFF;
constexpr uint64_t MAX_32BIT_FIELD = 0xFFFFFFFEu;   // 0xFFFFFFFF marks ZIP64

void write_le16(std::vector<uint8_t>& buf, uint16_t val) {
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
}

void write_le32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
}

// Raw deflate (no zlib/gzip wrapper), as ZIP method 8 expects
bool deflate_raw(const std::vector<uint8_t>& data, int level, std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return false;
    }

    out.resize(strm.total_out);
    return true;
}

struct CentralRecord {
    std::string path;
    ZipMethod method;
    uint32_t crc;
    uint32_t compressed_size;
    uint32_t uncompressed_size;
    uint32_t local_offset;
};

void write_local_header(std::vector<uint8_t>& buf, const CentralRecord& rec) {
    write_le32(buf, LOCAL_HEADER_SIG);
    write_le16(buf, VERSION_NEEDED);
    write_le16(buf, FLAG_UTF8_NAMES);
    write_le16(buf, static_cast<uint16_t>(rec.method));
    write_le16(buf, DOS_EPOCH_TIME);
    write_le16(buf, DOS_EPOCH_DATE);
    write_le32(buf, rec.crc);
    write_le32(buf, rec.compressed_size);
    write_le32(buf, rec.uncompressed_size);
    write_le16(buf, static_cast<uint16_t>(rec.path.size()));
    write_le16(buf, 0);  // extra field length
    buf.insert(buf.end(), rec.path.begin(), rec.path.end());
}

void write_central_header(std::vector<uint8_t>& buf, const CentralRecord& rec) {
    write_le32(buf, CENTRAL_HEADER_SIG);
    write_le16(buf, VERSION_MADE_BY);
    write_le16(buf, VERSION_NEEDED);
    write_le16(buf, FLAG_UTF8_NAMES);
    write_le16(buf, static_cast<uint16_t>(rec.method));
    write_le16(buf, DOS_EPOCH_TIME);
    write_le16(buf, DOS_EPOCH_DATE);
    write_le32(buf, rec.crc);
    write_le32(buf, rec.compressed_size);
    write_le32(buf, rec.uncompressed_size);
    write_le16(buf, static_cast<uint16_t>(rec.path.size()));
    write_le16(buf, 0);  // extra field length
    write_le16(buf, 0);  // comment length
    write_le16(buf, 0);  // disk number start
    write_le16(buf, 0);  // internal attributes
    write_le32(buf, 0);  // external attributes
    write_le32(buf, rec.local_offset);
    buf.insert(buf.end(), rec.path.begin(), rec.path.end());
}

} // namespace

std::string validate_archive_path(const std::string& path) {
    if (path.empty()) {
        return "empty path";
    }
    if (path.find('\0') != std::string::npos) {
        return "path contains NUL byte";
    }
    if (path.find('\\') != std::string::npos) {
        return "path contains backslash";
    }
    if (path[0] == '/') {
        return "absolute path not allowed";
    }
    if (path.size() > 0xFFFF) {
        return "path too long";
    }

    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".") {
            return "path has empty or '.' segment";
        }
        if (segment == "..") {
            return "path traversal not allowed";
        }
    }
    if (path.back() == '/') {
        return "directory entries not supported";
    }
    return "";
}

ZipWriteResult create_zip(const std::vector<ZipEntry>& entries, const ZipWriteOptions& options) {
    ZipWriteResult result;

    if (entries.size() > MAX_ENTRIES) {
        result.error = "too many entries for a non-ZIP64 archive: " + std::to_string(entries.size());
        return result;
    }

    std::set<std::string> seen;
    for (const auto& entry : entries) {
        std::string problem = validate_archive_path(entry.path);
        if (!problem.empty()) {
            result.error = "invalid entry path '" + entry.path + "': " + problem;
            return result;
        }
        if (!seen.insert(entry.path).second) {
            result.error = "duplicate entry path: " + entry.path;
            return result;
        }
        if (entry.data.size() > MAX_32BIT_FIELD) {
            result.error = "entry too large for a non-ZIP64 archive: " + entry.path;
            return result;
        }
    }

    std::vector<uint8_t>& out = result.archive_data;
    std::vector<CentralRecord> central;
    central.reserve(entries.size());

    for (const auto& entry : entries) {
        if (out.size() > MAX_32BIT_FIELD) {
            result.error = "archive exceeds 4 GiB";
            result.archive_data.clear();
            return result;
        }

        CentralRecord rec;
        rec.path = entry.path;
        rec.crc = crc32(entry.data);
        rec.uncompressed_size = static_cast<uint32_t>(entry.data.size());
        rec.local_offset = static_cast<uint32_t>(out.size());
        rec.method = ZipMethod::Stored;

        std::vector<uint8_t> compressed;
        if (options.compression_level != 0 && !entry.data.empty()) {
            if (!deflate_raw(entry.data, options.compression_level, compressed)) {
                result.error = "deflate failed for entry: " + entry.path;
                result.archive_data.clear();
                return result;
            }
            if (compressed.size() < entry.data.size()) {
                rec.method = ZipMethod::Deflate;
            }
        }

        const std::vector<uint8_t>& payload = rec.method == ZipMethod::Deflate ? compressed : entry.data;
        rec.compressed_size = static_cast<uint32_t>(payload.size());

        write_local_header(out, rec);
        out.insert(out.end(), payload.begin(), payload.end());
        result.uncompressed_bytes += entry.data.size();

        spdlog::debug("zip: {} ({} -> {} bytes, {})", rec.path, rec.uncompressed_size,
                      rec.compressed_size, rec.method == ZipMethod::Deflate ? "deflate" : "stored");
        central.push_back(std::move(rec));
    }

    if (out.size() > MAX_32BIT_FIELD) {
        result.error = "archive exceeds 4 GiB";
        result.archive_data.clear();
        return result;
    }

    auto cd_offset = static_cast<uint32_t>(out.size());
    for (const auto& rec : central) {
        write_central_header(out, rec);
    }
    auto cd_size = static_cast<uint32_t>(out.size() - cd_offset);

    write_le32(out, END_OF_CENTRAL_SIG);
    write_le16(out, 0);  // this disk
    write_le16(out, 0);  // disk with central directory
    write_le16(out, static_cast<uint16_t>(central.size()));
    write_le16(out, static_cast<uint16_t>(central.size()));
    write_le32(out, cd_size);
    write_le32(out, cd_offset);
    write_le16(out, 0);  // comment length

    result.ok = true;
    return result;
}

} // namespace cardkit

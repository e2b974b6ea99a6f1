#include "cardkit/zip.hpp"
#include "cardkit/crc32.hpp"

#include <cstring>
#include <set>

#include <zlib.h>

namespace cardkit {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_SIZE = 22;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// The EOCD record sits in the last 22 + 65535 bytes
bool find_end_of_central(const std::vector<uint8_t>& data, size_t& offset) {
    if (data.size() < END_OF_CENTRAL_SIZE) return false;

    size_t start = data.size() - END_OF_CENTRAL_SIZE;
    size_t stop = start > MAX_COMMENT_SIZE ? start - MAX_COMMENT_SIZE : 0;
    for (size_t pos = start;; --pos) {
        if (read_le32(data.data() + pos) == END_OF_CENTRAL_SIG) {
            offset = pos;
            return true;
        }
        if (pos == stop) break;
    }
    return false;
}

bool inflate_raw(const uint8_t* data, size_t size, size_t expected, std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return false;
    }

    out.resize(expected);
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    // zlib wants a non-null output pointer even for empty entries
    uint8_t dummy = 0;
    strm.next_out = expected > 0 ? out.data() : &dummy;
    strm.avail_out = static_cast<uInt>(expected);

    int ret = inflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    inflateEnd(&strm);

    return ret == Z_STREAM_END && produced == expected;
}

} // namespace

const ZipReadEntry* ZipReadResult::find(const std::string& path) const {
    for (const auto& entry : entries) {
        if (entry.path == path) return &entry;
    }
    return nullptr;
}

ZipReadResult read_zip(const std::vector<uint8_t>& archive, const ZipReadOptions& options) {
    ZipReadResult result;

    size_t eocd = 0;
    if (!find_end_of_central(archive, eocd)) {
        result.error = "end of central directory record not found";
        return result;
    }

    const uint8_t* e = archive.data() + eocd;
    uint16_t this_disk = read_le16(e + 4);
    uint16_t cd_disk = read_le16(e + 6);
    uint16_t disk_entries = read_le16(e + 8);
    uint16_t total_entries = read_le16(e + 10);
    uint32_t cd_size = read_le32(e + 12);
    uint32_t cd_offset = read_le32(e + 16);

    if (this_disk != 0 || cd_disk != 0 || disk_entries != total_entries) {
        result.error = "multi-disk archives are not supported";
        return result;
    }
    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu) {
        result.error = "ZIP64 archives are not supported";
        return result;
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
        result.error = "central directory overruns archive";
        return result;
    }

    std::set<std::string> seen;
    size_t total_uncompressed = 0;
    size_t pos = cd_offset;
    const size_t cd_end = static_cast<size_t>(cd_offset) + cd_size;

    for (uint16_t i = 0; i < total_entries; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > cd_end) {
            result.error = "truncated central directory";
            return result;
        }
        const uint8_t* c = archive.data() + pos;
        if (read_le32(c) != CENTRAL_HEADER_SIG) {
            result.error = "bad central directory signature at offset " + std::to_string(pos);
            return result;
        }

        uint16_t flags = read_le16(c + 8);
        uint16_t method = read_le16(c + 10);
        uint32_t crc = read_le32(c + 16);
        uint32_t compressed = read_le32(c + 20);
        uint32_t uncompressed = read_le32(c + 24);
        uint16_t name_len = read_le16(c + 28);
        uint16_t extra_len = read_le16(c + 30);
        uint16_t comment_len = read_le16(c + 32);
        uint32_t local_offset = read_le32(c + 42);

        size_t record_size = CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_size > cd_end) {
            result.error = "truncated central directory entry";
            return result;
        }

        ZipReadEntry entry;
        entry.path.assign(reinterpret_cast<const char*>(c + CENTRAL_HEADER_SIZE), name_len);
        entry.crc32 = crc;
        entry.compressed_size = compressed;
        pos += record_size;

        if (flags & FLAG_ENCRYPTED) {
            result.error = "encrypted entry not supported: " + entry.path;
            return result;
        }
        if (method != static_cast<uint16_t>(ZipMethod::Stored) &&
            method != static_cast<uint16_t>(ZipMethod::Deflate)) {
            result.error = "unsupported compression method " + std::to_string(method) +
                           " for entry: " + entry.path;
            return result;
        }
        entry.method = static_cast<ZipMethod>(method);

        if (compressed == 0xFFFFFFFFu || uncompressed == 0xFFFFFFFFu || local_offset == 0xFFFFFFFFu) {
            result.error = "ZIP64 entry not supported: " + entry.path;
            return result;
        }
        if (!seen.insert(entry.path).second) {
            result.error = "duplicate entry path: " + entry.path;
            return result;
        }

        total_uncompressed += uncompressed;
        if (total_uncompressed > options.max_total_uncompressed) {
            result.error = "archive expands beyond the configured limit";
            return result;
        }

        // Local header: only its variable-length fields are needed, sizes
        // come from the central directory
        if (static_cast<size_t>(local_offset) + LOCAL_HEADER_SIZE > cd_offset) {
            result.error = "local header overruns archive: " + entry.path;
            return result;
        }
        const uint8_t* l = archive.data() + local_offset;
        if (read_le32(l) != LOCAL_HEADER_SIG) {
            result.error = "bad local header signature for entry: " + entry.path;
            return result;
        }
        size_t data_start = static_cast<size_t>(local_offset) + LOCAL_HEADER_SIZE +
                            read_le16(l + 26) + read_le16(l + 28);
        if (data_start + compressed > cd_offset) {
            result.error = "entry data overruns archive: " + entry.path;
            return result;
        }

        const uint8_t* payload = archive.data() + data_start;
        if (entry.method == ZipMethod::Stored) {
            if (compressed != uncompressed) {
                result.error = "stored entry size mismatch: " + entry.path;
                return result;
            }
            entry.data.assign(payload, payload + compressed);
        } else if (!inflate_raw(payload, compressed, uncompressed, entry.data)) {
            result.error = "inflate failed for entry: " + entry.path;
            return result;
        }

        if (cardkit::crc32(entry.data) != crc) {
            result.error = "CRC mismatch for entry: " + entry.path;
            return result;
        }

        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace cardkit

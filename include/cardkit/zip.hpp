#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// Deterministic ZIP archives
// ============================================================================
//
// Writer properties:
//   - Entries are written in the order given
//   - Timestamps fixed at the DOS epoch (1980-01-01 00:00:00)
//   - Raw deflate when it makes the entry smaller, stored otherwise
//   - No encryption, no ZIP64, single disk
// The same entries therefore always produce the same bytes.

struct ZipEntry {
    std::string path;               // Forward-slash relative path
    std::vector<uint8_t> data;
};

enum class ZipMethod : uint16_t {
    Stored = 0,
    Deflate = 8,
};

struct ZipWriteOptions {
    int compression_level = 6;      // zlib level; 0 stores everything
};

struct ZipWriteResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
    size_t uncompressed_bytes = 0;  // Sum of entry sizes
};

ZipWriteResult create_zip(const std::vector<ZipEntry>& entries, const ZipWriteOptions& options = {});

// Archive paths must be relative, forward-slash separated, free of NUL,
// "." and ".." segments. Returns an empty string when valid, else the reason.
std::string validate_archive_path(const std::string& path);

// ============================================================================
// Reading
// ============================================================================

struct ZipReadEntry {
    std::string path;
    std::vector<uint8_t> data;
    ZipMethod method = ZipMethod::Stored;
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
};

struct ZipReadOptions {
    size_t max_total_uncompressed = 512u * 1024u * 1024u;
};

struct ZipReadResult {
    bool ok = false;
    std::string error;
    std::vector<ZipReadEntry> entries;      // Central directory order

    const ZipReadEntry* find(const std::string& path) const;
};

// Parse the central directory and inflate every entry, verifying CRCs.
// Encrypted, multi-disk and ZIP64 archives are rejected.
ZipReadResult read_zip(const std::vector<uint8_t>& archive, const ZipReadOptions& options = {});

} // namespace cardkit

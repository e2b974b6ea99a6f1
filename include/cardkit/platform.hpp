#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// File I/O
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

struct FileReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

// Whole-file binary read; regular files only
FileReadResult read_binary_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

} // namespace cardkit

#pragma once

#include "katsu/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// Atomic File Operations
// ============================================================================

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The file is created with the given permission bits.
Status atomic_write_file(const std::string& path, const std::string& content,
                         unsigned int mode = 0644);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Sparse Files
// ============================================================================

// Create a file whose logical size is size_bytes by seeking to size - 1
// and writing a single zero byte. Existing files are truncated first.
Status create_sparse_file(const std::string& path, uint64_t size_bytes);

// ============================================================================
// Directory Trees
// ============================================================================

// Recursively copy src into dst, overwriting files that already exist.
// A regular file src is copied to the file path dst.
Status copy_tree(const std::string& src, const std::string& dst);

// Recursively copy src into dst, keeping files that already exist in dst
Status copy_tree_missing(const std::string& src, const std::string& dst);

// mkdir -p
Status ensure_directory(const std::string& path);

// Remove path and everything below it; a missing path is not an error
Status remove_tree(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Join an absolute path (e.g. a mountpoint) under a root directory.
// path_under_root("/w/chroot", "/boot/efi") == "/w/chroot/boot/efi"
std::string path_under_root(const std::string& root, const std::string& abs_path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Sorted names of the entries directly below dir; empty if dir is missing
std::vector<std::string> list_directory_names(const std::string& dir);

// ============================================================================
// Host Information
// ============================================================================

// Machine architecture of the running kernel (uname -m), e.g. "x86_64"
std::string host_arch();

// Trim ASCII whitespace from both ends
std::string trim(const std::string& s);

// Split on a delimiter, trimming entries and dropping empty ones
std::vector<std::string> split_list(const std::string& s, char delim = ',');

} // namespace katsu

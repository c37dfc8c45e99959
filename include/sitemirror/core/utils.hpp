#ifndef SITEMIRROR_CORE_UTILS_HPP
#define SITEMIRROR_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sitemirror {

// ============ Time utilities ============

// Milliseconds on a monotonic clock, for deadlines
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Convert string to uppercase
std::string to_upper(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Get basename (filename) from path
std::string basename(const std::string& path);

// Get directory name from path
std::string dirname(const std::string& path);

// Prefix relative paths with the current working directory
std::string absolute_path(const std::string& path);

// Check if path exists
bool path_exists(const std::string& path);

// Check if path is a directory
bool is_directory(const std::string& path);

// Create directory (and parents if needed); succeeds if it already exists
bool mkdir_p(const std::string& path);

// Regular files below root, as sorted root-relative paths using '/'
std::vector<std::string> list_files_recursive(const std::string& root);

// Remove a file or a directory tree; missing paths count as removed
bool remove_tree(const std::string& path);

// Create a fresh private directory under $TMPDIR (or /tmp)
std::string make_temp_dir(const std::string& prefix);

// Locate an executable on $PATH; absolute or relative paths are checked as-is
std::string find_executable(const std::string& name);

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out);

// Writes bytes, replacing any existing file
bool write_file(const std::string& path, const std::string& data);

// Byte-for-byte copy, replacing any existing destination
bool copy_file(const std::string& from, const std::string& to);

// ============ Hashing utilities ============

// Compute SHA256 hash as hex string
std::string sha256_hex(const std::string& data);

} // namespace sitemirror

#endif // SITEMIRROR_CORE_UTILS_HPP

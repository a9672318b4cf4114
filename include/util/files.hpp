#pragma once

#include <filesystem>
#include <string>

namespace gossipnet {
namespace util {

/**
 * Crash-safe file output for exported documents
 *
 * Pattern:
 * 1. Write to a temporary file next to the target (.tmp.XXXX suffix)
 * 2. fsync() the file, then the directory
 * 3. Rename over the target
 *
 * A reader therefore sees either the previous document or the complete new
 * one, never a half-written file.
 */

/**
 * Write string to file atomically
 * @param mode File permissions for the new file (e.g. 0644)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace gossipnet

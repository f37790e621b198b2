#pragma once

#include <string>
#include <optional>

namespace Platform {

/**
 * Read text file.
 * @param path File path
 * @return File contents as string, or nullopt on error
 */
std::optional<std::string> ReadTextFile(const std::string& path);

/**
 * Write text file. Writes to a sibling temporary file first and renames
 * it over the target, so a crash mid-write never leaves a torn snapshot.
 * @param path File path
 * @param text Text to write
 * @return true on success
 */
bool WriteTextFile(const std::string& path, const std::string& text);

/**
 * Check if file exists.
 * @param path File path
 * @return true if file exists
 */
bool FileExists(const std::string& path);

} // namespace Platform

#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Restricts a file to owner read/write. Returns false if permissions could not be set.
bool restrict_to_owner(const std::filesystem::path& path);

} // namespace platform

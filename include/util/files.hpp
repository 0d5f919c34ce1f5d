#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace po::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes content to a sibling "<name>.tmp" and renames it over path, so
// readers see either the old file or the complete new one.
void writeFileAtomic(const std::filesystem::path& path, std::string_view content);

// rename(2), falling back to copy + remove when from and to live on
// different filesystems. Never replaces an existing destination.
void moveFile(const std::filesystem::path& from, const std::filesystem::path& to);

// Returns true if the directory had to be created.
bool ensureDirectory(const std::filesystem::path& path);

std::string bytesToSize(uintmax_t bytes);

}

#pragma once

#include "library/Entry.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace po::library {

/*
 * On-disk index of a library, one text file:
 *
 *   <version>
 *   --START-CONTENT--
 *   <64 hex chars> <relative path>
 *   ...
 *
 * Paths may contain spaces; a body line is split right after the hash.
 */
class IndexFile {
public:
    static constexpr unsigned long CURRENT_VERSION = 1;
    static constexpr std::string_view START_CONTENT = "--START-CONTENT--";

    explicit IndexFile(std::filesystem::path path) : path_(std::move(path)) {}

    /// Creates the parent directory and an empty file when missing (a new
    /// library), otherwise parses strictly. Throws CorruptIndexError or
    /// UnsupportedVersionError without returning partial results.
    [[nodiscard]] std::vector<Entry> load() const;

    /// Like load(), but never writes: a missing file is an empty index.
    [[nodiscard]] std::vector<Entry> read() const;

    /// Validates entries, then replaces the file through a temp file. The
    /// parent directory must already exist.
    void persist(const std::vector<Entry>& entries) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] static std::vector<Entry> parse(std::string_view text);
    [[nodiscard]] static std::string serialize(const std::vector<Entry>& entries);

private:
    std::filesystem::path path_;

    static void validate(const std::vector<Entry>& entries);
};

}

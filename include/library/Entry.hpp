#pragma once

#include "library/ContentHash.hpp"

#include <filesystem>
#include <string>

namespace po::library {

// One file known to the library. rel_path is relative to the output root.
struct Entry {
    ContentHash hash;
    std::filesystem::path rel_path;

    Entry(ContentHash hash, std::filesystem::path relPath)
        : hash(hash), rel_path(std::move(relPath)) {}

    // '/'-separated form, as persisted and as matched by queries
    [[nodiscard]] std::string relPathString() const { return rel_path.generic_string(); }

    bool operator==(const Entry& other) const = default;
};

// A candidate that passed the dedup check and is waiting to be placed.
struct UnsortedFile {
    std::filesystem::path path;
    ContentHash hash;
};

}

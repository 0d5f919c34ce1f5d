#pragma once

#include "library/Entry.hpp"
#include "library/IndexFile.hpp"
#include "library/SortPolicy.hpp"

#include <filesystem>
#include <unordered_set>
#include <vector>

namespace po::library {

/*
 * Files under an output root, indexed by content hash. No two entries share
 * a hash. The in-memory state is written back only by persist().
 */
class Library {
public:
    static constexpr auto META_DIR = "_pometa";
    static constexpr auto HASHES_FILE = "hashes";

    /// Loads <outputRoot>/_pometa/hashes, bootstrapping an empty library if
    /// there is none yet.
    static Library load(const std::filesystem::path& outputRoot);

    /// Read-only counterpart of load(): nothing is created under outputRoot,
    /// a missing index reads as an empty library.
    static Library open(const std::filesystem::path& outputRoot);

    /// Hashes every candidate and returns those whose content is not yet in
    /// the library, each distinct content once, in input order.
    [[nodiscard]] std::vector<UnsortedFile> checkNew(const std::vector<std::filesystem::path>& candidates) const;

    /// Moves each file under the output root according to policy and records
    /// it. Stops at the first failure; files placed before it stay moved and
    /// recorded.
    void place(const std::vector<UnsortedFile>& files, SortPolicy policy);

    void persist() const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] bool contains(const ContentHash& hash) const { return known_.contains(hash); }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    [[nodiscard]] const std::filesystem::path& metaRoot() const { return metaRoot_; }

private:
    std::filesystem::path outputRoot_, metaRoot_;
    IndexFile index_;
    std::vector<Entry> entries_;
    std::unordered_set<ContentHash> known_;

    Library(std::filesystem::path outputRoot, IndexFile index, std::vector<Entry> entries);

    void placeOne(const UnsortedFile& file, SortPolicy policy);
    void record(const ContentHash& hash, const std::filesystem::path& rel);
};

}

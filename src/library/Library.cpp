#include "library/Library.hpp"
#include "library/errors.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <system_error>

using namespace po::library;
using namespace po::log;

namespace fs = std::filesystem;

Library::Library(fs::path outputRoot, IndexFile index, std::vector<Entry> entries)
    : outputRoot_(std::move(outputRoot)),
      metaRoot_(outputRoot_ / META_DIR),
      index_(std::move(index)),
      entries_(std::move(entries)) {
    known_.reserve(entries_.size());
    for (const auto& e : entries_) known_.insert(e.hash);
}

Library Library::load(const fs::path& outputRoot) {
    IndexFile index(outputRoot / META_DIR / HASHES_FILE);
    auto entries = index.load();
    Registry::library()->info("[Library] Loaded {} entries from {}", entries.size(), outputRoot.string());
    return {outputRoot, std::move(index), std::move(entries)};
}

Library Library::open(const fs::path& outputRoot) {
    IndexFile index(outputRoot / META_DIR / HASHES_FILE);
    auto entries = index.read();
    Registry::library()->debug("[Library] Opened {} with {} entries", outputRoot.string(), entries.size());
    return {outputRoot, std::move(index), std::move(entries)};
}

std::vector<UnsortedFile> Library::checkNew(const std::vector<fs::path>& candidates) const {
    std::vector<UnsortedFile> fresh;
    std::unordered_set<ContentHash> batch;

    for (const auto& path : candidates) {
        auto hash = ContentHash::compute(path);

        if (known_.contains(hash)) {
            Registry::library()->debug("[Library] Already in library: {} ({})", path.string(), hash.encode());
            continue;
        }
        if (!batch.insert(hash).second) {
            Registry::library()->debug("[Library] Same content seen earlier in this batch: {} ({})",
                                       path.string(), hash.encode());
            continue;
        }

        Registry::library()->debug("[Library] New file: {} ({})", path.string(), hash.encode());
        fresh.push_back({path, hash});
    }

    return fresh;
}

void Library::place(const std::vector<UnsortedFile>& files, const SortPolicy policy) {
    Registry::library()->info("[Library] Sorting {} files with policy {}", files.size(), to_string(policy));
    for (const auto& file : files) placeOne(file, policy);
}

void Library::placeOne(const UnsortedFile& file, const SortPolicy policy) {
    if (known_.contains(file.hash)) {
        Registry::library()->warn("[Library] Skipping {}, content already recorded ({})",
                                  file.path.string(), file.hash.encode());
        return;
    }

    const auto rel = destinationFor(file.path, policy);
    const auto dest = outputRoot_ / rel;

    try {
        if (util::ensureDirectory(dest.parent_path()))
            Registry::library()->debug("[Library] Created {}", dest.parent_path().string());
    } catch (const fs::filesystem_error& e) {
        throw IOError(std::string("Failed to create destination directory (") + e.code().message() + ")",
                      dest.parent_path());
    }

    // An input directory that is also the output root holds files already in place
    if (std::error_code ec; fs::equivalent(file.path, dest, ec)) {
        Registry::library()->info("[Library] {} is already in place, recording it", dest.string());
        record(file.hash, rel);
        return;
    }

    if (fs::exists(fs::symlink_status(dest))) throw DestinationExistsError(dest);

    try {
        util::moveFile(file.path, dest);
    } catch (const fs::filesystem_error& e) {
        if (e.code() == std::errc::file_exists) throw DestinationExistsError(dest);
        throw IOError(std::string("Failed to move file to ") + dest.string() + " (" + e.code().message() + ")",
                      file.path);
    }

    Registry::library()->info("[Library] Sorted {} into {}", file.path.string(), dest.string());
    record(file.hash, rel);
}

void Library::record(const ContentHash& hash, const fs::path& rel) {
    entries_.emplace_back(hash, rel);
    known_.insert(hash);
}

void Library::persist() const {
    index_.persist(entries_);
    Registry::library()->info("[Library] Persisted {} entries to {}", entries_.size(), index_.path().string());
}

#include "library/IndexFile.hpp"
#include "library/errors.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <charconv>
#include <optional>
#include <fstream>
#include <unordered_set>

using namespace po::library;
using namespace po::log;

namespace fs = std::filesystem;

namespace {

// Splits on '\n'; a trailing newline does not produce an empty last line.
std::vector<std::string_view> splitLines(const std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string lineRef(const std::size_t idx) { return "line " + std::to_string(idx + 1); }

}

std::vector<Entry> IndexFile::load() const {
    const auto metaRoot = path_.parent_path();
    try {
        if (!metaRoot.empty() && util::ensureDirectory(metaRoot))
            Registry::library()->debug("[IndexFile] Created metadata root {}", metaRoot.string());

        if (!fs::exists(path_)) {
            std::ofstream touch(path_);
            if (!touch) throw IOError("Failed to create index file", path_);
            Registry::library()->info("[IndexFile] No index at {}, starting an empty library", path_.string());
            return {};
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError(e.what(), path_);
    }

    return read();
}

std::vector<Entry> IndexFile::read() const {
    try {
        if (!fs::exists(path_)) {
            Registry::library()->debug("[IndexFile] No index at {}", path_.string());
            return {};
        }

        auto entries = parse(util::readFileToString(path_));
        Registry::library()->debug("[IndexFile] Loaded {} entries from {}", entries.size(), path_.string());
        return entries;
    } catch (const fs::filesystem_error& e) {
        throw IOError(e.what(), path_);
    } catch (const CorruptIndexError& e) {
        throw CorruptIndexError(path_.string() + ": " + e.what());
    }
}

void IndexFile::persist(const std::vector<Entry>& entries) const {
    validate(entries);

    const auto metaRoot = path_.parent_path();
    if (!metaRoot.empty() && !fs::is_directory(metaRoot))
        throw IOError("Metadata root does not exist", metaRoot);

    try {
        util::writeFileAtomic(path_, serialize(entries));
    } catch (const fs::filesystem_error& e) {
        throw IOError(e.what(), path_);
    }

    Registry::library()->debug("[IndexFile] Persisted {} entries to {}", entries.size(), path_.string());
}

std::vector<Entry> IndexFile::parse(const std::string_view text) {
    const auto lines = splitLines(text);
    if (lines.empty()) return {}; // created on bootstrap, never persisted

    unsigned long version = 0;
    const auto& versionLine = lines[0];
    const auto [ptr, ec] = std::from_chars(versionLine.data(), versionLine.data() + versionLine.size(), version);
    if (versionLine.empty() || ec != std::errc() || ptr != versionLine.data() + versionLine.size())
        throw CorruptIndexError("Unparsable version line: '" + std::string(versionLine) + "'");
    if (version > CURRENT_VERSION) throw UnsupportedVersionError(version, CURRENT_VERSION);

    if (lines.size() < 2 || lines[1] != START_CONTENT)
        throw CorruptIndexError("Missing " + std::string(START_CONTENT) + " sentinel");

    std::vector<Entry> entries;
    entries.reserve(lines.size() - 2);
    std::unordered_set<ContentHash> seen;

    for (std::size_t i = 2; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.size() < ContentHash::HEX_SIZE + 2 || line[ContentHash::HEX_SIZE] != ' ')
            throw CorruptIndexError(lineRef(i) + ": expected '<hash> <path>'");

        std::optional<ContentHash> hash;
        try {
            hash = ContentHash::decode(line.substr(0, ContentHash::HEX_SIZE));
        } catch (const FormatError& e) {
            throw CorruptIndexError(lineRef(i) + ": " + e.what());
        }

        const auto rel = line.substr(ContentHash::HEX_SIZE + 1);
        if (rel.find('\r') != std::string_view::npos)
            throw CorruptIndexError(lineRef(i) + ": path contains a carriage return");

        if (!seen.insert(*hash).second)
            throw CorruptIndexError(lineRef(i) + ": duplicate hash " + hash->encode());

        entries.emplace_back(*hash, fs::path(std::string(rel)));
    }

    return entries;
}

std::string IndexFile::serialize(const std::vector<Entry>& entries) {
    std::string out = std::to_string(CURRENT_VERSION);
    out += '\n';
    out += START_CONTENT;
    out += '\n';

    for (const auto& entry : entries) {
        out += entry.hash.encode();
        out += ' ';
        out += entry.relPathString();
        out += '\n';
    }
    return out;
}

void IndexFile::validate(const std::vector<Entry>& entries) {
    std::unordered_set<ContentHash> seen;
    for (const auto& entry : entries) {
        const auto rel = entry.relPathString();
        if (rel.empty()) throw CorruptIndexError("Refusing to persist an entry with an empty path");
        if (rel.find_first_of("\r\n") != std::string::npos)
            throw CorruptIndexError("Refusing to persist a path containing a line break: " + rel);
        if (!seen.insert(entry.hash).second)
            throw CorruptIndexError("Refusing to persist duplicate hash " + entry.hash.encode());
    }
}

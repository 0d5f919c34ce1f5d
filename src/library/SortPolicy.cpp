#include "library/SortPolicy.hpp"
#include "library/errors.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace po::library {

std::string to_string(const SortPolicy policy) {
    switch (policy) {
    case SortPolicy::MoveToRoot: return "move_to_root";
    case SortPolicy::Date: return "date";
    default: throw std::invalid_argument("Unknown SortPolicy");
    }
}

SortPolicy sortPolicyFromString(const std::string& name) {
    std::string lower = name;
    std::ranges::transform(lower, lower.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (lower == "move_to_root" || lower == "root" || lower == "none") return SortPolicy::MoveToRoot;
    if (lower == "date") return SortPolicy::Date;
    throw std::invalid_argument("Unknown sort policy: " + name);
}

fs::path datePath(const util::CalendarDate& date, const fs::path& filename) {
    return fs::path(std::to_string(date.year)) / std::to_string(date.month) / std::to_string(date.day) / filename;
}

fs::path destinationFor(const fs::path& source, const SortPolicy policy) {
    const auto filename = source.filename();
    if (filename.empty() || filename == "." || filename == "..")
        throw IOError("Source has no file name", source);

    switch (policy) {
    case SortPolicy::MoveToRoot:
        return filename;
    case SortPolicy::Date: {
        std::optional<std::time_t> created;
        try {
            created = util::birthTime(source);
        } catch (const std::system_error& e) {
            throw IOError(std::string("Failed to read file metadata (") + e.code().message() + ")", source);
        }
        if (!created) throw MetadataError("Filesystem does not report a creation time", source);
        return datePath(util::utcDate(*created), filename);
    }
    default:
        throw std::invalid_argument("Unknown SortPolicy");
    }
}

}

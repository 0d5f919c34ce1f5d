#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <string>

namespace po::library {

enum class SortPolicy {
    MoveToRoot, // output_root/<basename>
    Date        // output_root/<year>/<month>/<day>/<basename>, from the creation time
};

[[nodiscard]] std::string to_string(SortPolicy policy);

/// Accepts "move_to_root", "root", "none" and "date", case-insensitively.
/// Throws std::invalid_argument for anything else.
[[nodiscard]] SortPolicy sortPolicyFromString(const std::string& name);

/// Relative destination of source under policy. Date reads the creation
/// time and throws MetadataError if the filesystem does not record it.
[[nodiscard]] std::filesystem::path destinationFor(const std::filesystem::path& source, SortPolicy policy);

[[nodiscard]] std::filesystem::path datePath(const util::CalendarDate& date, const std::filesystem::path& filename);

}

#include "query/Glob.hpp"

#include <fnmatch.h>
#include <stdexcept>

namespace po::query {

bool matches(const std::string& pattern, const library::Entry& entry) {
    const auto rel = entry.relPathString();
    const int rc = ::fnmatch(pattern.c_str(), rel.c_str(), 0);
    if (rc == 0) return true;
    if (rc == FNM_NOMATCH) return false;
    throw std::runtime_error("fnmatch failed for pattern: " + pattern);
}

std::vector<library::Entry> filter(const std::string& pattern, const std::vector<library::Entry>& entries) {
    std::vector<library::Entry> out;
    for (const auto& entry : entries)
        if (matches(pattern, entry)) out.push_back(entry);
    return out;
}

}

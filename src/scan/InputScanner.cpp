#include "scan/InputScanner.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace po::scan;
using namespace po::log;

namespace fs = std::filesystem;

bool InputScanner::accepts(const fs::path& file) const {
    if (extensions_.empty()) return true;

    const auto ext = file.extension().string();
    if (ext.size() < 2) return false; // no extension, or a bare trailing dot
    return std::ranges::find(extensions_, ext.substr(1)) != extensions_.end();
}

std::vector<fs::path> InputScanner::scan(const fs::path& dir) const {
    Registry::scan()->info("[InputScanner] Searching {}", dir.string());

    std::vector<fs::path> captured;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto& p = entry.path();

        if (!entry.is_regular_file()) {
            Registry::scan()->debug("[InputScanner] Ignoring non-regular file {}", p.string());
            continue;
        }
        if (!accepts(p)) {
            Registry::scan()->debug("[InputScanner] Ignoring {} (extension not captured)", p.string());
            continue;
        }

        Registry::scan()->debug("[InputScanner] Capturing {}", p.string());
        captured.push_back(p);
    }

    std::ranges::sort(captured);
    Registry::scan()->debug("[InputScanner] Captured {} files from {}", captured.size(), dir.string());
    return captured;
}

std::vector<fs::path> InputScanner::scanAll(const std::vector<fs::path>& dirs) const {
    std::vector<fs::path> captured;
    for (const auto& dir : dirs) {
        auto found = scan(dir);
        captured.insert(captured.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    Registry::scan()->info("[InputScanner] Captured {} files from {} inputs", captured.size(), dirs.size());
    return captured;
}

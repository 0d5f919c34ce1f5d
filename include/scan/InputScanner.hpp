#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace po::scan {

class InputScanner {
public:
    /// extensions are compared without the leading dot and case-sensitively.
    /// An empty list captures every regular file.
    explicit InputScanner(std::vector<std::string> extensions) : extensions_(std::move(extensions)) {}

    /// Regular files directly inside dir (not recursive) that pass the
    /// extension filter, sorted by path.
    [[nodiscard]] std::vector<std::filesystem::path> scan(const std::filesystem::path& dir) const;

    [[nodiscard]] std::vector<std::filesystem::path> scanAll(const std::vector<std::filesystem::path>& dirs) const;

    [[nodiscard]] bool accepts(const std::filesystem::path& file) const;

private:
    std::vector<std::string> extensions_;
};

}

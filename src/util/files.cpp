#include "util/files.hpp"

#include <fmt/core.h>

#include <array>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

std::string po::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw fs::filesystem_error("Failed to open file", path, std::make_error_code(std::errc::io_error));

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<std::size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw fs::filesystem_error("Failed to read file", path, std::make_error_code(std::errc::io_error));
    in.close();

    return buffer;
}

void po::util::writeFileAtomic(const fs::path& path, const std::string_view content) {
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw fs::filesystem_error("Failed to open temp file for writing", tmp,
                                             std::make_error_code(std::errc::io_error));
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw fs::filesystem_error("Failed to write temp file", tmp, std::make_error_code(std::errc::io_error));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw fs::filesystem_error("Failed to replace file", tmp, path, ec);
    }
}

void po::util::moveFile(const fs::path& from, const fs::path& to) {
    if (fs::exists(fs::symlink_status(to)))
        throw fs::filesystem_error("Destination already exists", from, to, std::make_error_code(std::errc::file_exists));

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) throw fs::filesystem_error("Failed to move file", from, to, ec);

    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(to, ignored);
        throw fs::filesystem_error("Failed to copy file across filesystems", from, to, ec);
    }
    if (!fs::remove(from, ec) || ec)
        throw fs::filesystem_error("Copied file but failed to remove source", from, to, ec);
}

bool po::util::ensureDirectory(const fs::path& path) {
    if (fs::is_directory(path)) return false;
    fs::create_directories(path);
    return true;
}

std::string po::util::bytesToSize(const uintmax_t bytes) {
    static constexpr std::array<const char*, 5> suffix = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}

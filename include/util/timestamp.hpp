#pragma once

#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <system_error>

namespace po::util {

struct CalendarDate {
    int year = 1970;
    unsigned int month = 1, day = 1;
};

/// Birth time of a file as reported by statx(2). std::nullopt when the
/// filesystem does not record one; throws std::system_error when the file
/// cannot be stat'ed at all.
inline std::optional<std::time_t> birthTime(const std::filesystem::path& path) {
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME, &stx) != 0)
        throw std::system_error(errno, std::generic_category(), "statx failed for " + path.string());
    if (!(stx.stx_mask & STATX_BTIME)) return std::nullopt;
    return static_cast<std::time_t>(stx.stx_btime.tv_sec);
}

inline CalendarDate utcDate(const std::time_t ts) {
    std::tm tm{};
    if (!gmtime_r(&ts, &tm)) throw std::runtime_error("Timestamp out of range: " + std::to_string(ts));
    return {tm.tm_year + 1900, static_cast<unsigned int>(tm.tm_mon + 1), static_cast<unsigned int>(tm.tm_mday)};
}

} // namespace po::util

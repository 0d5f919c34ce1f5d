#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace po::library {

// SHA-256 digest of a file's full content.
class ContentHash {
public:
    static constexpr std::size_t SIZE = 32;
    static constexpr std::size_t HEX_SIZE = SIZE * 2;

    using Digest = std::array<uint8_t, SIZE>;

    explicit ContentHash(const Digest& bytes) : bytes_(bytes) {}

    /// Streams the whole file through SHA-256. Throws IOError if the file
    /// cannot be opened or is not read to the end.
    static ContentHash compute(const std::filesystem::path& file);

    /// Inverse of encode(). Throws FormatError unless hex is exactly
    /// HEX_SIZE hex digits.
    static ContentHash decode(std::string_view hex);

    [[nodiscard]] std::string encode() const;

    [[nodiscard]] const Digest& bytes() const { return bytes_; }

    auto operator<=>(const ContentHash&) const = default;

private:
    Digest bytes_;
};

}

template <>
struct std::hash<po::library::ContentHash> {
    std::size_t operator()(const po::library::ContentHash& h) const noexcept {
        // the digest is already uniformly distributed, its prefix is a fine bucket key
        std::size_t out = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
            out = (out << 8) | h.bytes()[i];
        return out;
    }
};

#include "library/ContentHash.hpp"
#include "library/errors.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

using namespace po::library;

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

ContentHash ContentHash::compute(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) throw IOError("Failed to open file for hashing", file);

    const MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) throw Error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw Error("EVP_DigestInit_ex failed for sha256");

    std::vector<char> buffer(READ_CHUNK);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1)
            throw Error("EVP_DigestUpdate failed");
    }
    if (!in.eof()) throw IOError("Failed to read file to the end", file);

    Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != SIZE)
        throw Error("EVP_DigestFinal_ex failed");

    return ContentHash(digest);
}

ContentHash ContentHash::decode(const std::string_view hex) {
    if (hex.size() != HEX_SIZE)
        throw FormatError("Hash must be " + std::to_string(HEX_SIZE) + " hex characters, got " +
                          std::to_string(hex.size()));

    Digest digest{};
    for (std::size_t i = 0; i < SIZE; ++i) {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) throw FormatError("Invalid hex in hash: " + std::string(hex));
        digest[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return ContentHash(digest);
}

std::string ContentHash::encode() const {
    std::ostringstream oss;
    for (const unsigned char c : bytes_) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

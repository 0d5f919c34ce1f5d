#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace po::library {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// open/read/write/rename/mkdir failures, always tied to the path involved
struct IOError : Error {
    std::filesystem::path path;

    IOError(const std::string& what, std::filesystem::path p)
        : Error(what + ": " + p.string()), path(std::move(p)) {}
};

// Placement target already occupied in the output tree.
struct DestinationExistsError : IOError {
    explicit DestinationExistsError(std::filesystem::path p)
        : IOError("Destination already exists", std::move(p)) {}
};

struct FormatError : Error {
    using Error::Error;
};

struct CorruptIndexError : Error {
    using Error::Error;
};

struct UnsupportedVersionError : Error {
    unsigned long found, supported;

    UnsupportedVersionError(const unsigned long found, const unsigned long supported)
        : Error("Index format version " + std::to_string(found) +
                " is newer than the supported version " + std::to_string(supported)),
          found(found), supported(supported) {}
};

struct MetadataError : Error {
    std::filesystem::path path;

    MetadataError(const std::string& what, std::filesystem::path p)
        : Error(what + ": " + p.string()), path(std::move(p)) {}
};

}

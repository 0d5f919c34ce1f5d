#pragma once

#include "library/Entry.hpp"

#include <string>
#include <vector>

namespace po::query {

// Whole-string fnmatch(3) of pattern against the entry's stored relative
// path. '*' also matches '/'.
[[nodiscard]] bool matches(const std::string& pattern, const library::Entry& entry);

[[nodiscard]] std::vector<library::Entry> filter(const std::string& pattern, const std::vector<library::Entry>& entries);

}

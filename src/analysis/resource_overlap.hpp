#pragma once

#include <string>

namespace callplan::analysis {

bool is_path_separator(char c);

// Removes at most one trailing separator ("/tmp/x/" -> "/tmp/x").
std::string strip_trailing_separator(const std::string& resource);

// True when the two resources are equal, or one names a parent directory of
// the other. Coincidental prefixes ("/a/b" vs "/a/bc") do not overlap;
// symlinks and aliases are not resolved.
bool resources_overlap(const std::string& first, const std::string& second);

// True when `child` equals `parent` or lies underneath it.
bool resource_within(const std::string& parent, const std::string& child);

}  // namespace callplan::analysis

#include "analysis/resource_overlap.hpp"

namespace callplan::analysis {

bool is_path_separator(const char c) {
    return c == '/' || c == '\\';
}

std::string strip_trailing_separator(const std::string& resource) {
    if (!resource.empty() && is_path_separator(resource.back())) {
        return resource.substr(0, resource.size() - 1);
    }
    return resource;
}

bool resource_within(const std::string& parent, const std::string& child) {
    const std::string p = strip_trailing_separator(parent);
    const std::string c = strip_trailing_separator(child);
    if (p == c) {
        return true;
    }
    return c.size() > p.size() && c.compare(0, p.size(), p) == 0 &&
           is_path_separator(c[p.size()]);
}

bool resources_overlap(const std::string& first, const std::string& second) {
    return resource_within(first, second) || resource_within(second, first);
}

}  // namespace callplan::analysis

#pragma once

#include <stdexcept>
#include <string>

namespace clustermap {

// Malformed hierarchy input (parse failure, missing field, bad level, too deep)
class HierarchyError : public std::runtime_error {
public:
    explicit HierarchyError(const std::string& what) : std::runtime_error(what) {}
};

// Layout pass cannot complete (depth bound exceeded, degenerate enclosure)
class LayoutError : public std::runtime_error {
public:
    explicit LayoutError(const std::string& what) : std::runtime_error(what) {}
};

// Maximum nesting accepted anywhere in the engine. Three real levels plus a
// synthetic root is the normal case.
inline constexpr int MAX_HIERARCHY_DEPTH = 64;

} // namespace clustermap

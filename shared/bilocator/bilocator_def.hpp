#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bilocator {

// Registry name key. std::nullopt is the unnamed entry and never equals any string.
using Name = std::optional<std::string>;

// Receives every name registered under a type (sorted, unnamed first) and
// returns the one to select.
using Filter = std::function<Name(const std::vector<Name>&)>;

// Where a binding publishes its object.
enum class Location {
    Registry,   // process-wide, reachable by (type, name) from anywhere
    Tree,       // reachable only from the binding node and its descendants
};

inline constexpr const char* to_string(Location location) {
    return location == Location::Registry ? "registry" : "tree";
}

} // namespace bilocator

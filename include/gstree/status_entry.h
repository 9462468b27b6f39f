#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gstree/status_parser.h"

namespace gstree {

struct StatusEntry {
    std::string path;
    std::string status;
    std::optional<std::string> rename_source;

    bool operator==(const StatusEntry&) const = default;
};

// Number of '/'-separated segments; "a/b/" counts three.
std::size_t path_depth(std::string_view path) noexcept;

// Deepest paths first, ties broken lexicographically, so every directory
// has seen its deepest descendants before shallower entries reach it.
std::vector<StatusEntry> sort_entries(const StatusMap& map);

} // namespace gstree

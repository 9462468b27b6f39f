#include "gstree/status_entry.h"

#include <algorithm>

namespace gstree {

std::size_t path_depth(std::string_view path) noexcept {
    return static_cast<std::size_t>(std::count(path.begin(), path.end(), '/')) + 1;
}

std::vector<StatusEntry> sort_entries(const StatusMap& map) {
    std::vector<StatusEntry> entries;
    entries.reserve(map.statuses.size());
    for (const auto& [path, status] : map.statuses) {
        StatusEntry entry{path, status, std::nullopt};
        if (auto it = map.rename_sources.find(path); it != map.rename_sources.end()) {
            entry.rename_source = it->second;
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const StatusEntry& lhs, const StatusEntry& rhs) {
        const auto lhs_depth = path_depth(lhs.path);
        const auto rhs_depth = path_depth(rhs.path);
        if (lhs_depth != rhs_depth) {
            return lhs_depth > rhs_depth;
        }
        return lhs.path < rhs.path;
    });
    return entries;
}

} // namespace gstree

#include "gstree/theme.h"

#include <algorithm>
#include <array>

namespace gstree {

namespace {
// Unmerged combinations, see the "Unmerged" table in git-status(1).
constexpr std::array<std::string_view, 7> kConflictCodes{"DD", "AU", "UD", "UA", "DU", "AA", "UU"};
} // namespace

Theme::Theme(bool color_enabled)
    : color_enabled_{color_enabled} {
    load_default_colors();
}

void Theme::load_default_colors() {
    color_map_["alert"] = "\033[31m";
    color_map_["staged"] = "\033[32m";
    color_map_["unstaged"] = "\033[31m";
}

Theme::StatusStyle Theme::classify(std::string_view status) {
    if (!status.empty() && (status[0] == '?' || status[0] == '!')) {
        return StatusStyle::Alert;
    }
    if (std::find(kConflictCodes.begin(), kConflictCodes.end(), status) != kConflictCodes.end()) {
        return StatusStyle::Alert;
    }
    return StatusStyle::Split;
}

std::string Theme::status(std::string_view xy) const {
    if (xy.size() != 2) {
        return std::string{xy};
    }
    if (classify(xy) == StatusStyle::Alert) {
        return paint("alert", xy);
    }

    std::string result;
    const std::string_view index = xy.substr(0, 1);
    const std::string_view worktree = xy.substr(1, 1);
    result += index == "." ? std::string{index} : paint("staged", index);
    result += worktree == "." ? std::string{worktree} : paint("unstaged", worktree);
    return result;
}

std::string Theme::paint(std::string_view key, std::string_view text) const {
    if (!color_enabled_ || text.empty()) {
        return std::string{text};
    }
    auto it = color_map_.find(std::string{key});
    if (it == color_map_.end() || it->second.empty()) {
        return std::string{text};
    }
    return it->second + std::string{text} + reset();
}

std::string Theme::reset() const {
    return color_enabled_ ? std::string{"\033[0m"} : std::string{};
}

} // namespace gstree

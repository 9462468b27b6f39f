#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace gstree {

class Theme {
public:
    enum class StatusStyle {
        // Both letters in one color: untracked, ignored, unmerged.
        Alert,
        // Index letter and worktree letter colored separately.
        Split
    };

    explicit Theme(bool color_enabled);

    bool color_enabled() const noexcept { return color_enabled_; }

    static StatusStyle classify(std::string_view status);

    std::string status(std::string_view xy) const;
    std::string paint(std::string_view key, std::string_view text) const;
    std::string reset() const;

private:
    void load_default_colors();

    bool color_enabled_;
    std::unordered_map<std::string, std::string> color_map_;
};

} // namespace gstree

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gstree/logger.h"

namespace gstree {

class Config {
public:
    enum class ColorMode {
        Auto,
        Always,
        Never
    };

    struct Options {
        ColorMode color = ColorMode::Auto;
        Logger::Level log_level = Logger::Level::Error;

        bool zero_terminate = false;
        bool hide_control_chars = false;
        bool dump_markdown = false;

        // Run git here instead of the current directory.
        std::optional<std::filesystem::path> repository;
        // Read porcelain data from this file ("-" is stdin) instead of running git.
        std::optional<std::filesystem::path> input;
        // Forwarded verbatim to `git status`.
        std::vector<std::string> git_args;
    };

    static Config& instance();

    // --color=auto honours the terminal and NO_COLOR; always/never win outright.
    static bool color_wanted(ColorMode mode, bool stdout_is_tty, bool no_color_env) noexcept;

    void set_color_enabled(bool enabled) noexcept;
    bool color_enabled() const noexcept;

private:
    Config() = default;

    bool color_enabled_ = false;
};

} // namespace gstree

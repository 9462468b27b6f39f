#include "gstree/config.h"

namespace gstree {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::color_wanted(ColorMode mode, bool stdout_is_tty, bool no_color_env) noexcept {
    switch (mode) {
        case ColorMode::Always:
            return true;
        case ColorMode::Never:
            return false;
        case ColorMode::Auto:
            break;
    }
    return stdout_is_tty && !no_color_env;
}

void Config::set_color_enabled(bool enabled) noexcept {
    color_enabled_ = enabled;
}

bool Config::color_enabled() const noexcept {
    return color_enabled_;
}

} // namespace gstree

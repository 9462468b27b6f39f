#pragma once

namespace gstree::platform {

bool stdout_supports_color();
bool color_disabled_by_env();

} // namespace gstree::platform

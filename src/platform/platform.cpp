#include "gstree/platform.h"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace gstree::platform {

bool stdout_supports_color() {
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    if (::GetFileType(handle) != FILE_TYPE_CHAR) {
        return false;
    }
    SetConsoleOutputCP(CP_UTF8);
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return false;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
    return true;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

// https://no-color.org: any value, even empty, counts.
bool color_disabled_by_env() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace gstree::platform

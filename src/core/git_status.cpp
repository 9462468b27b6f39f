#include "gstree/git_status.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "gstree/logger.h"

namespace gstree {
namespace {
#ifndef _WIN32
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}
#else
using popen_handle = std::unique_ptr<FILE, decltype(&_pclose)>;
popen_handle make_pipe(const std::string& command) {
    return popen_handle(_popen(command.c_str(), "rb"), _pclose);
}
#endif

int close_pipe(popen_handle pipe) {
    FILE* raw = pipe.release();
#ifndef _WIN32
    const int status = ::pclose(raw);
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
#else
    return _pclose(raw);
#endif
}

} // namespace

UpstreamProducerError::UpstreamProducerError(const std::string& what, int exit_code)
    : std::runtime_error{what}, exit_code_{exit_code} {}

std::string shell_quote(const std::string& argument) {
#ifndef _WIN32
    std::string result = "'";
    for (char ch : argument) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
#else
    std::string result = "\"";
    for (char ch : argument) {
        if (ch == '"') {
            result += "\\\"";
        } else {
            result += ch;
        }
    }
    result += "\"";
    return result;
#endif
}

GitStatusReader::GitStatusReader(std::optional<std::filesystem::path> repository)
    : repository_{std::move(repository)} {}

std::string GitStatusReader::command_line(const std::vector<std::string>& extra_args) const {
    std::string command = "git";
    if (repository_) {
        command += " -C " + shell_quote(repository_->string());
    }
    command += " status --porcelain=v2 -z";
    for (const auto& arg : extra_args) {
        command += ' ';
        command += shell_quote(arg);
    }
    return command;
}

std::string GitStatusReader::read(const std::vector<std::string>& extra_args) const {
    const std::string command = command_line(extra_args);
    Logger::instance().debug("running {}", command);

    std::fflush(nullptr);
    auto pipe = make_pipe(command);
    if (!pipe) {
        throw UpstreamProducerError{std::format("failed to run git: {}", std::strerror(errno)), 1};
    }

    std::array<char, 4096> buffer{};
    std::string output;
    while (true) {
        std::size_t bytes = std::fread(buffer.data(), 1, buffer.size(), pipe.get());
        if (bytes == 0) {
            break;
        }
        output.append(buffer.data(), bytes);
    }
    const bool read_failed = std::ferror(pipe.get()) != 0;

    const int exit_code = close_pipe(std::move(pipe));
    if (read_failed) {
        throw UpstreamProducerError{"failed to read git output", 1};
    }
    if (exit_code != 0) {
        throw UpstreamProducerError{std::format("git status exited with status {}", exit_code),
                                    exit_code > 0 ? exit_code : 1};
    }

    Logger::instance().debug("git status produced {} bytes", output.size());
    return output;
}

std::string read_stream(std::istream& input) {
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw InputError{"failed to read status input"};
    }
    return buffer.str();
}

std::string read_input(const std::filesystem::path& path) {
    if (path == "-") {
        return read_stream(std::cin);
    }

    std::ifstream file{path, std::ios::binary};
    if (!file) {
        std::error_code ec{errno, std::generic_category()};
        throw InputError{std::format("cannot open {}: {}", path.string(), ec.message())};
    }
    return read_stream(file);
}

} // namespace gstree

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gstree {

// git could not be started, or `git status` exited with a failure. git has
// already written its own diagnostics to stderr by then.
class UpstreamProducerError : public std::runtime_error {
public:
    UpstreamProducerError(const std::string& what, int exit_code);

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class GitStatusReader {
public:
    explicit GitStatusReader(std::optional<std::filesystem::path> repository = std::nullopt);

    // `git [-C dir] status --porcelain=v2 -z <extra_args...>`, shell quoted.
    std::string command_line(const std::vector<std::string>& extra_args) const;

    // Runs git and returns everything it wrote to stdout.
    std::string read(const std::vector<std::string>& extra_args) const;

private:
    std::optional<std::filesystem::path> repository_;
};

std::string shell_quote(const std::string& argument);

std::string read_stream(std::istream& input);

// "-" reads standard input.
std::string read_input(const std::filesystem::path& path);

} // namespace gstree

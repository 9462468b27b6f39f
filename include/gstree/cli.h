#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gstree/config.h"

namespace gstree {

class Cli {
public:
    Cli();
    ~Cli();

    // Throws CLI::ParseError (including CLI::CallForHelp) on bad input;
    // callers turn it into an exit code with exit().
    Config::Options parse(int argc, char** argv);
    int exit(const CLI::Error& error) const;

    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    void add_output_options();
    void add_source_options();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::string color_when_{"auto"};
    std::string log_level_{"error"};
    std::string repository_;
    std::string input_;
    std::vector<OptionDoc> docs_;
};

} // namespace gstree

#include "gstree/cli.tpp"

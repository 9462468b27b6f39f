#include "gstree/cli.h"

#include <sstream>
#include <utility>

#include "gstree/config.h"
#include "gstree/logger.h"

#ifndef GSTREE_VERSION
#define GSTREE_VERSION "0.0.0"
#endif

namespace gstree {

namespace {
constexpr std::string_view kDescription =
    "gstree: show `git status` as a colorized tree grouped by directory";

Config::ColorMode parse_color_mode(const std::string& value) {
    if (value == "always") {
        return Config::ColorMode::Always;
    }
    if (value == "never") {
        return Config::ColorMode::Never;
    }
    return Config::ColorMode::Auto;
}
} // namespace

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "gstree")} {
    app_->set_version_flag("--version", GSTREE_VERSION);
    app_->allow_extras();
    app_->footer(R"(Arguments gstree does not recognize are passed to `git status` unchanged,
for example `gstree --ignored` or `gstree -- src/`. The status is always
requested as --porcelain=v2 -z. Short flags such as -v reach git as well.

Colors are used when standard output is a terminal and NO_COLOR is unset,
unless --color says otherwise.

Exit status:
 0  if OK,
 1  if the status output could not be read or parsed,
 N  the exit status of git when `git status` fails.)");

    add_output_options();
    add_source_options();

    auto* log_level = app_->add_option("--log-level", log_level_, "Log verbosity (error, warn, info, debug, trace)");
    log_level->check(CLI::IsMember({"error", "warn", "warning", "info", "debug", "trace"}));
    log_level->capture_default_str();
    document_option(log_level);

    auto* dump = app_->add_flag("--dump-markdown", options_.dump_markdown, "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Cli::~Cli() = default;

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    auto* color = output->add_option("--color", color_when_, "When to use colors (auto, always, never)");
    color->check(CLI::IsMember({"auto", "always", "never"}));
    color->type_name("WHEN");
    color->capture_default_str();
    document_option(color);

    document_option(output->add_flag_callback("--no-color", [&]() { color_when_ = "never"; },
                                              "Disable ANSI colors"));

    document_option(output->add_flag("-z,--zero", options_.zero_terminate, "Terminate lines with NUL"));

    document_option(output->add_flag("-q,--hide-control-chars", options_.hide_control_chars,
                                     "Print ? instead of control characters in file names"));
}

void Cli::add_source_options() {
    auto source = app_->add_option_group("Source");

    auto* directory = source->add_option("-C,--directory", repository_, "Run git as if started in DIR");
    directory->type_name("DIR");
    directory->check(CLI::ExistingDirectory);
    document_option(directory);

    auto* input = source->add_option("-i,--input", input_,
                                     "Read `git status --porcelain=v2 -z` output from FILE (- for stdin)");
    input->type_name("FILE");
    document_option(input);

    directory->excludes(input);
}

Config::Options Cli::parse(int argc, char** argv) {
    options_ = Config::Options{};
    color_when_ = "auto";
    log_level_ = "error";
    repository_.clear();
    input_.clear();

    app_->parse(argc, argv);

    options_.color = parse_color_mode(color_when_);
    if (auto level = Logger::parse_level(log_level_)) {
        options_.log_level = *level;
    }
    if (!repository_.empty()) {
        options_.repository = std::filesystem::path{repository_};
    }
    if (!input_.empty()) {
        options_.input = std::filesystem::path{input_};
    }
    options_.git_args = app_->remaining();
    return options_;
}

int Cli::exit(const CLI::Error& error) const {
    return app_->exit(error);
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | "
            << (doc.default_value.empty() ? "" : doc.default_value) << " |\n";
    }
    out << '\n';
    return out.str();
}

} // namespace gstree

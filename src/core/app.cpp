#include "gstree/app.h"

#include <iostream>
#include <memory>
#include <string>

#include "gstree/cli.h"
#include "gstree/config.h"
#include "gstree/git_status.h"
#include "gstree/logger.h"
#include "gstree/pipeline.h"
#include "gstree/platform.h"
#include "gstree/status_parser.h"

namespace gstree {

class App::Impl {
public:
    explicit Impl(std::ostream& out)
        : out_{out} {}

    int run(int argc, char** argv) {
        Cli cli;
        Config::Options options;
        try {
            options = cli.parse(argc, argv);
        } catch (const CLI::ParseError& ex) {
            return cli.exit(ex);
        }

        auto& logger = Logger::instance();
        logger.set_level(options.log_level);

        auto& config = Config::instance();
        config.set_color_enabled(Config::color_wanted(options.color, platform::stdout_supports_color(),
                                                      platform::color_disabled_by_env()));

        if (options.dump_markdown) {
            out_ << cli.usage_markdown();
            return 0;
        }

        const bool use_color = config.color_enabled();
        logger.debug("color output {}", use_color ? "enabled" : "disabled");

        try {
            std::string raw;
            if (options.input) {
                logger.debug("reading status from {}", options.input->string());
                raw = read_input(*options.input);
            } else {
                GitStatusReader reader{options.repository};
                raw = reader.read(options.git_args);
            }
            render_status(raw, options, use_color, out_);
        } catch (const MalformedRecordError& ex) {
            logger.error("{}", ex.what());
            return 1;
        } catch (const UpstreamProducerError& ex) {
            logger.error("{}", ex.what());
            return ex.exit_code();
        } catch (const InputError& ex) {
            logger.error("{}", ex.what());
            return 1;
        }

        out_.flush();
        return 0;
    }

private:
    std::ostream& out_;
};

App::App()
    : App{std::cout} {}

App::App(std::ostream& out)
    : impl_{std::make_unique<Impl>(out)} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

} // namespace gstree

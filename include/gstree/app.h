#pragma once

#include <iosfwd>
#include <memory>

namespace gstree {

class App {
public:
    App();
    // Tree lines and --dump-markdown go to `out`; diagnostics stay on std::clog.
    explicit App(std::ostream& out);
    ~App();
    int run(int argc, char** argv);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gstree

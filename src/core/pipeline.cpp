#include "gstree/pipeline.h"

#include "gstree/perf.h"
#include "gstree/renderer.h"
#include "gstree/status_entry.h"
#include "gstree/status_parser.h"
#include "gstree/status_tree.h"
#include "gstree/theme.h"

namespace gstree {

void render_status(std::string_view raw, const Config::Options& options, bool use_color, std::ostream& out) {
    StatusMap statuses;
    {
        perf::ScopedTimer timer{"parse"};
        statuses = collect_statuses(raw);
    }

    StatusTree tree;
    {
        perf::ScopedTimer timer{"build"};
        tree = build_tree(sort_entries(statuses));
    }

    perf::ScopedTimer timer{"render"};
    Theme theme{use_color};
    Renderer renderer{options, theme, out};
    renderer.render(tree);
}

} // namespace gstree

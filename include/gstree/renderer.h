#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "gstree/config.h"
#include "gstree/status_tree.h"
#include "gstree/theme.h"

namespace gstree {

class Renderer {
public:
    Renderer(const Config::Options& options, const Theme& theme, std::ostream& output);

    void render(const StatusTree& tree) const;

    // One string per node, without line terminators.
    std::vector<std::string> lines(const StatusTree& tree) const;

private:
    void walk(const StatusTree& tree, StatusTree::NodeId id, const std::string& indent, bool is_root,
              bool last_sibling, std::vector<std::string>& out) const;
    std::string format_node(const TreeNode& node) const;

    const Config::Options& options_;
    const Theme& theme_;
    std::ostream& out_;
};

} // namespace gstree

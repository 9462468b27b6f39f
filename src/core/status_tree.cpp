#include "gstree/status_tree.h"

#include <utility>

#include "gstree/logger.h"

namespace gstree {

void StatusTree::add(const StatusEntry& entry) {
    // git only reports directories with `--ignored` or `-unormal`, and always
    // with a trailing slash. Such a directory carries its own status.
    if (!entry.path.empty() && entry.path.back() == '/') {
        mark_directory(entry);
        return;
    }

    const auto slash = entry.path.rfind('/');
    std::optional<NodeId> parent;
    std::string name = entry.path;
    if (slash != std::string::npos) {
        parent = ensure_directory(std::string_view{entry.path}.substr(0, slash));
        name = entry.path.substr(slash + 1);
    }

    const NodeId id = make_node(std::move(name), TreeNode::Kind::Entry, parent);
    nodes_[id].status = entry.status;
    nodes_[id].rename_source = entry.rename_source;
}

void StatusTree::mark_directory(const StatusEntry& entry) {
    std::string_view prefix{entry.path};
    prefix.remove_suffix(1);

    const NodeId id = ensure_directory(prefix);
    TreeNode& node = nodes_[id];
    if (node.name.back() != '/') {
        node.name.push_back('/');
    }
    node.status = entry.status;
    node.rename_source = entry.rename_source;
    Logger::instance().trace("directory {} reported as {}", entry.path, entry.status);
}

StatusTree::NodeId StatusTree::ensure_directory(std::string_view prefix) {
    if (auto existing = find_directory(prefix)) {
        return *existing;
    }

    std::optional<NodeId> parent;
    std::size_t start = 0;
    while (true) {
        const auto slash = prefix.find('/', start);
        const auto end = slash == std::string_view::npos ? prefix.size() : slash;
        std::string key{prefix.substr(0, end)};

        auto it = directories_.find(key);
        if (it == directories_.end()) {
            const NodeId id =
                make_node(std::string{prefix.substr(start, end - start)}, TreeNode::Kind::Directory, parent);
            it = directories_.emplace(std::move(key), id).first;
        }
        parent = it->second;

        if (slash == std::string_view::npos) {
            return *parent;
        }
        start = slash + 1;
    }
}

std::optional<StatusTree::NodeId> StatusTree::find_directory(std::string_view prefix) const {
    auto it = directories_.find(std::string{prefix});
    if (it == directories_.end()) {
        return std::nullopt;
    }
    return it->second;
}

StatusTree::NodeId StatusTree::make_node(std::string name, TreeNode::Kind kind, std::optional<NodeId> parent) {
    const NodeId id = nodes_.size();
    TreeNode node;
    node.name = std::move(name);
    node.kind = kind;
    nodes_.push_back(std::move(node));

    if (parent) {
        nodes_[*parent].children.push_back(id);
    } else {
        roots_.push_back(id);
    }
    return id;
}

StatusTree build_tree(const std::vector<StatusEntry>& sorted_entries) {
    StatusTree tree;
    for (const auto& entry : sorted_entries) {
        tree.add(entry);
    }
    Logger::instance().debug("built tree with {} nodes and {} roots", tree.size(), tree.roots().size());
    return tree;
}

} // namespace gstree

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gstree/status_entry.h"

namespace gstree {

struct TreeNode {
    enum class Kind {
        Directory,
        Entry
    };

    std::string name;
    Kind kind = Kind::Entry;
    // Empty for directories that only exist because something below them changed.
    std::optional<std::string> status;
    std::optional<std::string> rename_source;
    // Indices into the owning StatusTree, in insertion order.
    std::vector<std::size_t> children;

    bool is_plain_directory() const noexcept { return kind == Kind::Directory && !status; }
};

class StatusTree {
public:
    using NodeId = std::size_t;

    void add(const StatusEntry& entry);

    // Returns the node for a directory prefix such as "src/core", creating it
    // and any missing ancestors. Existing nodes are returned untouched.
    NodeId ensure_directory(std::string_view prefix);

    std::optional<NodeId> find_directory(std::string_view prefix) const;

    const TreeNode& node(NodeId id) const { return nodes_.at(id); }
    const std::vector<NodeId>& roots() const noexcept { return roots_; }
    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }

private:
    NodeId make_node(std::string name, TreeNode::Kind kind, std::optional<NodeId> parent);
    void mark_directory(const StatusEntry& entry);

    std::vector<TreeNode> nodes_;
    std::vector<NodeId> roots_;
    std::unordered_map<std::string, NodeId> directories_;
};

StatusTree build_tree(const std::vector<StatusEntry>& sorted_entries);

} // namespace gstree

#include "gstree/renderer.h"

#include <cctype>
#include <ostream>

namespace gstree {
namespace {

constexpr std::string_view kBranch = "├── ";
constexpr std::string_view kLastBranch = "└── ";
constexpr std::string_view kPipe = "│   ";
constexpr std::string_view kBlank = "    ";

char newline_char(const Config::Options& options) {
    return options.zero_terminate ? '\0' : '\n';
}

std::string sanitize_name(std::string_view input, bool hide_control) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        if (hide_control && std::iscntrl(ch) && ch != '\t') {
            result.push_back('?');
        } else {
            result.push_back(static_cast<char>(ch));
        }
    }
    return result;
}

} // namespace

Renderer::Renderer(const Config::Options& options, const Theme& theme, std::ostream& output)
    : options_{options}, theme_{theme}, out_{output} {}

void Renderer::render(const StatusTree& tree) const {
    const char nl = newline_char(options_);
    for (const auto& line : lines(tree)) {
        out_ << line << nl;
    }
}

std::vector<std::string> Renderer::lines(const StatusTree& tree) const {
    std::vector<std::string> out;
    out.reserve(tree.size());
    const auto& roots = tree.roots();
    for (std::size_t i = 0; i < roots.size(); ++i) {
        walk(tree, roots[i], std::string{}, true, i + 1 == roots.size(), out);
    }
    return out;
}

void Renderer::walk(const StatusTree& tree, StatusTree::NodeId id, const std::string& indent, bool is_root,
                    bool last_sibling, std::vector<std::string>& out) const {
    const TreeNode& node = tree.node(id);

    std::string prefix;
    std::string child_indent;
    if (!is_root) {
        prefix = indent + std::string{last_sibling ? kLastBranch : kBranch};
        child_indent = indent + std::string{last_sibling ? kBlank : kPipe};
    }
    out.push_back(prefix + format_node(node));

    for (std::size_t i = 0; i < node.children.size(); ++i) {
        walk(tree, node.children[i], child_indent, false, i + 1 == node.children.size(), out);
    }
}

std::string Renderer::format_node(const TreeNode& node) const {
    std::string name = sanitize_name(node.name, options_.hide_control_chars);
    if (!node.status) {
        return name + "/";
    }

    std::string line = theme_.status(*node.status);
    line.push_back(' ');
    if (node.rename_source) {
        line += sanitize_name(*node.rename_source, options_.hide_control_chars);
        line += " -> ";
    }
    line += name;
    return line;
}

} // namespace gstree

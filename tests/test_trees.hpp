#pragma once

#include "sway/tree.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

// Small builders for hand-written trees.
namespace test_trees {

inline Node leaf(int64_t id, bool focused = false) {
    Node n;
    n.id = id;
    n.name = "win" + std::to_string(id);
    n.focused = focused;
    return n;
}

inline Node con(int64_t id, Layout layout, std::vector<Node> children, std::vector<int64_t> focus = {}) {
    Node n;
    n.id = id;
    n.layout = layout;
    n.nodes = std::move(children);
    n.focus = std::move(focus);
    return n;
}

// root -> output -> workspace(layout) -> children, the shape sway reports.
inline Tree workspace_tree(Layout layout, std::vector<Node> children) {
    Node ws = con(3, layout, std::move(children));
    ws.type = NodeType::Workspace;
    Node output = con(2, Layout::Output, {std::move(ws)});
    output.type = NodeType::Output;
    Node root = con(1, Layout::SplitH, {std::move(output)});
    root.type = NodeType::Root;
    return Tree(std::move(root));
}

} // namespace test_trees

#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// i3 adds a dockarea node (type and layout) beside each output's content.
enum class NodeType { Root, Output, Workspace, Con, FloatingCon, Dockarea };

enum class Layout { None, SplitH, SplitV, Stacked, Tabbed, Output, Dockarea };

enum class Orientation { None, Horizontal, Vertical };

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const Rect&) const = default;
};

// One element of the GET_TREE reply, see sway-ipc(7).
struct Node {
    int64_t id = 0;
    std::string name;
    NodeType type = NodeType::Con;
    Layout layout = Layout::None;
    Orientation orientation = Orientation::None;
    Rect rect;
    bool focused = false;
    std::vector<int64_t> focus;        // child ids, most recently focused first
    std::vector<Node> nodes;           // tiling children
    std::vector<Node> floating_nodes;  // searched after the tiling children
    std::string app_id;                // views only
    int pid = 0;                       // views only

    bool is_leaf() const { return nodes.empty() && floating_nodes.empty(); }

    // Index of `child` in nodes, or -1 if it is not a tiling child.
    int index_of(const Node& child) const;
    bool is_floating_child(const Node& child) const;

    // Most recently focused tiling child, nullptr if the history names none.
    const Node* last_focused_child() const;
};

std::string_view to_string(NodeType type);
std::string_view to_string(Layout layout);

// Sequence of nodes from the root down to (and including) a target node.
using NodePath = std::vector<const Node*>;

class Tree {
public:
    explicit Tree(Node root) : root_(std::move(root)) {}

    // Decode a GET_TREE reply payload.
    static std::expected<Tree, Error> parse(const std::string& payload);
    static std::expected<Tree, Error> from_json(const nlohmann::json& j);

    const Node& root() const { return root_; }

    std::expected<NodePath, Error> find_focused() const;
    const Node* find(int64_t id) const;
    const Node* parent_of(int64_t id) const;

    size_t size() const;

private:
    Node root_;
};

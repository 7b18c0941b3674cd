#include "tree.hpp"

#include <algorithm>
#include <optional>

using json = nlohmann::json;

namespace {

std::optional<NodeType> node_type_from(const std::string& s) {
    if (s == "root") return NodeType::Root;
    if (s == "output") return NodeType::Output;
    if (s == "workspace") return NodeType::Workspace;
    if (s == "con") return NodeType::Con;
    if (s == "floating_con") return NodeType::FloatingCon;
    if (s == "dockarea") return NodeType::Dockarea;
    return std::nullopt;
}

std::optional<Layout> layout_from(const std::string& s) {
    if (s == "none") return Layout::None;
    if (s == "splith") return Layout::SplitH;
    if (s == "splitv") return Layout::SplitV;
    if (s == "stacked") return Layout::Stacked;
    if (s == "tabbed") return Layout::Tabbed;
    if (s == "output") return Layout::Output;
    if (s == "dockarea") return Layout::Dockarea;
    return std::nullopt;
}

std::optional<Orientation> orientation_from(const std::string& s) {
    if (s == "none") return Orientation::None;
    if (s == "horizontal") return Orientation::Horizontal;
    if (s == "vertical") return Orientation::Vertical;
    return std::nullopt;
}

// sway sends null for absent strings (e.g. "name" of the scratchpad parent).
std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::string>();
}

std::string parse_children(const json& j, const char* key, std::vector<Node>& out);

std::expected<Node, std::string> parse_node(const json& j) {
    if (!j.is_object()) return std::unexpected("node is not an object");
    if (!j.contains("id")) return std::unexpected("node without id");

    Node node;
    node.id = j.at("id").get<int64_t>();
    node.name = string_or_empty(j, "name");
    node.app_id = string_or_empty(j, "app_id");
    if (j.contains("pid") && !j["pid"].is_null()) node.pid = j["pid"].get<int>();
    node.focused = j.value("focused", false);

    if (j.contains("type")) {
        auto s = j["type"].get<std::string>();
        auto type = node_type_from(s);
        if (!type) return std::unexpected("node " + std::to_string(node.id) + ": unknown type '" + s + "'");
        node.type = *type;
    }
    if (j.contains("layout")) {
        auto s = j["layout"].get<std::string>();
        auto layout = layout_from(s);
        if (!layout) return std::unexpected("node " + std::to_string(node.id) + ": unknown layout '" + s + "'");
        node.layout = *layout;
    }
    if (j.contains("orientation")) {
        auto s = j["orientation"].get<std::string>();
        auto orientation = orientation_from(s);
        if (!orientation)
            return std::unexpected("node " + std::to_string(node.id) + ": unknown orientation '" + s + "'");
        node.orientation = *orientation;
    }

    if (j.contains("rect")) {
        auto& r = j["rect"];
        node.rect.x = r.at("x").get<int>();
        node.rect.y = r.at("y").get<int>();
        node.rect.width = r.at("width").get<int>();
        node.rect.height = r.at("height").get<int>();
    }

    if (j.contains("focus")) node.focus = j["focus"].get<std::vector<int64_t>>();

    if (auto err = parse_children(j, "nodes", node.nodes); !err.empty()) return std::unexpected(err);
    if (auto err = parse_children(j, "floating_nodes", node.floating_nodes); !err.empty())
        return std::unexpected(err);

    return node;
}

std::string parse_children(const json& j, const char* key, std::vector<Node>& out) {
    if (!j.contains(key)) return {};
    for (auto& child : j[key]) {
        auto parsed = parse_node(child);
        if (!parsed) return parsed.error();
        out.push_back(std::move(*parsed));
    }
    return {};
}

bool find_path(const Node& node, int64_t id, NodePath& path) {
    path.push_back(&node);
    if (node.id == id) return true;
    for (auto& child : node.nodes)
        if (find_path(child, id, path)) return true;
    for (auto& child : node.floating_nodes)
        if (find_path(child, id, path)) return true;
    path.pop_back();
    return false;
}

bool find_focused_path(const Node& node, NodePath& path) {
    path.push_back(&node);
    if (node.focused) return true;
    for (auto& child : node.nodes)
        if (find_focused_path(child, path)) return true;
    for (auto& child : node.floating_nodes)
        if (find_focused_path(child, path)) return true;
    path.pop_back();
    return false;
}

size_t count_nodes(const Node& node) {
    size_t n = 1;
    for (auto& child : node.nodes) n += count_nodes(child);
    for (auto& child : node.floating_nodes) n += count_nodes(child);
    return n;
}

} // namespace

int Node::index_of(const Node& child) const {
    for (size_t i = 0; i < nodes.size(); ++i)
        if (&nodes[i] == &child) return static_cast<int>(i);
    return -1;
}

bool Node::is_floating_child(const Node& child) const {
    return std::any_of(floating_nodes.begin(), floating_nodes.end(),
                       [&](const Node& n) { return &n == &child; });
}

const Node* Node::last_focused_child() const {
    // focus also lists floating children; take the first tiling one.
    for (auto id : focus) {
        for (auto& child : nodes)
            if (child.id == id) return &child;
    }
    return nullptr;
}

std::string_view to_string(NodeType type) {
    switch (type) {
    case NodeType::Root: return "root";
    case NodeType::Output: return "output";
    case NodeType::Workspace: return "workspace";
    case NodeType::Con: return "con";
    case NodeType::FloatingCon: return "floating_con";
    case NodeType::Dockarea: return "dockarea";
    }
    return "unknown";
}

std::string_view to_string(Layout layout) {
    switch (layout) {
    case Layout::None: return "none";
    case Layout::SplitH: return "splith";
    case Layout::SplitV: return "splitv";
    case Layout::Stacked: return "stacked";
    case Layout::Tabbed: return "tabbed";
    case Layout::Output: return "output";
    case Layout::Dockarea: return "dockarea";
    }
    return "unknown";
}

std::expected<Tree, Error> Tree::parse(const std::string& payload) {
    try {
        return from_json(json::parse(payload));
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::MalformedTree, std::string("tree is not valid JSON: ") + e.what()});
    }
}

std::expected<Tree, Error> Tree::from_json(const json& j) {
    try {
        auto root = parse_node(j);
        if (!root) return std::unexpected(Error{ErrorKind::MalformedTree, root.error()});
        return Tree(std::move(*root));
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::MalformedTree, e.what()});
    }
}

std::expected<NodePath, Error> Tree::find_focused() const {
    NodePath path;
    if (!find_focused_path(root_, path))
        return std::unexpected(Error{ErrorKind::NoFocusedWindow, "no focused node in tree"});
    return path;
}

const Node* Tree::find(int64_t id) const {
    NodePath path;
    if (!find_path(root_, id, path)) return nullptr;
    return path.back();
}

const Node* Tree::parent_of(int64_t id) const {
    NodePath path;
    if (!find_path(root_, id, path) || path.size() < 2) return nullptr;
    return path[path.size() - 2];
}

size_t Tree::size() const {
    return count_nodes(root_);
}

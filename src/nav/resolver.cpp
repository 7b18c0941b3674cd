#include "resolver.hpp"

#include <format>

SpatialResolver::SpatialResolver(ResolverOptions options, TraceCallback trace)
    : options_(options), trace_(std::move(trace)) {}

std::expected<ResolutionResult, Error> SpatialResolver::resolve(const Tree& tree, Direction dir) const {
    auto path = tree.find_focused();
    if (!path) return std::unexpected(path.error());

    const Node* child = path->back();
    trace(std::format("focused node {} ({}), moving {}", child->id, child->name, to_string(dir)));

    int parent_levels = 0;

    // Walk the ancestors from the focused node's parent up to its workspace.
    for (size_t i = path->size() - 1; i-- > 0;) {
        const Node& parent = *(*path)[i];

        if (parent.type == NodeType::Root || parent.type == NodeType::Output || parent.type == NodeType::Dockarea)
            break;

        if (parent.is_floating_child(*child)) {
            trace(std::format("node {} is floating", child->id));
            return ResolutionResult::passthrough(parent_levels);
        }

        auto axis = spatial_axis(parent.layout);
        if (axis && *axis == axis_of(dir)) {
            int idx = parent.index_of(*child);
            int next = is_forward(dir) ? idx + 1 : idx - 1;
            if (idx >= 0 && next >= 0 && next < static_cast<int>(parent.nodes.size())) {
                const Node& target = descend(parent.nodes[next], dir);
                trace(std::format("neighbor {} under {} {}, focusing {}",
                                  parent.nodes[next].id, to_string(parent.layout), parent.id, target.id));
                return ResolutionResult::override_to(target.id);
            }
            trace(std::format("{} {}: no neighbor at the edge", to_string(parent.layout), parent.id));
        } else if (is_skipped(parent.layout)) {
            trace(std::format("{} {}: skipped", to_string(parent.layout), parent.id));
            parent_levels = static_cast<int>(path->size() - 1 - i);
        } else {
            trace(std::format("{} {}: other axis", to_string(parent.layout), parent.id));
        }

        if (parent.type == NodeType::Workspace) break;
        child = &parent;
    }

    if (parent_levels > 0) {
        trace(std::format("no neighbor inside the workspace, leaving {} levels up", parent_levels));
        return ResolutionResult::passthrough(parent_levels);
    }
    trace("no neighbor inside the workspace");
    return ResolutionResult::passthrough();
}

std::optional<Axis> SpatialResolver::spatial_axis(Layout layout) const {
    switch (layout) {
    case Layout::SplitH: return Axis::Horizontal;
    case Layout::SplitV: return Axis::Vertical;
    case Layout::Tabbed:
        if (options_.skip_tabbed) return std::nullopt;
        return Axis::Horizontal;
    case Layout::Stacked:
        if (options_.skip_stacked) return std::nullopt;
        return Axis::Vertical;
    case Layout::None:
    case Layout::Output:
    case Layout::Dockarea:
        return std::nullopt;
    }
    return std::nullopt;
}

bool SpatialResolver::is_skipped(Layout layout) const {
    return (layout == Layout::Tabbed && options_.skip_tabbed) || (layout == Layout::Stacked && options_.skip_stacked);
}

const Node& SpatialResolver::descend(const Node& target, Direction dir) const {
    const Node* node = &target;
    while (!node->nodes.empty()) {
        const Node* next = nullptr;
        switch (node->layout) {
        case Layout::SplitH:
        case Layout::SplitV:
            if (spatial_axis(node->layout) == axis_of(dir)) {
                // Enter at the edge facing the origin.
                next = is_forward(dir) ? &node->nodes.front() : &node->nodes.back();
                break;
            }
            [[fallthrough]];
        default:
            // Tabbed/stacked show their last focused child; with no
            // history recorded we take the first one.
            next = node->last_focused_child();
            if (!next) next = &node->nodes.front();
            break;
        }
        node = next;
    }
    return *node;
}

void SpatialResolver::trace(const std::string& msg) const {
    if (trace_) trace_(msg);
}

#pragma once

#include "error.hpp"
#include "nav/direction.hpp"
#include "sway/tree.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

// Either a window to focus instead of the window manager's default, or
// Passthrough: let `focus <direction>` do its usual thing.
struct ResolutionResult {
    enum class Kind { Override, Passthrough };

    Kind kind = Kind::Passthrough;
    int64_t target_id = 0;
    // Passthrough only: how many `focus parent` steps lift focus to the
    // outermost tabbed/stacked container the walk skipped, so that the
    // native command cannot land on a tab sibling. 0 when nothing was skipped.
    int parent_levels = 0;

    static ResolutionResult override_to(int64_t id) { return {Kind::Override, id}; }
    static ResolutionResult passthrough(int levels = 0) { return {Kind::Passthrough, 0, levels}; }

    bool is_override() const { return kind == Kind::Override; }
    bool operator==(const ResolutionResult&) const = default;
};

struct ResolverOptions {
    // A skipped layout's children are not directional neighbors. When not
    // skipped, tabbed behaves like splith and stacked like splitv.
    bool skip_tabbed = true;
    bool skip_stacked = true;
};

class SpatialResolver {
public:
    using TraceCallback = std::function<void(const std::string&)>;

    explicit SpatialResolver(ResolverOptions options, TraceCallback trace = nullptr);

    std::expected<ResolutionResult, Error> resolve(const Tree& tree, Direction dir) const;

private:
    // Axis along which `layout` lays its children out, nullopt when the
    // children are not spatial neighbors.
    std::optional<Axis> spatial_axis(Layout layout) const;
    bool is_skipped(Layout layout) const;

    // Pick the leaf that receives focus when entering `target` moving in `dir`.
    const Node& descend(const Node& target, Direction dir) const;

    void trace(const std::string& msg) const;

    ResolverOptions options_;
    TraceCallback trace_;
};

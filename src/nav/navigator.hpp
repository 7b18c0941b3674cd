#pragma once

#include "error.hpp"
#include "nav/direction.hpp"
#include "nav/resolver.hpp"
#include "platform/window_manager.hpp"

#include <expected>
#include <string>

class FocusNavigator {
public:
    FocusNavigator(WindowManager& wm, ResolverOptions options, bool verbose = false);

    FocusNavigator(const FocusNavigator&) = delete;
    FocusNavigator& operator=(const FocusNavigator&) = delete;

    // Print the command instead of sending it.
    void set_dry_run(bool dry_run) { dry_run_ = dry_run; }

    // Fetch the tree, resolve `dir` and send the focus command.
    // Returns the command that was (or, in dry-run mode, would be) sent.
    std::expected<std::string, Error> focus(Direction dir);

private:
    void log(const std::string& msg);

    WindowManager& wm_;
    bool verbose_;
    bool dry_run_ = false;
    SpatialResolver resolver_;
};

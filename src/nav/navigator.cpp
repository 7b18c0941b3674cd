#include "navigator.hpp"

#include "nav/command.hpp"

#include <format>
#include <print>

FocusNavigator::FocusNavigator(WindowManager& wm, ResolverOptions options, bool verbose)
    : wm_(wm),
      verbose_(verbose),
      resolver_(options, [this](const std::string& msg) { log(msg); }) {}

std::expected<std::string, Error> FocusNavigator::focus(Direction dir) {
    auto tree = wm_.get_tree();
    if (!tree) return std::unexpected(tree.error());
    log(std::format("tree has {} nodes", tree->size()));

    auto result = resolver_.resolve(*tree, dir);
    if (!result) return std::unexpected(result.error());

    auto command = focus_command(*result, dir);
    if (dry_run_) {
        std::println("{}", command);
        return command;
    }

    log("sending: " + command);
    auto sent = emit_focus(wm_, *result, dir);
    if (!sent) return std::unexpected(sent.error());
    return command;
}

void FocusNavigator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[haswaynav] {}", msg);
    }
}

#include "command.hpp"

#include <format>

std::string focus_command(const ResolutionResult& result, Direction dir) {
    if (result.is_override()) return std::format("[con_id={}] focus", result.target_id);

    std::string command;
    for (int i = 0; i < result.parent_levels; ++i) command += "focus parent; ";
    return command + std::format("focus {}", to_string(dir));
}

std::expected<void, Error> emit_focus(WindowManager& wm, const ResolutionResult& result, Direction dir) {
    auto results = wm.run_command(focus_command(result, dir));
    if (!results) return std::unexpected(results.error());
    return check_command_results(*results);
}

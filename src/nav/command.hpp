#pragma once

#include "error.hpp"
#include "nav/direction.hpp"
#include "nav/resolver.hpp"
#include "platform/window_manager.hpp"

#include <expected>
#include <string>

// `[con_id=<id>] focus` for an override, `focus <direction>` otherwise.
// A passthrough that skipped tabbed/stacked levels first climbs to the
// outermost of them: `focus parent; ...; focus <direction>`.
std::string focus_command(const ResolutionResult& result, Direction dir);

// Send the command built from `result` and check the window manager's reply.
// Exactly one RUN_COMMAND, never retried.
std::expected<void, Error> emit_focus(WindowManager& wm, const ResolutionResult& result, Direction dir);

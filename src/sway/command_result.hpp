#pragma once

#include "error.hpp"

#include <expected>
#include <string>
#include <vector>

// One entry of the RUN_COMMAND reply.
struct CommandResult {
    bool success = false;
    bool parse_error = false;
    std::string error;
};

std::expected<std::vector<CommandResult>, Error> parse_command_results(const std::string& payload);

// First failure among the results as a CommandRejected error, if any.
std::expected<void, Error> check_command_results(const std::vector<CommandResult>& results);

#pragma once

#include "error.hpp"
#include "sway/command_result.hpp"
#include "sway/tree.hpp"

#include <expected>
#include <string>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual std::expected<void, Error> connect(const std::string& socket_path) = 0;
    virtual std::expected<Tree, Error> get_tree() = 0;
    virtual std::expected<std::vector<CommandResult>, Error> run_command(const std::string& command) = 0;
};

#include "command_result.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<std::vector<CommandResult>, Error> parse_command_results(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_array())
            return std::unexpected(Error{ErrorKind::ConnectionFailed, "command reply is not an array"});

        std::vector<CommandResult> results;
        for (auto& r : j) {
            CommandResult result;
            result.success = r.at("success").get<bool>();
            result.parse_error = r.value("parse_error", false);
            if (r.contains("error") && !r["error"].is_null()) result.error = r["error"].get<std::string>();
            results.push_back(std::move(result));
        }
        return results;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed, std::string("bad command reply: ") + e.what()});
    }
}

std::expected<void, Error> check_command_results(const std::vector<CommandResult>& results) {
    for (auto& r : results) {
        if (r.success) continue;
        std::string msg = r.parse_error ? "command could not be parsed" : "command failed";
        if (!r.error.empty()) msg += ": " + r.error;
        return std::unexpected(Error{ErrorKind::CommandRejected, msg});
    }
    return {};
}

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("socket")) cfg.socket = j["socket"].get<std::string>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();

        if (j.contains("navigation")) {
            auto& n = j["navigation"];
            if (n.contains("skip_tabbed")) cfg.navigation.skip_tabbed = n["skip_tabbed"].get<bool>();
            if (n.contains("skip_stacked")) cfg.navigation.skip_stacked = n["skip_stacked"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

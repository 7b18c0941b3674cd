#pragma once

#include <string>

struct Config {
    // Empty means discover from $SWAYSOCK / $I3SOCK.
    std::string socket;
    bool verbose = false;

    struct Navigation {
        bool skip_tabbed = true;
        bool skip_stacked = true;
    } navigation;

    static Config load(const std::string& path);
    static Config load_default();
};

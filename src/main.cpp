#include "config.hpp"
#include "nav/direction.hpp"
#include "nav/navigator.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/platform_paths.hpp"

#include <print>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} focus <left|right|up|down> [options]", prog);
    std::println(stderr, "Move focus in a direction, skipping tabbed and stacked siblings.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -s, --socket PATH   Window manager IPC socket (default: $SWAYSOCK, $I3SOCK)");
    std::println(stderr, "  -n, --dry-run       Print the focus command instead of sending it");
    std::println(stderr, "  -v, --verbose       Trace the resolution on stderr");
    std::println(stderr, "  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string direction_arg;
    std::string config_path;
    std::string socket_path;
    bool verbose = false;
    bool dry_run = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            dry_run = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--socket" || arg == "-s") && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else if (direction_arg.empty()) {
            direction_arg = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 2;
        }
    }

    if (command != "focus") {
        if (!command.empty()) std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 2;
    }

    auto dir = parse_direction(direction_arg);
    if (!dir) {
        std::println(stderr, "Invalid direction '{}', expected left, right, up or down", direction_arg);
        return 2;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (verbose) config.verbose = true;
    if (!socket_path.empty()) config.socket = socket_path;
    if (config.socket.empty()) config.socket = platform::ipc_socket();

    SwayWindowManager wm;
    if (auto connected = wm.connect(config.socket); !connected) {
        std::println(stderr, "haswaynav: {}: {}", to_string(connected.error().kind), connected.error().message);
        return 1;
    }

    ResolverOptions options;
    options.skip_tabbed = config.navigation.skip_tabbed;
    options.skip_stacked = config.navigation.skip_stacked;

    FocusNavigator navigator(wm, options, config.verbose);
    navigator.set_dry_run(dry_run);

    auto sent = navigator.focus(*dir);
    if (!sent) {
        std::println(stderr, "haswaynav: {}: {}", to_string(sent.error().kind), sent.error().message);
        return 1;
    }
    return 0;
}

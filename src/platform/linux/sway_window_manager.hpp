#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <string>

// i3-ipc client, works against both sway and i3.
class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager();
    // Adopt an already connected socket.
    explicit SwayWindowManager(int fd);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    std::expected<void, Error> connect(const std::string& socket_path) override;
    std::expected<Tree, Error> get_tree() override;
    std::expected<std::vector<CommandResult>, Error> run_command(const std::string& command) override;

    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t HEADER_SIZE = 14;
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;
    // Replies above this are treated as a corrupt header.
    static constexpr uint32_t MAX_PAYLOAD = 64 * 1024 * 1024;

private:
    // Send one message and read the reply, which must carry the same type.
    std::expected<std::string, Error> round_trip(uint32_t type, const std::string& payload);

    bool send_message(uint32_t type, const std::string& payload);
    bool recv_message(uint32_t& type, std::string& payload);

    int fd_ = -1;
};

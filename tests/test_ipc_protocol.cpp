#include <catch2/catch_test_macros.hpp>

#include "platform/linux/sway_window_manager.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

struct Frame {
    uint32_t type = 0;
    std::string payload;
};

bool read_exact(int fd, char* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(fd, buf + total, len - total, 0);
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool read_frame(int fd, Frame& frame) {
    char header[14];
    if (!read_exact(fd, header, sizeof(header))) return false;
    if (std::memcmp(header, "i3-ipc", 6) != 0) return false;
    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&frame.type, header + 10, 4);
    frame.payload.resize(len);
    return read_exact(fd, frame.payload.data(), len);
}

void write_frame(int fd, uint32_t type, const std::string& payload, const char* magic = "i3-ipc") {
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string msg(magic, 6);
    msg.append(reinterpret_cast<const char*>(&len), 4);
    msg.append(reinterpret_cast<const char*>(&type), 4);
    msg += payload;
    ::send(fd, msg.data(), msg.size(), MSG_NOSIGNAL);
}

// One end of a socketpair handed to the client, the other played by a fake
// window manager thread.
struct FakeWindowManager {
    int client_fd = -1;
    int server_fd = -1;

    FakeWindowManager() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);
        client_fd = fds[0];
        server_fd = fds[1];
    }

    ~FakeWindowManager() { ::close(server_fd); }
};

const std::string small_tree = R"({"id": 1, "type": "root", "nodes": [
    {"id": 2, "type": "con", "layout": "none", "focused": true}
]})";

} // namespace

TEST_CASE("Sway IPC protocol", "[ipc]") {
    FakeWindowManager fake;
    SwayWindowManager wm(fake.client_fd);

    SECTION("GetTreeRoundTrip") {
        Frame request;
        std::jthread server([&] {
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_GET_TREE, small_tree);
        });

        auto tree = wm.get_tree();
        server.join();

        REQUIRE(request.type == SwayWindowManager::MSG_GET_TREE);
        REQUIRE(request.payload.empty());
        REQUIRE(tree.has_value());
        REQUIRE(tree->root().nodes[0].id == 2);
    }

    SECTION("RunCommandRoundTrip") {
        Frame request;
        std::jthread server([&] {
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_RUN_COMMAND, R"([{"success": true}])");
        });

        auto results = wm.run_command("[con_id=2] focus");
        server.join();

        REQUIRE(request.type == SwayWindowManager::MSG_RUN_COMMAND);
        REQUIRE(request.payload == "[con_id=2] focus");
        REQUIRE(results.has_value());
        REQUIRE(results->size() == 1);
        REQUIRE((*results)[0].success);
    }

    SECTION("LargeReplyArrivesWhole") {
        std::string names(5000, 'x');
        std::string big = R"({"id": 1, "name": ")" + names + R"(", "focused": true})";

        std::jthread server([&] {
            Frame request;
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_GET_TREE, big);
        });

        auto tree = wm.get_tree();
        server.join();
        REQUIRE(tree.has_value());
        REQUIRE(tree->root().name.size() == 5000);
    }

    SECTION("MalformedTreePayload") {
        std::jthread server([&] {
            Frame request;
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_GET_TREE, "{\"id\": ");
        });

        auto tree = wm.get_tree();
        server.join();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().kind == ErrorKind::MalformedTree);
    }

    SECTION("WrongReplyType") {
        std::jthread server([&] {
            Frame request;
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_RUN_COMMAND, "[]");
        });

        auto tree = wm.get_tree();
        server.join();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().kind == ErrorKind::ConnectionFailed);
    }

    SECTION("BadMagic") {
        std::jthread server([&] {
            Frame request;
            if (read_frame(fake.server_fd, request))
                write_frame(fake.server_fd, SwayWindowManager::MSG_GET_TREE, small_tree, "xx-ipc");
        });

        auto tree = wm.get_tree();
        server.join();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().kind == ErrorKind::ConnectionFailed);
    }

    SECTION("OversizedReplyLength") {
        std::jthread server([&] {
            Frame request;
            if (!read_frame(fake.server_fd, request)) return;
            // Header only: the client must give up before reading a payload.
            uint32_t len = SwayWindowManager::MAX_PAYLOAD + 1;
            uint32_t type = SwayWindowManager::MSG_GET_TREE;
            std::string header("i3-ipc", 6);
            header.append(reinterpret_cast<const char*>(&len), 4);
            header.append(reinterpret_cast<const char*>(&type), 4);
            ::send(fake.server_fd, header.data(), header.size(), MSG_NOSIGNAL);
        });

        auto tree = wm.get_tree();
        server.join();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().kind == ErrorKind::ConnectionFailed);
    }

    SECTION("PeerClosedBeforeReply") {
        std::jthread server([&] {
            Frame request;
            read_frame(fake.server_fd, request);
            ::shutdown(fake.server_fd, SHUT_RDWR);
        });

        auto results = wm.run_command("focus left");
        server.join();
        REQUIRE_FALSE(results.has_value());
        REQUIRE(results.error().kind == ErrorKind::ConnectionFailed);
    }
}

TEST_CASE("Sway IPC connect", "[ipc]") {

    SECTION("EmptySocketPath") {
        SwayWindowManager wm;
        auto connected = wm.connect("");
        REQUIRE_FALSE(connected.has_value());
        REQUIRE(connected.error().kind == ErrorKind::ConnectionFailed);
        REQUIRE(connected.error().message.find("SWAYSOCK") != std::string::npos);
    }

    SECTION("NonexistentSocket") {
        SwayWindowManager wm;
        auto connected = wm.connect("/tmp/hsn_test_no_such_socket_" + std::to_string(getpid()));
        REQUIRE_FALSE(connected.has_value());
        REQUIRE(connected.error().kind == ErrorKind::ConnectionFailed);
    }

    SECTION("SocketPathTooLong") {
        SwayWindowManager wm;
        auto connected = wm.connect("/tmp/" + std::string(200, 's') + ".sock");
        REQUIRE_FALSE(connected.has_value());
        REQUIRE(connected.error().kind == ErrorKind::ConnectionFailed);
        REQUIRE(connected.error().message.find("too long") != std::string::npos);
    }

    SECTION("NotConnected") {
        SwayWindowManager wm;
        auto tree = wm.get_tree();
        REQUIRE_FALSE(tree.has_value());
        REQUIRE(tree.error().kind == ErrorKind::ConnectionFailed);
    }
}

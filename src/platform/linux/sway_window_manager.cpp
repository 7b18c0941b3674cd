#include "platform/linux/sway_window_manager.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayWindowManager::SwayWindowManager() = default;

SwayWindowManager::SwayWindowManager(int fd) : fd_(fd) {}

SwayWindowManager::~SwayWindowManager() {
    if (fd_ >= 0) ::close(fd_);
}

std::expected<void, Error> SwayWindowManager::connect(const std::string& socket_path) {
    if (socket_path.empty()) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            "no window manager socket: neither SWAYSOCK nor I3SOCK is set"});
    }

    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            "socket path too long (" + std::to_string(socket_path.size()) + " bytes, at most " +
            std::to_string(sizeof(addr.sun_path) - 1) + "): " + socket_path});
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            std::string("socket() failed: ") + std::strerror(errno)});
    }

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            "failed opening socket '" + socket_path + "': " + std::strerror(err)});
    }

    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
    return {};
}

std::expected<Tree, Error> SwayWindowManager::get_tree() {
    auto payload = round_trip(MSG_GET_TREE, "");
    if (!payload) return std::unexpected(payload.error());
    return Tree::parse(*payload);
}

std::expected<std::vector<CommandResult>, Error> SwayWindowManager::run_command(const std::string& command) {
    auto payload = round_trip(MSG_RUN_COMMAND, command);
    if (!payload) return std::unexpected(payload.error());
    return parse_command_results(*payload);
}

std::expected<std::string, Error> SwayWindowManager::round_trip(uint32_t type, const std::string& payload) {
    if (fd_ < 0) return std::unexpected(Error{ErrorKind::ConnectionFailed, "not connected"});

    if (!send_message(type, payload)) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            std::string("sending message failed: ") + std::strerror(errno)});
    }

    uint32_t reply_type = 0;
    std::string reply;
    if (!recv_message(reply_type, reply)) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed, "reading reply failed"});
    }
    if (reply_type != type) {
        return std::unexpected(Error{ErrorKind::ConnectionFailed,
            "wrong reply type, expected " + std::to_string(type) + " but got " + std::to_string(reply_type)});
    }
    return reply;
}

bool SwayWindowManager::send_message(uint32_t type, const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[HEADER_SIZE];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, HEADER_SIZE, MSG_NOSIGNAL) != static_cast<ssize_t>(HEADER_SIZE)) return false;

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, payload.data() + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool SwayWindowManager::recv_message(uint32_t& type, std::string& payload) {
    char header[HEADER_SIZE];
    size_t read_total = 0;
    while (read_total < HEADER_SIZE) {
        ssize_t n = ::recv(fd_, header + read_total, HEADER_SIZE - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) {
        std::println(stderr, "sway: bad magic in reply header");
        return false;
    }

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    if (len > MAX_PAYLOAD) {
        std::println(stderr, "sway: reply length {} exceeds {} bytes", len, MAX_PAYLOAD);
        return false;
    }

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}

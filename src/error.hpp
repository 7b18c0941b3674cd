#pragma once

#include <string>
#include <string_view>

enum class ErrorKind { NoFocusedWindow, ConnectionFailed, MalformedTree, CommandRejected };

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NoFocusedWindow: return "no focused window";
    case ErrorKind::ConnectionFailed: return "connection failed";
    case ErrorKind::MalformedTree: return "malformed tree";
    case ErrorKind::CommandRejected: return "command rejected";
    }
    return "unknown error";
}

#include "direction.hpp"

std::optional<Direction> parse_direction(std::string_view s) {
    if (s == "left") return Direction::Left;
    if (s == "right") return Direction::Right;
    if (s == "up") return Direction::Up;
    if (s == "down") return Direction::Down;
    return std::nullopt;
}

std::string_view to_string(Direction dir) {
    switch (dir) {
    case Direction::Left: return "left";
    case Direction::Right: return "right";
    case Direction::Up: return "up";
    case Direction::Down: return "down";
    }
    return "left";
}

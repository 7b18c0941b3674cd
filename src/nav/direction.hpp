#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class Direction { Left, Right, Up, Down };

enum class Axis { Horizontal, Vertical };

std::optional<Direction> parse_direction(std::string_view s);
std::string_view to_string(Direction dir);

inline Axis axis_of(Direction dir) {
    return (dir == Direction::Left || dir == Direction::Right) ? Axis::Horizontal : Axis::Vertical;
}

// Right and down move toward higher coordinates.
inline bool is_forward(Direction dir) {
    return dir == Direction::Right || dir == Direction::Down;
}

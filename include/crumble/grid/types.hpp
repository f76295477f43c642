// Crumble Grid System
// types.hpp - Coordinates, directions and tile states

#pragma once

#include <fmt/format.h>
#include <glm/glm.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace crumble::grid {

// ============================================================================
// Coordinates
// ============================================================================

// Grid cell position. x grows to the right, y grows upwards; (0, 0) is the
// bottom-left cell of a level.
using Coordinate = glm::ivec2;

[[nodiscard]] inline std::string coordinate_to_string(const Coordinate& coord) {
    return fmt::format("({}, {})", coord.x, coord.y);
}

// ============================================================================
// Directions
// ============================================================================

// Declaration order is also the neighbor wiring order
enum class CardinalDirection : uint8_t {
    Up = 0,
    Left = 1,
    Down = 2,
    Right = 3,
    Count = 4
};

inline constexpr int CARDINAL_DIRECTION_COUNT = 4;
inline constexpr int ALL_DIRECTION_COUNT = 8;

inline constexpr glm::ivec2 CARDINAL_OFFSETS[CARDINAL_DIRECTION_COUNT] = {{0, 1}, {-1, 0}, {0, -1}, {1, 0}};

// Cardinals followed by the corners (up-left, down-left, down-right, up-right)
inline constexpr glm::ivec2 ALL_OFFSETS[ALL_DIRECTION_COUNT] = {{0, 1},  {-1, 0},  {0, -1}, {1, 0},
                                                                {-1, 1}, {-1, -1}, {1, -1}, {1, 1}};

[[nodiscard]] inline glm::ivec2 direction_offset(CardinalDirection dir) {
    return CARDINAL_OFFSETS[static_cast<uint8_t>(dir)];
}

[[nodiscard]] inline CardinalDirection opposite(CardinalDirection dir) {
    return static_cast<CardinalDirection>((static_cast<uint8_t>(dir) + 2) % CARDINAL_DIRECTION_COUNT);
}

[[nodiscard]] inline const char* direction_to_string(CardinalDirection dir) {
    switch (dir) {
        case CardinalDirection::Up:
            return "Up";
        case CardinalDirection::Left:
            return "Left";
        case CardinalDirection::Down:
            return "Down";
        case CardinalDirection::Right:
            return "Right";
        default:
            return "Unknown";
    }
}

// True when a is one of the eight cells surrounding b
[[nodiscard]] inline bool coordinates_are_adjacent(const Coordinate& a, const Coordinate& b) {
    for (const auto& offset : ALL_OFFSETS) {
        if (a == b + offset) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Tile State Machine
// ============================================================================

// Active <-> Highlighted while in play; Destroyed and Fallen are terminal and
// entered through collapse; Void is assigned at build time only.
enum class TileState : uint8_t {
    Active,
    Highlighted,
    Destroyed,  // Hit directly
    Fallen,     // Lost support or was cut off
    Void        // Present in the layout but never part of play
};

[[nodiscard]] inline bool is_terminal(TileState state) {
    return state == TileState::Destroyed || state == TileState::Fallen || state == TileState::Void;
}

[[nodiscard]] inline const char* tile_state_to_string(TileState state) {
    switch (state) {
        case TileState::Active:
            return "Active";
        case TileState::Highlighted:
            return "Highlighted";
        case TileState::Destroyed:
            return "Destroyed";
        case TileState::Fallen:
            return "Fallen";
        case TileState::Void:
            return "Void";
        default:
            return "Unknown";
    }
}

}  // namespace crumble::grid

// ============================================================================
// Hash for using coordinates as map keys
// ============================================================================

namespace std {

template <>
struct hash<crumble::grid::Coordinate> {
    size_t operator()(const crumble::grid::Coordinate& coord) const noexcept {
        size_t h1 = std::hash<int32_t>{}(coord.x);
        size_t h2 = std::hash<int32_t>{}(coord.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std

// Crumble Grid System
// level_layout.hpp - Text level layouts consumed by Grid::build

#pragma once

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace crumble::grid {

enum class CellKind : uint8_t {
    Tile,  // '.', 'P', 'E'
    Void   // '#'
};

enum class SpawnKind : uint8_t {
    Player,  // 'P'
    Enemy    // 'E'
};

struct SpawnPoint {
    Coordinate coordinate{0, 0};
    SpawnKind kind = SpawnKind::Enemy;
};

// Rectangular layout, one text line per row. The first line is the top row
// (y = height - 1) so the text reads the way the level looks from above.
// Blank lines are ignored, every row must have the same width.
class LevelLayout {
public:
    static constexpr char GLYPH_TILE = '.';
    static constexpr char GLYPH_VOID = '#';
    static constexpr char GLYPH_PLAYER = 'P';
    static constexpr char GLYPH_ENEMY = 'E';

    // A width x height layout of plain tiles
    LevelLayout(int32_t width, int32_t height);

    [[nodiscard]] static std::optional<LevelLayout> parse(std::string_view text);
    [[nodiscard]] static std::optional<LevelLayout> load(const std::filesystem::path& path);

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }

    [[nodiscard]] bool contains(const Coordinate& coord) const;

    // Cells outside the layout read as Void
    [[nodiscard]] CellKind cell(const Coordinate& coord) const;
    void set_cell(const Coordinate& coord, CellKind kind);

    [[nodiscard]] const std::vector<SpawnPoint>& spawns() const { return spawns_; }
    [[nodiscard]] std::optional<Coordinate> player_spawn() const;

private:
    [[nodiscard]] size_t index(const Coordinate& coord) const {
        return static_cast<size_t>(coord.y) * static_cast<size_t>(width_) + static_cast<size_t>(coord.x);
    }

    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<CellKind> cells_;
    std::vector<SpawnPoint> spawns_;
};

}  // namespace crumble::grid

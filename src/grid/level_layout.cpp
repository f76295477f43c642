// Crumble Grid System
// level_layout.cpp - Text level layout parsing

#include <algorithm>
#include <crumble/core/logger.hpp>
#include <crumble/grid/level_layout.hpp>
#include <crumble/platform/file_io.hpp>
#include <string>

namespace crumble::grid {

LevelLayout::LevelLayout(int32_t width, int32_t height)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      cells_(static_cast<size_t>(width_) * static_cast<size_t>(height_), CellKind::Tile) {}

std::optional<LevelLayout> LevelLayout::parse(std::string_view text) {
    std::vector<std::string_view> rows;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            rows.push_back(line);
        }

        start = end + 1;
    }

    if (rows.empty()) {
        CRUMBLE_LOG_ERROR(core::log_category::LEVEL, "Level layout is empty");
        return std::nullopt;
    }

    const auto width = static_cast<int32_t>(rows.front().size());
    const auto height = static_cast<int32_t>(rows.size());
    LevelLayout layout(width, height);

    for (int32_t row = 0; row < height; ++row) {
        std::string_view line = rows[static_cast<size_t>(row)];
        if (static_cast<int32_t>(line.size()) != width) {
            CRUMBLE_LOG_ERROR(core::log_category::LEVEL, "Level layout row {} has width {}, expected {}", row,
                              line.size(), width);
            return std::nullopt;
        }

        // First text row is the top of the level
        const int32_t y = height - 1 - row;
        for (int32_t x = 0; x < width; ++x) {
            const Coordinate coord(x, y);
            const char glyph = line[static_cast<size_t>(x)];

            switch (glyph) {
                case GLYPH_TILE:
                    break;
                case GLYPH_VOID:
                    layout.set_cell(coord, CellKind::Void);
                    break;
                case GLYPH_PLAYER:
                    layout.spawns_.push_back({coord, SpawnKind::Player});
                    break;
                case GLYPH_ENEMY:
                    layout.spawns_.push_back({coord, SpawnKind::Enemy});
                    break;
                default:
                    CRUMBLE_LOG_ERROR(core::log_category::LEVEL, "Unknown glyph '{}' at {}", glyph,
                                      coordinate_to_string(coord));
                    return std::nullopt;
            }
        }
    }

    return layout;
}

std::optional<LevelLayout> LevelLayout::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        CRUMBLE_LOG_ERROR(core::log_category::LEVEL, "Failed to read level layout: {}", path.string());
        return std::nullopt;
    }

    auto layout = parse(*content);
    if (layout) {
        CRUMBLE_LOG_INFO(core::log_category::LEVEL, "Loaded {}x{} level from {}", layout->width(), layout->height(),
                         path.string());
    }
    return layout;
}

bool LevelLayout::contains(const Coordinate& coord) const {
    return coord.x >= 0 && coord.x < width_ && coord.y >= 0 && coord.y < height_;
}

CellKind LevelLayout::cell(const Coordinate& coord) const {
    return contains(coord) ? cells_[index(coord)] : CellKind::Void;
}

void LevelLayout::set_cell(const Coordinate& coord, CellKind kind) {
    if (contains(coord)) {
        cells_[index(coord)] = kind;
    }
}

std::optional<Coordinate> LevelLayout::player_spawn() const {
    for (const auto& spawn : spawns_) {
        if (spawn.kind == SpawnKind::Player) {
            return spawn.coordinate;
        }
    }
    return std::nullopt;
}

}  // namespace crumble::grid

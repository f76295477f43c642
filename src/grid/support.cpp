// Crumble Grid System
// support.cpp - Support ray casting

#include <algorithm>
#include <crumble/grid/support.hpp>

namespace crumble::grid {

SupportAnalyzer::SupportAnalyzer(const Grid& grid, int min_support) : grid_(grid), min_support_(1) {
    set_min_support(min_support);
}

bool SupportAnalyzer::is_supported(const Tile& tile) const {
    if (!tile.is_available()) {
        return false;
    }
    return supported_sides(tile) >= min_support_;
}

int SupportAnalyzer::supported_sides(const Tile& tile) const {
    const SupportRays rays = cast_rays(tile);
    return static_cast<int>(std::count(rays.begin(), rays.end(), true));
}

SupportRays SupportAnalyzer::cast_rays(const Tile& tile) const {
    SupportRays rays{};
    for (int dir = 0; dir < CARDINAL_DIRECTION_COUNT; ++dir) {
        rays[static_cast<size_t>(dir)] = is_side_supported(tile, static_cast<CardinalDirection>(dir));
    }
    return rays;
}

bool SupportAnalyzer::is_side_supported(const Tile& tile, CardinalDirection dir) const {
    const glm::ivec2 step = direction_offset(dir);
    Coordinate coord = tile.coordinate() + step;

    while (const Tile* next = grid_.tile_at(coord)) {
        if (!next->is_available()) {
            return false;
        }
        coord += step;
    }

    // Walked off the grid
    return true;
}

void SupportAnalyzer::set_min_support(int min_support) {
    min_support_ = std::clamp(min_support, 1, CARDINAL_DIRECTION_COUNT);
}

}  // namespace crumble::grid

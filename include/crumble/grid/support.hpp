// Crumble Grid System
// support.hpp - Structural support test along cardinal rays

#pragma once

#include "grid.hpp"
#include "tile.hpp"

#include <array>

namespace crumble::grid {

// Per-direction outcome of a support ray, indexed by CardinalDirection
using SupportRays = std::array<bool, CARDINAL_DIRECTION_COUNT>;

// A side supports a tile when walking from it along that direction crosses
// only available tiles before leaving the grid; the grid edge is load
// bearing, any unavailable tile on the way breaks the side. A tile is
// supported when at least min_support sides hold.
class SupportAnalyzer {
public:
    static constexpr int DEFAULT_MIN_SUPPORT = 1;

    explicit SupportAnalyzer(const Grid& grid, int min_support = DEFAULT_MIN_SUPPORT);

    // Unavailable tiles are never supported
    [[nodiscard]] bool is_supported(const Tile& tile) const;

    [[nodiscard]] int supported_sides(const Tile& tile) const;
    [[nodiscard]] SupportRays cast_rays(const Tile& tile) const;
    [[nodiscard]] bool is_side_supported(const Tile& tile, CardinalDirection dir) const;

    // Clamped to [1, 4]
    void set_min_support(int min_support);
    [[nodiscard]] int min_support() const { return min_support_; }

private:
    const Grid& grid_;
    int min_support_;
};

}  // namespace crumble::grid

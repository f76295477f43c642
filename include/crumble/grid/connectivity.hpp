// Crumble Grid System
// connectivity.hpp - Flood fills over the tile neighbor graph

#pragma once

#include "tile.hpp"

#include <functional>
#include <vector>

namespace crumble::grid {

// A land mass or destroyed footprint, in visit order
using TileRegion = std::vector<Tile*>;

using TilePredicate = std::function<bool(const Tile&)>;

// Depth-first fill over neighbor links, visiting neighbors in wiring order.
// Collects every tile matching the predicate that is reachable from the seed
// by at least one step through matching tiles. The seed is not pre-visited:
// it appears in the result only when it matches and one of its matching
// neighbors leads back to it. Iterative, each tile is visited at most once.
[[nodiscard]] TileRegion flood_fill(Tile& seed, const TilePredicate& predicate);

// Land mass around a tile: available tiles reachable from it. Empty when the
// tile has no available neighbor.
[[nodiscard]] TileRegion reachable_available(Tile& from);

// Destroyed footprint around a tile: unavailable tiles reachable from it
[[nodiscard]] TileRegion reachable_unavailable(Tile& from);

// Same membership and same size, order ignored
[[nodiscard]] bool same_region(const TileRegion& a, const TileRegion& b);

[[nodiscard]] bool region_contains(const TileRegion& region, const Tile* tile);

}  // namespace crumble::grid

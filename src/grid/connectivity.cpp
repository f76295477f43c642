// Crumble Grid System
// connectivity.cpp - Flood fill implementation

#include <algorithm>
#include <crumble/grid/connectivity.hpp>
#include <stack>
#include <unordered_set>

namespace crumble::grid {

TileRegion flood_fill(Tile& seed, const TilePredicate& predicate) {
    TileRegion region;
    std::unordered_set<const Tile*> visited;
    std::stack<Tile*> pending;

    // Pushed in reverse so tiles pop in wiring order, matching a recursive
    // pre-order walk
    auto push_neighbors = [&pending](const Tile& tile) {
        const auto& neighbors = tile.neighbors();
        for (auto it = neighbors.rbegin(); it != neighbors.rend(); ++it) {
            pending.push(*it);
        }
    };

    push_neighbors(seed);

    while (!pending.empty()) {
        Tile* current = pending.top();
        pending.pop();

        if (visited.count(current) > 0 || !predicate(*current)) {
            continue;
        }

        visited.insert(current);
        region.push_back(current);
        push_neighbors(*current);
    }

    return region;
}

TileRegion reachable_available(Tile& from) {
    return flood_fill(from, [](const Tile& tile) { return tile.is_available(); });
}

TileRegion reachable_unavailable(Tile& from) {
    return flood_fill(from, [](const Tile& tile) { return !tile.is_available(); });
}

bool same_region(const TileRegion& a, const TileRegion& b) {
    if (a.size() != b.size()) {
        return false;
    }

    std::unordered_set<const Tile*> members(a.begin(), a.end());
    return std::all_of(b.begin(), b.end(), [&members](const Tile* tile) { return members.count(tile) > 0; });
}

bool region_contains(const TileRegion& region, const Tile* tile) {
    return tile != nullptr && std::find(region.begin(), region.end(), tile) != region.end();
}

}  // namespace crumble::grid

// Crumble Grid System
// grid.hpp - Coordinate-indexed tile map for one level

#pragma once

#include <crumble/core/core.hpp>

#include "level_layout.hpp"
#include "tile.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace crumble::grid {

// ============================================================================
// Grid
// ============================================================================

// Owns every Tile of the current level. Built once (place tiles, then wire
// neighbors) and discarded as a whole on reload; destruction only changes
// tile state, tiles are never removed.
class Grid {
public:
    // Highlight changes are reported to effects; null reports nowhere
    explicit Grid(collapse::IEffectsSink* effects = nullptr);
    ~Grid();

    // Non-copyable, non-movable (tiles point at each other)
    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;
    Grid(Grid&&) = delete;
    Grid& operator=(Grid&&) = delete;

    // ========================================================================
    // Build
    // ========================================================================

    // Fully Active width x height rectangle, wired
    bool build(int32_t width, int32_t height);

    // Tiles for every layout cell (Void cells become Void tiles), wired
    bool build(const LevelLayout& layout);

    // Build-time only: rejected after wire_neighbors() or for negative
    // coordinates. Initial state must be Active or Void.
    Tile* place_tile(const Coordinate& coord, TileState initial_state = TileState::Active);

    // Links each tile to the tiles at its four cardinal offsets. Needs the
    // full tile set; safe to call again, links are recomputed from scratch.
    void wire_neighbors();

    [[nodiscard]] bool is_wired() const;

    // Drops every tile
    void clear();

    void set_effects_sink(collapse::IEffectsSink* effects);

    // Seeds the generator behind random_available_tile (0 = random_device)
    void seed_random(uint32_t seed);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] Tile* tile_at(const Coordinate& coord);
    [[nodiscard]] const Tile* tile_at(const Coordinate& coord) const;

    // True when a tile exists at coord and is available (and empty if asked)
    [[nodiscard]] bool is_available_at(const Coordinate& coord, bool must_be_empty = true) const;

    // Extent of the placed tiles: x in [0, width), y in [0, height)
    [[nodiscard]] int32_t width() const;
    [[nodiscard]] int32_t height() const;

    [[nodiscard]] size_t tile_count() const;
    [[nodiscard]] size_t available_count() const;

    // Placement order
    void for_each_tile(const std::function<void(const Tile&)>& callback) const;

    // ========================================================================
    // Highlighting
    // ========================================================================

    // Returns the previous highlights that are still available to Active,
    // then highlights every available, empty tile in the eight cells around
    // coord. Every state change goes to the effects sink.
    void highlight_around(const Coordinate& coord);
    void clear_highlights();

    [[nodiscard]] const std::vector<Tile*>& highlighted() const;

    // ========================================================================
    // Wandering Destinations
    // ========================================================================

    // Uniform pick among the land mass around coord, or among the whole grid
    // when that land mass is empty (or there is no tile at coord). Returns
    // nullptr, logging an error, when no tile is available at all.
    [[nodiscard]] Tile* random_available_tile(const Coordinate& near);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace crumble::grid

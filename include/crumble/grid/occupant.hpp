// Crumble Grid System
// occupant.hpp - Capability interface for bodies standing on tiles

#pragma once

namespace crumble::grid {

// Anything that can stand on a tile (player, enemies, props). Tiles only ever
// see occupants through this interface. Bodies that only die with their tile
// keep the hit-related defaults.
class IOccupant {
public:
    virtual ~IOccupant() = default;

    // Whether a hit aimed at the occupant's tile lands on the occupant instead
    [[nodiscard]] virtual bool is_hittable() const { return false; }

    [[nodiscard]] virtual bool can_be_hit() const { return false; }
    virtual void on_hit() {}
    [[nodiscard]] virtual bool hit_processed() const { return true; }

    // Called when the tile under the occupant drops
    virtual void trigger_death_by_fall() = 0;
};

}  // namespace crumble::grid

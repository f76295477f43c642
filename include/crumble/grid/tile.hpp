// Crumble Grid System
// tile.hpp - Per-cell state machine, neighbor links and occupant tracking

#pragma once

#include <crumble/core/core.hpp>

#include "occupant.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace crumble::grid {

// A single grid cell. Owned by its Grid; neighbor pointers never outlive it.
// State and neighbor mutation is reserved to the Grid (build, highlighting)
// and the CollapseSystem (destroy/fall); everything else reads.
class Tile {
public:
    explicit Tile(const Coordinate& coordinate, TileState initial_state = TileState::Active);

    // Neighbors hold raw pointers to this tile
    Tile(const Tile&) = delete;
    Tile& operator=(const Tile&) = delete;
    Tile(Tile&&) = delete;
    Tile& operator=(Tile&&) = delete;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] const Coordinate& coordinate() const { return coordinate_; }
    [[nodiscard]] TileState state() const { return state_; }

    [[nodiscard]] bool is_available() const { return !is_terminal(state_); }
    [[nodiscard]] bool is_available_and_empty() const { return is_available() && occupants_.empty(); }

    // Existing tiles at the four cardinal offsets, in wiring order
    [[nodiscard]] const std::vector<Tile*>& neighbors() const { return neighbors_; }
    [[nodiscard]] bool is_neighbor(const Tile& other) const;

    // ========================================================================
    // Occupants
    // ========================================================================

    // Called by overlap detection; returns false when nothing changed
    bool add_occupant(IOccupant* occupant);
    bool remove_occupant(IOccupant* occupant);

    [[nodiscard]] bool has_occupant(const IOccupant* occupant) const;
    [[nodiscard]] const std::vector<IOccupant*>& occupants() const { return occupants_; }

    // ========================================================================
    // Hit Handling
    // ========================================================================

    // Available and within one cell (eight-way) of the player. Re-arms the hit
    // acknowledgment when it returns true.
    [[nodiscard]] bool can_be_hit(const Coordinate& player_coordinate);

    // True once the acknowledgment deadline has passed
    [[nodiscard]] bool hit_processed(core::Seconds now) const;
    [[nodiscard]] const std::optional<core::Seconds>& acknowledge_at() const { return acknowledge_at_; }

private:
    friend class Grid;
    friend class collapse::CollapseSystem;

    // Refuses to leave a terminal state and to enter Void; returns whether the
    // state changed
    bool set_state(TileState state);

    void add_neighbor(Tile* neighbor);
    void clear_neighbors() { neighbors_.clear(); }

    void start_acknowledgment(core::Seconds deadline) { acknowledge_at_ = deadline; }

    // Empties the occupant set and hands the previous members to the caller
    std::vector<IOccupant*> take_occupants();

    Coordinate coordinate_;
    TileState state_;
    std::vector<Tile*> neighbors_;
    std::vector<IOccupant*> occupants_;
    std::optional<core::Seconds> acknowledge_at_;
};

}  // namespace crumble::grid

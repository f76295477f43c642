// Crumble Grid System
// tile.cpp - Tile state machine implementation

#include <algorithm>
#include <crumble/core/logger.hpp>
#include <crumble/grid/tile.hpp>

namespace crumble::grid {

Tile::Tile(const Coordinate& coordinate, TileState initial_state)
    : coordinate_(coordinate), state_(initial_state) {}

bool Tile::is_neighbor(const Tile& other) const {
    return std::find(neighbors_.begin(), neighbors_.end(), &other) != neighbors_.end();
}

bool Tile::add_occupant(IOccupant* occupant) {
    if (!occupant || has_occupant(occupant)) {
        return false;
    }
    occupants_.push_back(occupant);
    return true;
}

bool Tile::remove_occupant(IOccupant* occupant) {
    auto it = std::find(occupants_.begin(), occupants_.end(), occupant);
    if (it == occupants_.end()) {
        return false;
    }
    occupants_.erase(it);
    return true;
}

bool Tile::has_occupant(const IOccupant* occupant) const {
    return std::find(occupants_.begin(), occupants_.end(), occupant) != occupants_.end();
}

bool Tile::can_be_hit(const Coordinate& player_coordinate) {
    bool hittable = is_available() && coordinates_are_adjacent(coordinate_, player_coordinate);
    if (hittable) {
        acknowledge_at_.reset();
    }
    return hittable;
}

bool Tile::hit_processed(core::Seconds now) const {
    return acknowledge_at_.has_value() && now >= *acknowledge_at_;
}

bool Tile::set_state(TileState state) {
    if (state == state_) {
        return false;
    }

    if (is_terminal(state_)) {
        CRUMBLE_LOG_WARN(core::log_category::GRID, "Tile {} is {} and cannot become {}",
                         coordinate_to_string(coordinate_), tile_state_to_string(state_),
                         tile_state_to_string(state));
        return false;
    }

    if (state == TileState::Void) {
        CRUMBLE_LOG_WARN(core::log_category::GRID, "Tile {} cannot become Void after build",
                         coordinate_to_string(coordinate_));
        return false;
    }

    state_ = state;
    return true;
}

void Tile::add_neighbor(Tile* neighbor) {
    if (neighbor && neighbor != this && !is_neighbor(*neighbor)) {
        neighbors_.push_back(neighbor);
    }
}

std::vector<IOccupant*> Tile::take_occupants() {
    std::vector<IOccupant*> taken;
    taken.swap(occupants_);
    return taken;
}

}  // namespace crumble::grid

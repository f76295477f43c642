// Crumble Grid System
// grid.cpp - Tile map implementation

#include <algorithm>
#include <crumble/collapse/effects.hpp>
#include <crumble/core/logger.hpp>
#include <crumble/grid/connectivity.hpp>
#include <crumble/grid/grid.hpp>
#include <random>
#include <unordered_map>

namespace crumble::grid {

// ============================================================================
// Grid Implementation
// ============================================================================

struct Grid::Impl {
    // Placement order, also the order used for whole-grid random picks
    std::vector<std::unique_ptr<Tile>> tiles;
    std::unordered_map<Coordinate, Tile*> index;

    std::vector<Tile*> highlighted;

    collapse::IEffectsSink null_effects;
    collapse::IEffectsSink* effects = &null_effects;

    int32_t width = 0;
    int32_t height = 0;
    bool wired = false;

    std::mt19937 rng{std::random_device{}()};

    Tile* find(const Coordinate& coord) const {
        auto it = index.find(coord);
        return it != index.end() ? it->second : nullptr;
    }

    // Highlight cycle transition, reported like any other state change
    void transition(Tile& tile, TileState state) {
        const TileState old_state = tile.state();
        if (tile.set_state(state)) {
            effects->on_tile_state_changed(tile, old_state);
        }
    }

    bool require_wired(const char* operation) const {
        if (!wired) {
            CRUMBLE_LOG_ERROR(core::log_category::GRID, "{} called before neighbor wiring", operation);
        }
        return wired;
    }
};

Grid::Grid(collapse::IEffectsSink* effects) : impl_(std::make_unique<Impl>()) {
    set_effects_sink(effects);
}

Grid::~Grid() = default;

bool Grid::build(int32_t width, int32_t height) {
    return build(LevelLayout(width, height));
}

bool Grid::build(const LevelLayout& layout) {
    clear();

    if (layout.width() <= 0 || layout.height() <= 0) {
        CRUMBLE_LOG_ERROR(core::log_category::GRID, "Cannot build a {}x{} grid", layout.width(), layout.height());
        return false;
    }

    impl_->tiles.reserve(static_cast<size_t>(layout.width()) * static_cast<size_t>(layout.height()));

    size_t void_count = 0;
    for (int32_t x = 0; x < layout.width(); ++x) {
        for (int32_t y = 0; y < layout.height(); ++y) {
            const Coordinate coord(x, y);
            const bool is_void = layout.cell(coord) == CellKind::Void;
            place_tile(coord, is_void ? TileState::Void : TileState::Active);
            if (is_void) {
                ++void_count;
            }
        }
    }

    wire_neighbors();

    CRUMBLE_LOG_INFO(core::log_category::GRID, "Built {}x{} grid: {} tiles, {} void", impl_->width, impl_->height,
                     impl_->tiles.size(), void_count);
    return true;
}

Tile* Grid::place_tile(const Coordinate& coord, TileState initial_state) {
    if (impl_->wired) {
        CRUMBLE_LOG_ERROR(core::log_category::GRID, "Cannot place tile at {} after neighbor wiring",
                          coordinate_to_string(coord));
        return nullptr;
    }

    if (coord.x < 0 || coord.y < 0) {
        CRUMBLE_LOG_ERROR(core::log_category::GRID, "Tile coordinate {} is negative", coordinate_to_string(coord));
        return nullptr;
    }

    if (initial_state != TileState::Active && initial_state != TileState::Void) {
        CRUMBLE_LOG_ERROR(core::log_category::GRID, "Tile at {} cannot start as {}", coordinate_to_string(coord),
                          tile_state_to_string(initial_state));
        return nullptr;
    }

    if (impl_->index.count(coord) > 0) {
        CRUMBLE_LOG_WARN(core::log_category::GRID, "Tile at {} already placed", coordinate_to_string(coord));
        return impl_->index[coord];
    }

    auto tile = std::make_unique<Tile>(coord, initial_state);
    Tile* raw = tile.get();
    impl_->tiles.push_back(std::move(tile));
    impl_->index.emplace(coord, raw);

    impl_->width = std::max(impl_->width, coord.x + 1);
    impl_->height = std::max(impl_->height, coord.y + 1);

    return raw;
}

void Grid::wire_neighbors() {
    for (auto& tile : impl_->tiles) {
        tile->clear_neighbors();

        for (const auto& offset : CARDINAL_OFFSETS) {
            if (Tile* neighbor = impl_->find(tile->coordinate() + offset)) {
                tile->add_neighbor(neighbor);
            }
        }
    }

    impl_->wired = true;
    CRUMBLE_LOG_DEBUG(core::log_category::GRID, "Wired neighbors for {} tiles", impl_->tiles.size());
}

bool Grid::is_wired() const {
    return impl_->wired;
}

void Grid::clear() {
    impl_->highlighted.clear();
    impl_->index.clear();
    impl_->tiles.clear();
    impl_->width = 0;
    impl_->height = 0;
    impl_->wired = false;
}

void Grid::set_effects_sink(collapse::IEffectsSink* effects) {
    impl_->effects = effects ? effects : &impl_->null_effects;
}

void Grid::seed_random(uint32_t seed) {
    impl_->rng.seed(seed != 0 ? seed : std::random_device{}());
}

Tile* Grid::tile_at(const Coordinate& coord) {
    return impl_->find(coord);
}

const Tile* Grid::tile_at(const Coordinate& coord) const {
    return impl_->find(coord);
}

bool Grid::is_available_at(const Coordinate& coord, bool must_be_empty) const {
    const Tile* tile = impl_->find(coord);
    if (!tile) {
        return false;
    }
    return must_be_empty ? tile->is_available_and_empty() : tile->is_available();
}

int32_t Grid::width() const {
    return impl_->width;
}

int32_t Grid::height() const {
    return impl_->height;
}

size_t Grid::tile_count() const {
    return impl_->tiles.size();
}

size_t Grid::available_count() const {
    return static_cast<size_t>(std::count_if(impl_->tiles.begin(), impl_->tiles.end(),
                                             [](const auto& tile) { return tile->is_available(); }));
}

void Grid::for_each_tile(const std::function<void(const Tile&)>& callback) const {
    for (const auto& tile : impl_->tiles) {
        callback(*tile);
    }
}

void Grid::highlight_around(const Coordinate& coord) {
    if (!impl_->require_wired("highlight_around")) {
        return;
    }

    clear_highlights();

    for (const auto& offset : ALL_OFFSETS) {
        Tile* tile = impl_->find(coord + offset);
        if (tile && tile->is_available_and_empty()) {
            impl_->transition(*tile, TileState::Highlighted);
            impl_->highlighted.push_back(tile);
        }
    }
}

void Grid::clear_highlights() {
    for (Tile* tile : impl_->highlighted) {
        if (tile->is_available()) {
            impl_->transition(*tile, TileState::Active);
        }
    }
    impl_->highlighted.clear();
}

const std::vector<Tile*>& Grid::highlighted() const {
    return impl_->highlighted;
}

Tile* Grid::random_available_tile(const Coordinate& near) {
    if (!impl_->require_wired("random_available_tile")) {
        return nullptr;
    }

    if (available_count() == 0) {
        CRUMBLE_LOG_ERROR(core::log_category::GRID, "random_available_tile: no available tile left on the grid");
        return nullptr;
    }

    std::vector<Tile*> candidates;
    if (Tile* origin = impl_->find(near)) {
        candidates = reachable_available(*origin);
    }

    if (candidates.empty()) {
        candidates.reserve(impl_->tiles.size());
        for (const auto& tile : impl_->tiles) {
            candidates.push_back(tile.get());
        }
    }

    // The whole-grid pool may hold unavailable tiles; at least one is
    // available so the retry loop ends
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    Tile* chosen = nullptr;
    while (!chosen) {
        Tile* candidate = candidates[pick(impl_->rng)];
        if (candidate->is_available()) {
            chosen = candidate;
        }
    }

    return chosen;
}

}  // namespace crumble::grid

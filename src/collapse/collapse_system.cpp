// Crumble Collapse System
// collapse_system.cpp - Tile destruction and cascading collapse implementation

#include <algorithm>
#include <crumble/collapse/collapse_system.hpp>
#include <crumble/core/config.hpp>
#include <crumble/core/logger.hpp>
#include <iterator>
#include <limits>
#include <random>
#include <utility>

namespace crumble::collapse {

// ============================================================================
// CollapseConfig
// ============================================================================

CollapseConfig CollapseConfig::from_config(const core::Config& config) {
    using namespace core::config_key;
    const char* section = core::config_section::COLLAPSE;

    CollapseConfig result;
    result.drop_drag_min = config.get_double(section, DROP_DRAG_MIN, result.drop_drag_min);
    result.drop_drag_max = config.get_double(section, DROP_DRAG_MAX, result.drop_drag_max);
    result.min_support = std::clamp(config.get_int(section, MIN_SUPPORT, result.min_support), 1,
                                    grid::CARDINAL_DIRECTION_COUNT);
    result.big_collapse_threshold = static_cast<uint32_t>(
        std::max(0, config.get_int(section, BIG_COLLAPSE_THRESHOLD, static_cast<int>(result.big_collapse_threshold))));
    result.hit_ack_delay = std::max(0.0, config.get_double(section, HIT_ACK_DELAY, result.hit_ack_delay));

    // Read wide so the full unsigned range survives the JSON round trip
    const double seed = config.get_double(section, RNG_SEED, 0.0);
    if (seed >= 0.0 && seed <= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        result.rng_seed = static_cast<uint32_t>(seed);
    } else {
        CRUMBLE_LOG_WARN(core::log_category::CONFIG, "collapse.rng_seed {} out of range, using a random seed", seed);
    }

    if (result.drop_drag_max < result.drop_drag_min) {
        std::swap(result.drop_drag_min, result.drop_drag_max);
    }

    return result;
}

// ============================================================================
// Implementation Details
// ============================================================================

namespace {

// Stands in when the caller wires no effects
class NullEffectsSink final : public IEffectsSink {};

}  // namespace

struct CollapseSystem::Impl {
    CollapseConfig config;
    bool initialized = false;

    grid::Grid* grid = nullptr;
    platform::Clock* clock = nullptr;
    IEffectsSink* effects = nullptr;
    const IAvatarLocator* avatars = nullptr;

    std::unique_ptr<grid::SupportAnalyzer> support;

    // Used when no clock is supplied
    platform::SteadyClock fallback_clock;
    NullEffectsSink null_effects;

    CollapseCallback collapse_callback;
    Stats stats;

    std::mt19937 rng{std::random_device{}()};

    void apply_config(const CollapseConfig& new_config) {
        config = new_config;
        rng.seed(config.rng_seed != 0 ? config.rng_seed : std::random_device{}());
        if (support) {
            support->set_min_support(config.min_support);
        }
    }

    // Moves an available tile into Destroyed or Fallen and notifies the sink
    bool transition(grid::Tile& tile, grid::TileState state) {
        const grid::TileState old_state = tile.state();
        if (!tile.set_state(state)) {
            return false;
        }
        effects->on_tile_state_changed(tile, old_state);
        return true;
    }

    // Physical drop of a tile that just reached a terminal state
    void drop(grid::Tile& tile) {
        const double low = std::min(config.drop_drag_min, config.drop_drag_max);
        const double high = std::max(config.drop_drag_min, config.drop_drag_max);
        std::uniform_real_distribution<double> drag_dist(low, high);
        effects->start_drop(tile, drag_dist(rng));

        for (grid::IOccupant* occupant : tile.take_occupants()) {
            occupant->trigger_death_by_fall();
        }

        tile.start_acknowledgment(clock->now() + config.hit_ack_delay);
    }

    void fall(grid::Tile& tile, CollapseResult& result) {
        if (!transition(tile, grid::TileState::Fallen)) {
            return;
        }
        drop(tile);
        result.fallen.push_back(tile.coordinate());
        ++stats.tiles_fallen;
    }

    // Every still-available member falls, with one cue for the whole region
    void collapse_region(const grid::TileRegion& region, CollapseResult& result) {
        effects->play_sound(region.size() > config.big_collapse_threshold ? SoundCue::CrumbleBig
                                                                          : SoundCue::CrumbleSmall);
        for (grid::Tile* tile : region) {
            if (tile->is_available()) {
                fall(*tile, result);
            }
        }
    }

    bool region_is_unsupported(const grid::TileRegion& region) const {
        return std::none_of(region.begin(), region.end(),
                            [this](const grid::Tile* tile) { return support->is_supported(*tile); });
    }

    // Neighbors of the destroyed tile that lost support, together with their
    // land masses when nothing in them holds
    void collapse_unsupported_neighbors(grid::Tile& destroyed, CollapseResult& result) {
        std::vector<grid::Tile*> candidates;
        for (grid::Tile* neighbor : destroyed.neighbors()) {
            if (neighbor->is_available() && !support->is_supported(*neighbor)) {
                candidates.push_back(neighbor);
            }
        }

        for (grid::Tile* candidate : candidates) {
            // An earlier candidate's region may already have taken it down
            if (!candidate->is_available()) {
                continue;
            }

            const grid::TileRegion region = grid::reachable_available(*candidate);
            if (region.empty()) {
                CRUMBLE_LOG_DEBUG(core::log_category::COLLAPSE, "Isolated tile {} falls",
                                  grid::coordinate_to_string(candidate->coordinate()));
                fall(*candidate, result);
                continue;
            }

            if (region_is_unsupported(region)) {
                CRUMBLE_LOG_INFO(core::log_category::COLLAPSE, "Unsupported region of {} tiles next to {} falls",
                                 region.size(), grid::coordinate_to_string(destroyed.coordinate()));
                collapse_region(region, result);
            }
        }
    }

    void finish(const grid::Tile& tile, CollapseResult& result) {
        if (result.response == CollapseResponse::LandMassCut) {
            ++stats.land_mass_cuts;
        } else if (result.response == CollapseResponse::LocalUnsupported) {
            ++stats.local_collapses;
        }

        if (result.collapse_occurred() && collapse_callback) {
            CollapseEvent event;
            event.trigger_position = tile.coordinate();
            event.response = result.response;
            event.fallen = result.fallen;
            event.timestamp = clock->now();
            collapse_callback(event);
        }
    }
};

CollapseSystem::CollapseSystem() : impl_(std::make_unique<Impl>()) {}

CollapseSystem::~CollapseSystem() {
    if (impl_ && impl_->initialized) {
        shutdown();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool CollapseSystem::initialize(grid::Grid* grid, platform::Clock* clock, IEffectsSink* effects,
                                const IAvatarLocator* avatars, const CollapseConfig& config) {
    if (impl_->initialized) {
        CRUMBLE_LOG_WARN(core::log_category::COLLAPSE, "CollapseSystem already initialized");
        return true;
    }

    if (!grid) {
        CRUMBLE_LOG_ERROR(core::log_category::COLLAPSE, "CollapseSystem requires a grid");
        return false;
    }

    impl_->grid = grid;
    impl_->clock = clock ? clock : &impl_->fallback_clock;
    impl_->effects = effects ? effects : &impl_->null_effects;
    impl_->avatars = avatars;
    impl_->support = std::make_unique<grid::SupportAnalyzer>(*grid, config.min_support);
    impl_->apply_config(config);
    impl_->stats = {};
    impl_->initialized = true;

    CRUMBLE_LOG_INFO(core::log_category::COLLAPSE,
                     "CollapseSystem initialized (min_support={}, big_collapse_threshold={}, hit_ack_delay={}s)",
                     impl_->support->min_support(), impl_->config.big_collapse_threshold,
                     impl_->config.hit_ack_delay);
    return true;
}

void CollapseSystem::shutdown() {
    if (!impl_->initialized) {
        return;
    }

    CRUMBLE_LOG_DEBUG(core::log_category::COLLAPSE, "CollapseSystem shutdown: {} destroyed, {} fallen",
                      impl_->stats.tiles_destroyed, impl_->stats.tiles_fallen);

    impl_->support.reset();
    impl_->grid = nullptr;
    impl_->clock = nullptr;
    impl_->effects = nullptr;
    impl_->avatars = nullptr;
    impl_->collapse_callback = nullptr;
    impl_->initialized = false;
}

bool CollapseSystem::is_initialized() const {
    return impl_->initialized;
}

// ============================================================================
// Player Actions
// ============================================================================

CollapseResult CollapseSystem::destroy(grid::Tile& tile) {
    CollapseResult result;
    result.target = tile.coordinate();

    if (!impl_->initialized) {
        CRUMBLE_LOG_ERROR(core::log_category::COLLAPSE, "destroy called before initialization");
        return result;
    }

    if (!impl_->grid->is_wired()) {
        CRUMBLE_LOG_ERROR(core::log_category::COLLAPSE, "destroy called before neighbor wiring");
        return result;
    }

    if (!tile.is_available()) {
        CRUMBLE_LOG_DEBUG(core::log_category::COLLAPSE, "Tile {} is already {}",
                          grid::coordinate_to_string(tile.coordinate()), grid::tile_state_to_string(tile.state()));
        return result;
    }

    CRUMBLE_LOG_DEBUG(core::log_category::COLLAPSE, "Destroying tile {}",
                      grid::coordinate_to_string(tile.coordinate()));

    impl_->effects->look_at(tile);

    if (!impl_->transition(tile, grid::TileState::Destroyed)) {
        return result;
    }
    std::uniform_int_distribution<size_t> cue_dist(0, std::size(TILE_BREAK_CUES) - 1);
    impl_->effects->play_sound(TILE_BREAK_CUES[cue_dist(impl_->rng)]);
    impl_->drop(tile);

    result.destroyed = true;
    ++impl_->stats.tiles_destroyed;

    if (auto split = find_land_mass_split(tile)) {
        const grid::TileRegion& doomed = choose_region_to_collapse(split->first, split->second);
        CRUMBLE_LOG_INFO(core::log_category::COLLAPSE, "Land mass cut at {}: {} vs {} tiles, {} fall",
                         grid::coordinate_to_string(tile.coordinate()), split->first.size(), split->second.size(),
                         doomed.size());
        result.response = CollapseResponse::LandMassCut;
        impl_->collapse_region(doomed, result);
    } else {
        impl_->collapse_unsupported_neighbors(tile, result);
        if (result.collapse_occurred()) {
            result.response = CollapseResponse::LocalUnsupported;
        }
    }

    impl_->finish(tile, result);
    return result;
}

CollapseResult CollapseSystem::destroy_at(const grid::Coordinate& coord) {
    if (!impl_->initialized) {
        CRUMBLE_LOG_ERROR(core::log_category::COLLAPSE, "destroy_at called before initialization");
        CollapseResult result;
        result.target = coord;
        return result;
    }

    grid::Tile* tile = impl_->grid->tile_at(coord);
    if (!tile) {
        CRUMBLE_LOG_WARN(core::log_category::COLLAPSE, "No tile at {}", grid::coordinate_to_string(coord));
        CollapseResult result;
        result.target = coord;
        return result;
    }

    return destroy(*tile);
}

CollapseResult CollapseSystem::hit(grid::Tile& tile) {
    if (!impl_->initialized) {
        CRUMBLE_LOG_ERROR(core::log_category::COLLAPSE, "hit called before initialization");
        CollapseResult result;
        result.target = tile.coordinate();
        return result;
    }

    // on_hit may move the occupant off the tile
    std::vector<grid::IOccupant*> targets;
    for (grid::IOccupant* occupant : tile.occupants()) {
        if (occupant->is_hittable()) {
            targets.push_back(occupant);
        }
    }

    if (targets.empty()) {
        return destroy(tile);
    }

    CollapseResult result;
    result.target = tile.coordinate();
    result.occupants_hit = true;

    for (grid::IOccupant* occupant : targets) {
        if (occupant->can_be_hit()) {
            occupant->on_hit();
            ++impl_->stats.occupant_hits;
        }
    }
    tile.start_acknowledgment(impl_->clock->now() + impl_->config.hit_ack_delay);

    CRUMBLE_LOG_DEBUG(core::log_category::COLLAPSE, "Hit on {} landed on {} occupant(s)",
                      grid::coordinate_to_string(tile.coordinate()), targets.size());
    return result;
}

// ============================================================================
// Analysis
// ============================================================================

std::optional<LandMassSplit> CollapseSystem::find_land_mass_split(grid::Tile& tile) const {
    if (!impl_->initialized) {
        return std::nullopt;
    }

    const grid::TileRegion footprint = grid::reachable_unavailable(tile);
    if (footprint.empty()) {
        return std::nullopt;
    }

    const BoundaryContact contact = classify_boundary(footprint);
    const AxisProbes vertical = find_axis_probes(footprint, {0, 1});
    const AxisProbes horizontal = find_axis_probes(footprint, {1, 0});

    grid::Tile* probe_a = nullptr;
    grid::Tile* probe_b = nullptr;
    grid::Tile* wild = nullptr;

    if (contact.left && contact.right) {
        probe_a = vertical.positive;
        probe_b = vertical.negative;
    } else if (contact.top && contact.bottom) {
        probe_a = horizontal.positive;
        probe_b = horizontal.negative;
    } else if (contact.left && contact.bottom) {
        probe_a = horizontal.negative;
        probe_b = vertical.positive;
    } else if (contact.left && contact.top) {
        probe_a = horizontal.negative;
        probe_b = vertical.negative;
    } else if (contact.right && contact.bottom) {
        probe_a = horizontal.positive;
        probe_b = vertical.positive;
    } else if (contact.right && contact.top) {
        probe_a = horizontal.positive;
        probe_b = vertical.negative;
    } else if (contact.top) {
        probe_a = vertical.positive;
        probe_b = horizontal.positive;
        wild = horizontal.negative;
    } else if (contact.bottom) {
        probe_a = vertical.negative;
        probe_b = horizontal.positive;
        wild = horizontal.negative;
    } else if (contact.left) {
        probe_a = horizontal.negative;
        probe_b = vertical.positive;
        wild = vertical.negative;
    } else if (contact.right) {
        probe_a = horizontal.positive;
        probe_b = vertical.positive;
        wild = vertical.negative;
    }

    if (!probe_a || !probe_b) {
        CRUMBLE_LOG_TRACE(core::log_category::COLLAPSE, "No probe pair around footprint of {} tiles at {}",
                          footprint.size(), grid::coordinate_to_string(tile.coordinate()));
        return std::nullopt;
    }

    CRUMBLE_LOG_TRACE(core::log_category::COLLAPSE, "Probes {} / {} (wild {}) for footprint of {} tiles",
                      grid::coordinate_to_string(probe_a->coordinate()),
                      grid::coordinate_to_string(probe_b->coordinate()),
                      wild ? grid::coordinate_to_string(wild->coordinate()) : std::string("none"), footprint.size());

    LandMassSplit split;
    split.first = grid::reachable_available(*probe_a);
    split.second = grid::reachable_available(*probe_b);

    if (wild && grid::same_region(split.first, split.second)) {
        split.second = grid::reachable_available(*wild);
        split.used_wild_probe = true;
    }

    if (split.first.empty() || split.second.empty() || grid::same_region(split.first, split.second)) {
        return std::nullopt;
    }

    return split;
}

BoundaryContact CollapseSystem::classify_boundary(const grid::TileRegion& footprint) const {
    BoundaryContact contact;
    if (!impl_->initialized) {
        return contact;
    }

    const int32_t max_x = impl_->grid->width() - 1;
    const int32_t max_y = impl_->grid->height() - 1;

    for (const grid::Tile* tile : footprint) {
        const grid::Coordinate& coord = tile->coordinate();
        contact.left = contact.left || coord.x == 0;
        contact.right = contact.right || coord.x == max_x;
        contact.bottom = contact.bottom || coord.y == 0;
        contact.top = contact.top || coord.y == max_y;
    }

    return contact;
}

AxisProbes CollapseSystem::find_axis_probes(const grid::TileRegion& footprint, const glm::ivec2& axis) const {
    AxisProbes probes;
    if (!impl_->initialized) {
        return probes;
    }

    for (const grid::Tile* member : footprint) {
        if (!probes.positive) {
            grid::Tile* candidate = impl_->grid->tile_at(member->coordinate() + axis);
            if (candidate && candidate->is_available()) {
                probes.positive = candidate;
            }
        }
        if (!probes.negative) {
            grid::Tile* candidate = impl_->grid->tile_at(member->coordinate() - axis);
            if (candidate && candidate->is_available()) {
                probes.negative = candidate;
            }
        }
        if (probes.positive && probes.negative) {
            break;
        }
    }

    return probes;
}

const grid::TileRegion& CollapseSystem::choose_region_to_collapse(const grid::TileRegion& first,
                                                                  const grid::TileRegion& second) const {
    if (first.size() != second.size()) {
        return first.size() < second.size() ? first : second;
    }

    // Tie: keep the avatar's side
    if (impl_->avatars && impl_->grid) {
        if (auto coord = impl_->avatars->primary_avatar_coordinate()) {
            if (grid::region_contains(first, impl_->grid->tile_at(*coord))) {
                return second;
            }
        }
    }

    return first;
}

const grid::SupportAnalyzer& CollapseSystem::support() const {
    return *impl_->support;
}

// ============================================================================
// Configuration
// ============================================================================

const CollapseConfig& CollapseSystem::get_config() const {
    return impl_->config;
}

void CollapseSystem::set_config(const CollapseConfig& config) {
    impl_->apply_config(config);
}

// ============================================================================
// Callbacks
// ============================================================================

void CollapseSystem::set_collapse_callback(CollapseCallback callback) {
    impl_->collapse_callback = std::move(callback);
}

// ============================================================================
// Statistics
// ============================================================================

CollapseSystem::Stats CollapseSystem::get_stats() const {
    return impl_->stats;
}

}  // namespace crumble::collapse

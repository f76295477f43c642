// Crumble Collapse System
// collapse_system.hpp - Tile destruction and cascading collapse

#pragma once

#include "effects.hpp"

#include <crumble/core/core.hpp>
#include <crumble/grid/connectivity.hpp>
#include <crumble/grid/grid.hpp>
#include <crumble/grid/support.hpp>
#include <crumble/platform/clock.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace crumble::collapse {

// ============================================================================
// Collapse Configuration
// ============================================================================

struct CollapseConfig {
    // Range the drop drag is drawn from, per tile
    double drop_drag_min = 0.25;
    double drop_drag_max = 1.0;

    // Supported sides a tile needs to stay up (1..4)
    int32_t min_support = 1;

    // Regions larger than this play the big crumble cue
    uint32_t big_collapse_threshold = 6;

    // Seconds between a drop (or occupant hit) and the hit reading as processed
    core::Seconds hit_ack_delay = 0.25;

    // 0 = seed from std::random_device
    uint32_t rng_seed = 0;

    [[nodiscard]] static CollapseConfig from_config(const core::Config& config);
};

// ============================================================================
// Collapse Result
// ============================================================================

enum class CollapseResponse : uint8_t {
    None,              // Nothing beyond the destroyed tile fell
    LandMassCut,       // The destroy split the grid and the losing side fell
    LocalUnsupported   // Unsupported pieces next to the destroyed tile fell
};

[[nodiscard]] inline const char* collapse_response_to_string(CollapseResponse response) {
    switch (response) {
        case CollapseResponse::None:
            return "None";
        case CollapseResponse::LandMassCut:
            return "LandMassCut";
        case CollapseResponse::LocalUnsupported:
            return "LocalUnsupported";
        default:
            return "Unknown";
    }
}

struct CollapseResult {
    bool destroyed = false;  // The target tile went to Destroyed
    bool occupants_hit = false;  // A hit landed on occupants instead of the tile
    CollapseResponse response = CollapseResponse::None;
    grid::Coordinate target{0, 0};
    std::vector<grid::Coordinate> fallen;  // Transition order

    [[nodiscard]] bool collapse_occurred() const { return !fallen.empty(); }
};

struct CollapseEvent {
    grid::Coordinate trigger_position{0, 0};
    CollapseResponse response = CollapseResponse::None;
    std::vector<grid::Coordinate> fallen;
    core::Seconds timestamp = 0.0;
};

using CollapseCallback = std::function<void(const CollapseEvent&)>;

// ============================================================================
// Land Mass Split
// ============================================================================

// Which level borders a destroyed footprint reaches
struct BoundaryContact {
    bool left = false;    // x == 0
    bool right = false;   // x == width - 1
    bool top = false;     // y == height - 1
    bool bottom = false;  // y == 0

    [[nodiscard]] int count() const {
        return static_cast<int>(left) + static_cast<int>(right) + static_cast<int>(top) + static_cast<int>(bottom);
    }
};

// First available tile found next to a footprint along one axis
struct AxisProbes {
    grid::Tile* positive = nullptr;
    grid::Tile* negative = nullptr;
};

// Two distinct land masses separated by a destroyed footprint
struct LandMassSplit {
    grid::TileRegion first;
    grid::TileRegion second;
    bool used_wild_probe = false;
};

// ============================================================================
// Collapse System
// ============================================================================

// Single-threaded; every call runs to completion within the calling tick.
class CollapseSystem {
public:
    CollapseSystem();
    ~CollapseSystem();

    // Non-copyable, non-movable
    CollapseSystem(const CollapseSystem&) = delete;
    CollapseSystem& operator=(const CollapseSystem&) = delete;
    CollapseSystem(CollapseSystem&&) = delete;
    CollapseSystem& operator=(CollapseSystem&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // grid is required. A null clock falls back to an internal SteadyClock;
    // null effects or avatars mean no side effects and no avatar to favor on
    // ties. Collaborators must outlive the system or be released through
    // shutdown().
    bool initialize(grid::Grid* grid, platform::Clock* clock, IEffectsSink* effects = nullptr,
                    const IAvatarLocator* avatars = nullptr, const CollapseConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // ========================================================================
    // Player Actions
    // ========================================================================

    // Destroys the tile and collapses whatever the removal leaves unsupported.
    // A tile that is already unavailable is left alone.
    CollapseResult destroy(grid::Tile& tile);
    CollapseResult destroy_at(const grid::Coordinate& coord);

    // A hit on a tile lands on its hittable occupants when it has any (the
    // tile survives and its hit acknowledgment starts); otherwise the tile is
    // destroyed.
    CollapseResult hit(grid::Tile& tile);

    // ========================================================================
    // Analysis
    // ========================================================================

    // Two distinct land masses cut apart by the footprint around the tile,
    // or nullopt when the probes cannot show a split
    [[nodiscard]] std::optional<LandMassSplit> find_land_mass_split(grid::Tile& tile) const;

    [[nodiscard]] BoundaryContact classify_boundary(const grid::TileRegion& footprint) const;

    // First available tile next to any footprint member along the axis
    // ({1, 0} or {0, 1}), scanning the footprint in order
    [[nodiscard]] AxisProbes find_axis_probes(const grid::TileRegion& footprint, const glm::ivec2& axis) const;

    // The region that falls: the smaller one, or on a tie the one without the
    // primary avatar
    [[nodiscard]] const grid::TileRegion& choose_region_to_collapse(const grid::TileRegion& first,
                                                                    const grid::TileRegion& second) const;

    // Only valid while initialized
    [[nodiscard]] const grid::SupportAnalyzer& support() const;

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] const CollapseConfig& get_config() const;
    void set_config(const CollapseConfig& config);

    // ========================================================================
    // Callbacks
    // ========================================================================

    void set_collapse_callback(CollapseCallback callback);

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        size_t tiles_destroyed = 0;
        size_t land_mass_cuts = 0;
        size_t local_collapses = 0;
        size_t tiles_fallen = 0;
        size_t occupant_hits = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace crumble::collapse

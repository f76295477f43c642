// Crumble Collapse System
// effects.hpp - Outward side effects and collaborators of the collapse core

#pragma once

#include <crumble/grid/tile.hpp>
#include <crumble/grid/types.hpp>

#include <cstdint>
#include <optional>

namespace crumble::collapse {

// ============================================================================
// Sound Cues
// ============================================================================

enum class SoundCue : uint8_t {
    TileBreakOne,
    TileBreakTwo,
    TileBreakThree,
    CrumbleBig,
    CrumbleSmall
};

// Variants picked from when a tile is hit directly
inline constexpr SoundCue TILE_BREAK_CUES[3] = {SoundCue::TileBreakOne, SoundCue::TileBreakTwo,
                                                SoundCue::TileBreakThree};

[[nodiscard]] inline const char* sound_cue_to_string(SoundCue cue) {
    switch (cue) {
        case SoundCue::TileBreakOne:
            return "TileBreakOne";
        case SoundCue::TileBreakTwo:
            return "TileBreakTwo";
        case SoundCue::TileBreakThree:
            return "TileBreakThree";
        case SoundCue::CrumbleBig:
            return "CrumbleBig";
        case SoundCue::CrumbleSmall:
            return "CrumbleSmall";
        default:
            return "Unknown";
    }
}

// ============================================================================
// Tile Presentation
// ============================================================================

// How the presentation layer shows a tile in a given state
struct TilePresentation {
    bool visible = true;   // Render the tile model
    bool barrier = false;  // Impassable wall on the tile's footprint
};

[[nodiscard]] inline TilePresentation presentation_for(grid::TileState state) {
    switch (state) {
        case grid::TileState::Destroyed:
            return {true, true};
        case grid::TileState::Void:
            return {false, true};
        case grid::TileState::Active:
        case grid::TileState::Highlighted:
        case grid::TileState::Fallen:
        default:
            return {true, false};
    }
}

// ============================================================================
// Effects Sink
// ============================================================================

// Receives every side effect the collapse core triggers. Execution (audio,
// rigid bodies, camera) belongs to the implementer; all calls are
// fire-and-forget.
class IEffectsSink {
public:
    virtual ~IEffectsSink() = default;

    virtual void play_sound(SoundCue cue) { (void)cue; }

    // Start the physical drop of a Destroyed/Fallen tile
    virtual void start_drop(const grid::Tile& tile, double drag) {
        (void)tile;
        (void)drag;
    }

    // Turn the player/camera toward the tile being destroyed
    virtual void look_at(const grid::Tile& tile) { (void)tile; }

    virtual void on_tile_state_changed(const grid::Tile& tile, grid::TileState old_state) {
        (void)tile;
        (void)old_state;
    }
};

// ============================================================================
// Avatar Locator
// ============================================================================

class IAvatarLocator {
public:
    virtual ~IAvatarLocator() = default;

    // Coordinate of the controllable avatar, if one is alive on the grid
    [[nodiscard]] virtual std::optional<grid::Coordinate> primary_avatar_coordinate() const = 0;
};

}  // namespace crumble::collapse

// Crumble - Tile Grid Structural Integrity Engine
// main.cpp - Headless collapse simulator

#include <crumble/collapse/collapse_system.hpp>
#include <crumble/core/config.hpp>
#include <crumble/core/logger.hpp>
#include <crumble/grid/grid.hpp>
#include <crumble/grid/level_layout.hpp>
#include <crumble/platform/clock.hpp>

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace {

using namespace crumble;

constexpr const char* VERSION = "0.1.0";
constexpr const char* CONFIG_FILE = "crumble.json";
constexpr int32_t DEFAULT_GRID_SIZE = 7;

// Sim step between destroys, long enough for hit acknowledgments to expire
constexpr core::Seconds STEP_SECONDS = 0.5;

// Body standing on a spawn tile
class SimOccupant final : public grid::IOccupant {
public:
    SimOccupant(std::string name, const grid::Coordinate& coord) : name_(std::move(name)), coordinate_(coord) {}

    [[nodiscard]] bool is_hittable() const override { return true; }
    [[nodiscard]] bool can_be_hit() const override { return alive_; }
    void on_hit() override { CRUMBLE_LOG_INFO(core::log_category::ENGINE, "{} was hit", name_); }

    void trigger_death_by_fall() override {
        alive_ = false;
        CRUMBLE_LOG_INFO(core::log_category::ENGINE, "{} fell at {}", name_, grid::coordinate_to_string(coordinate_));
    }

    [[nodiscard]] bool is_alive() const { return alive_; }
    [[nodiscard]] const grid::Coordinate& coordinate() const { return coordinate_; }

private:
    std::string name_;
    grid::Coordinate coordinate_;
    bool alive_ = true;
};

class SimAvatarLocator final : public collapse::IAvatarLocator {
public:
    explicit SimAvatarLocator(const SimOccupant* player) : player_(player) {}

    [[nodiscard]] std::optional<grid::Coordinate> primary_avatar_coordinate() const override {
        if (!player_ || !player_->is_alive()) {
            return std::nullopt;
        }
        return player_->coordinate();
    }

private:
    const SimOccupant* player_;
};

class LoggingEffectsSink final : public collapse::IEffectsSink {
public:
    void play_sound(collapse::SoundCue cue) override {
        CRUMBLE_LOG_DEBUG(core::log_category::ENGINE, "Sound: {}", collapse::sound_cue_to_string(cue));
    }

    void start_drop(const grid::Tile& tile, double drag) override {
        CRUMBLE_LOG_TRACE(core::log_category::ENGINE, "Drop {} (drag {:.2f})",
                          grid::coordinate_to_string(tile.coordinate()), drag);
    }

    void on_tile_state_changed(const grid::Tile& tile, grid::TileState old_state) override {
        CRUMBLE_LOG_TRACE(core::log_category::ENGINE, "Tile {}: {} -> {}", grid::coordinate_to_string(tile.coordinate()),
                          grid::tile_state_to_string(old_state), grid::tile_state_to_string(tile.state()));
    }
};

std::optional<grid::Coordinate> parse_coordinate(std::string_view text) {
    const size_t comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }

    try {
        const int x = std::stoi(std::string(text.substr(0, comma)));
        const int y = std::stoi(std::string(text.substr(comma + 1)));
        return grid::Coordinate(x, y);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

char glyph_for(const grid::Tile& tile) {
    switch (tile.state()) {
        case grid::TileState::Active:
            return tile.occupants().empty() ? '.' : 'O';
        case grid::TileState::Highlighted:
            return '+';
        case grid::TileState::Destroyed:
            return 'X';
        case grid::TileState::Fallen:
            return '~';
        case grid::TileState::Void:
        default:
            return '#';
    }
}

void print_grid(const grid::Grid& tiles) {
    for (int32_t y = tiles.height() - 1; y >= 0; --y) {
        std::string row;
        for (int32_t x = 0; x < tiles.width(); ++x) {
            const grid::Tile* tile = tiles.tile_at({x, y});
            row.push_back(tile ? glyph_for(*tile) : ' ');
        }
        std::printf("  %s\n", row.c_str());
    }
    std::printf("\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    core::Logger::initialize();

    core::Config config;
    if (!config.load_or_create_default(CONFIG_FILE)) {
        CRUMBLE_LOG_WARN(core::log_category::ENGINE, "Using built-in defaults, could not prepare {}", CONFIG_FILE);
    }
    core::Logger::set_global_level(core::log_level_from_string(
        config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info")));

    CRUMBLE_LOG_INFO(core::log_category::ENGINE, "Crumble simulator v{}", VERSION);

    // Arguments: [layout-file] [x,y ...]
    std::optional<grid::LevelLayout> layout;
    std::vector<grid::Coordinate> targets;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (auto coord = parse_coordinate(arg)) {
            targets.push_back(*coord);
        } else if (i == 1) {
            layout = grid::LevelLayout::load(std::string(arg));
            if (!layout) {
                CRUMBLE_LOG_CRITICAL(core::log_category::ENGINE, "Could not load layout {}", arg);
                core::Logger::shutdown();
                return 1;
            }
        } else {
            CRUMBLE_LOG_WARN(core::log_category::ENGINE, "Ignoring argument '{}', expected x,y", arg);
        }
    }

    if (!layout) {
        layout.emplace(DEFAULT_GRID_SIZE, DEFAULT_GRID_SIZE);
    }

    LoggingEffectsSink effects;
    grid::Grid tiles(&effects);
    if (!tiles.build(*layout)) {
        core::Logger::shutdown();
        return 1;
    }

    // Spawns stand on their tiles
    std::vector<std::unique_ptr<SimOccupant>> occupants;
    const SimOccupant* player = nullptr;
    for (const auto& spawn : layout->spawns()) {
        const bool is_player = spawn.kind == grid::SpawnKind::Player;
        auto occupant = std::make_unique<SimOccupant>(is_player ? "Player" : "Enemy", spawn.coordinate);
        if (grid::Tile* tile = tiles.tile_at(spawn.coordinate)) {
            tile->add_occupant(occupant.get());
        }
        if (is_player && !player) {
            player = occupant.get();
        }
        occupants.push_back(std::move(occupant));
    }

    platform::ManualClock clock;
    SimAvatarLocator avatars(player);

    collapse::CollapseSystem collapse_system;
    if (!collapse_system.initialize(&tiles, &clock, &effects, &avatars,
                                    collapse::CollapseConfig::from_config(config))) {
        core::Logger::shutdown();
        return 1;
    }

    collapse_system.set_collapse_callback([](const collapse::CollapseEvent& event) {
        CRUMBLE_LOG_INFO(core::log_category::ENGINE, "{} after destroying {}: {} tile(s) fell",
                         collapse::collapse_response_to_string(event.response),
                         grid::coordinate_to_string(event.trigger_position), event.fallen.size());
    });

    // Marks the tiles around the player as reachable targets
    const auto highlight_player = [&tiles, &avatars]() {
        if (auto coord = avatars.primary_avatar_coordinate()) {
            tiles.highlight_around(*coord);
        } else {
            tiles.clear_highlights();
        }
    };

    highlight_player();
    std::printf("Initial grid (%dx%d):\n", tiles.width(), tiles.height());
    print_grid(tiles);

    for (const auto& target : targets) {
        const collapse::CollapseResult result = collapse_system.destroy_at(target);
        clock.advance(STEP_SECONDS);
        highlight_player();

        std::printf("destroy %s -> %s, %zu fallen, %zu available\n", grid::coordinate_to_string(target).c_str(),
                    result.destroyed ? collapse::collapse_response_to_string(result.response) : "skipped",
                    result.fallen.size(), tiles.available_count());
        print_grid(tiles);
    }

    const auto stats = collapse_system.get_stats();
    CRUMBLE_LOG_INFO(core::log_category::ENGINE,
                     "Done: {} destroyed, {} fallen, {} land mass cut(s), {} local collapse(s)",
                     stats.tiles_destroyed, stats.tiles_fallen, stats.land_mass_cuts, stats.local_collapses);

    collapse_system.shutdown();
    core::Logger::shutdown();
    return 0;
}

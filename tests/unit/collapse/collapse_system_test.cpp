// Crumble Collapse Tests
// collapse_system_test.cpp - Destruction, land mass cuts and local collapse tests

#include <gtest/gtest.h>

#include <crumble/collapse/collapse_system.hpp>
#include <crumble/core/config.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace crumble::collapse {
namespace {

using grid::Coordinate;
using grid::Tile;
using grid::TileState;

// ============================================================================
// Test Doubles
// ============================================================================

class RecordingEffects : public IEffectsSink {
public:
    struct Drop {
        Coordinate coordinate;
        double drag;
    };

    struct StateChange {
        Coordinate coordinate;
        TileState old_state;
        TileState new_state;
    };

    void play_sound(SoundCue cue) override {
        sounds.push_back(cue);
        calls.push_back("play_sound");
    }

    void start_drop(const Tile& tile, double drag) override {
        drops.push_back({tile.coordinate(), drag});
        calls.push_back("start_drop");
    }

    void look_at(const Tile& tile) override {
        looked_at.push_back(tile.coordinate());
        calls.push_back("look_at");
    }

    void on_tile_state_changed(const Tile& tile, TileState old_state) override {
        changes.push_back({tile.coordinate(), old_state, tile.state()});
        calls.push_back("state_changed");
    }

    [[nodiscard]] size_t count(SoundCue cue) const {
        return static_cast<size_t>(std::count(sounds.begin(), sounds.end(), cue));
    }

    [[nodiscard]] size_t break_cues() const {
        return count(SoundCue::TileBreakOne) + count(SoundCue::TileBreakTwo) + count(SoundCue::TileBreakThree);
    }

    [[nodiscard]] size_t crumble_cues() const { return count(SoundCue::CrumbleBig) + count(SoundCue::CrumbleSmall); }

    std::vector<SoundCue> sounds;
    std::vector<Drop> drops;
    std::vector<Coordinate> looked_at;
    std::vector<StateChange> changes;
    std::vector<std::string> calls;
};

class FakeOccupant : public grid::IOccupant {
public:
    explicit FakeOccupant(bool hittable = false) : hittable_(hittable) {}

    [[nodiscard]] bool is_hittable() const override { return hittable_; }
    [[nodiscard]] bool can_be_hit() const override { return hittable_ && accepting_hits; }
    void on_hit() override { ++hits; }
    void trigger_death_by_fall() override { ++deaths; }

    bool accepting_hits = true;
    int hits = 0;
    int deaths = 0;

private:
    bool hittable_;
};

class FakeAvatarLocator : public IAvatarLocator {
public:
    [[nodiscard]] std::optional<Coordinate> primary_avatar_coordinate() const override { return avatar; }

    std::optional<Coordinate> avatar;
};

// ============================================================================
// Test Fixture
// ============================================================================

class CollapseSystemTest : public ::testing::Test {
protected:
    void TearDown() override { system.shutdown(); }

    static CollapseConfig seeded_config() {
        CollapseConfig config;
        config.rng_seed = 7;
        return config;
    }

    // Layout text reads top row first
    void build(std::string_view text) {
        auto layout = grid::LevelLayout::parse(text);
        ASSERT_TRUE(layout.has_value());
        ASSERT_TRUE(grid.build(*layout));
    }

    void init(const CollapseConfig& config = seeded_config()) {
        ASSERT_TRUE(system.initialize(&grid, &clock, &effects, &avatars, config));
    }

    Tile& at(int x, int y) { return *grid.tile_at({x, y}); }

    // Destroys column x from the bottom row up, returning the final result
    CollapseResult destroy_column(int x) {
        CollapseResult last;
        for (int y = 0; y < grid.height(); ++y) {
            last = system.destroy(at(x, y));
        }
        return last;
    }

    bool all_fallen_in_columns(const CollapseResult& result, int min_x, int max_x) {
        return std::all_of(result.fallen.begin(), result.fallen.end(), [&](const Coordinate& coord) {
            return coord.x >= min_x && coord.x <= max_x && at(coord.x, coord.y).state() == TileState::Fallen;
        });
    }

    grid::Grid grid;
    platform::ManualClock clock;
    RecordingEffects effects;
    FakeAvatarLocator avatars;
    CollapseSystem system;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(CollapseSystemTest, InitializeRequiresGrid) {
    EXPECT_FALSE(system.initialize(nullptr, &clock));
    EXPECT_FALSE(system.is_initialized());
}

TEST_F(CollapseSystemTest, InitializeAndShutdown) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    EXPECT_TRUE(system.is_initialized());
    EXPECT_EQ(system.support().min_support(), 1);

    system.shutdown();
    EXPECT_FALSE(system.is_initialized());
}

TEST_F(CollapseSystemTest, NullCollaboratorsAreOptional) {
    ASSERT_TRUE(grid.build(3, 3));
    ASSERT_TRUE(system.initialize(&grid, nullptr));

    CollapseResult result = system.destroy(at(1, 1));
    EXPECT_TRUE(result.destroyed);
    EXPECT_EQ(at(1, 1).state(), TileState::Destroyed);
    ASSERT_TRUE(at(1, 1).acknowledge_at().has_value());
}

TEST_F(CollapseSystemTest, DestroyBeforeInitializeIsRejected) {
    ASSERT_TRUE(grid.build(3, 3));

    CollapseResult result = system.destroy(at(1, 1));
    EXPECT_FALSE(result.destroyed);
    EXPECT_EQ(at(1, 1).state(), TileState::Active);
}

TEST_F(CollapseSystemTest, DestroyOnUnwiredGridIsRejected) {
    grid.place_tile({0, 0});
    grid.place_tile({1, 0});
    init();

    CollapseResult result = system.destroy(at(0, 0));
    EXPECT_FALSE(result.destroyed);
    EXPECT_EQ(at(0, 0).state(), TileState::Active);
    EXPECT_TRUE(effects.calls.empty());
}

TEST_F(CollapseSystemTest, ConfigIsApplied) {
    ASSERT_TRUE(grid.build(3, 3));
    CollapseConfig config = seeded_config();
    config.min_support = 3;
    init(config);

    EXPECT_EQ(system.support().min_support(), 3);
    EXPECT_EQ(system.get_config().min_support, 3);

    config.min_support = 2;
    system.set_config(config);
    EXPECT_EQ(system.support().min_support(), 2);
}

// ============================================================================
// Destroy Side Effects
// ============================================================================

TEST_F(CollapseSystemTest, DestroyTransitionsAndNotifiesInOrder) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    CollapseResult result = system.destroy(at(2, 2));

    EXPECT_TRUE(result.destroyed);
    EXPECT_EQ(result.target, Coordinate(2, 2));
    EXPECT_EQ(at(2, 2).state(), TileState::Destroyed);

    ASSERT_EQ(effects.calls.size(), 4u);
    EXPECT_EQ(effects.calls[0], "look_at");
    EXPECT_EQ(effects.calls[1], "state_changed");
    EXPECT_EQ(effects.calls[2], "play_sound");
    EXPECT_EQ(effects.calls[3], "start_drop");

    ASSERT_EQ(effects.looked_at.size(), 1u);
    EXPECT_EQ(effects.looked_at[0], Coordinate(2, 2));

    ASSERT_EQ(effects.changes.size(), 1u);
    EXPECT_EQ(effects.changes[0].old_state, TileState::Active);
    EXPECT_EQ(effects.changes[0].new_state, TileState::Destroyed);

    EXPECT_EQ(effects.break_cues(), 1u);
    EXPECT_EQ(effects.crumble_cues(), 0u);
}

TEST_F(CollapseSystemTest, DropDragWithinConfiguredRange) {
    ASSERT_TRUE(grid.build(5, 5));
    CollapseConfig config = seeded_config();
    config.drop_drag_min = 0.5;
    config.drop_drag_max = 0.75;
    init(config);

    for (int x = 0; x < 5; ++x) {
        (void)system.destroy(at(x, 2));
    }

    ASSERT_FALSE(effects.drops.empty());
    for (const auto& drop : effects.drops) {
        EXPECT_GE(drop.drag, 0.5);
        EXPECT_LE(drop.drag, 0.75);
    }
}

TEST_F(CollapseSystemTest, SameSeedSameDrags) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    (void)system.destroy(at(1, 1));

    grid::Grid other_grid;
    ASSERT_TRUE(other_grid.build(3, 3));
    RecordingEffects other_effects;
    CollapseSystem other;
    ASSERT_TRUE(other.initialize(&other_grid, &clock, &other_effects, nullptr, seeded_config()));
    (void)other.destroy(*other_grid.tile_at({1, 1}));

    ASSERT_EQ(effects.drops.size(), 1u);
    ASSERT_EQ(other_effects.drops.size(), 1u);
    EXPECT_DOUBLE_EQ(effects.drops[0].drag, other_effects.drops[0].drag);
    EXPECT_EQ(effects.sounds, other_effects.sounds);
}

TEST_F(CollapseSystemTest, HighlightedTileCanBeDestroyed) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    grid.highlight_around({0, 0});
    ASSERT_EQ(at(1, 1).state(), TileState::Highlighted);

    (void)system.destroy(at(1, 1));

    EXPECT_EQ(at(1, 1).state(), TileState::Destroyed);
    ASSERT_EQ(effects.changes.size(), 1u);
    EXPECT_EQ(effects.changes[0].old_state, TileState::Highlighted);
}

TEST_F(CollapseSystemTest, DestroyKillsOccupants) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    FakeOccupant first;
    FakeOccupant second(true);
    at(1, 1).add_occupant(&first);
    at(1, 1).add_occupant(&second);

    (void)system.destroy(at(1, 1));

    EXPECT_EQ(first.deaths, 1);
    EXPECT_EQ(second.deaths, 1);
    EXPECT_TRUE(at(1, 1).occupants().empty());
}

TEST_F(CollapseSystemTest, DestroyStartsAcknowledgment) {
    ASSERT_TRUE(grid.build(3, 3));
    clock.set(10.0);
    init();

    (void)system.destroy(at(1, 1));

    ASSERT_TRUE(at(1, 1).acknowledge_at().has_value());
    EXPECT_DOUBLE_EQ(*at(1, 1).acknowledge_at(), 10.25);
    EXPECT_FALSE(at(1, 1).hit_processed(clock.now()));

    clock.advance(0.1);
    EXPECT_FALSE(at(1, 1).hit_processed(clock.now()));

    clock.advance(0.15);
    EXPECT_TRUE(at(1, 1).hit_processed(clock.now()));
}

TEST_F(CollapseSystemTest, DestroyingUnavailableTileIsNoop) {
    build(
        "...\n"
        ".#.\n"
        "...\n");
    init();

    CollapseResult void_result = system.destroy(at(1, 1));
    EXPECT_FALSE(void_result.destroyed);
    EXPECT_EQ(at(1, 1).state(), TileState::Void);

    (void)system.destroy(at(0, 0));
    const size_t calls = effects.calls.size();

    CollapseResult again = system.destroy(at(0, 0));
    EXPECT_FALSE(again.destroyed);
    EXPECT_EQ(at(0, 0).state(), TileState::Destroyed);
    EXPECT_EQ(effects.calls.size(), calls);
    EXPECT_EQ(system.get_stats().tiles_destroyed, 1u);
}

TEST_F(CollapseSystemTest, DestroyAt) {
    ASSERT_TRUE(grid.build(3, 3));
    init();

    EXPECT_TRUE(system.destroy_at({2, 2}).destroyed);
    EXPECT_EQ(at(2, 2).state(), TileState::Destroyed);

    CollapseResult missing = system.destroy_at({7, 7});
    EXPECT_FALSE(missing.destroyed);
    EXPECT_EQ(missing.target, Coordinate(7, 7));
}

// ============================================================================
// No Collapse
// ============================================================================

TEST_F(CollapseSystemTest, InteriorDestroyCollapsesNothing) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    CollapseResult result = system.destroy(at(2, 2));

    EXPECT_EQ(result.response, CollapseResponse::None);
    EXPECT_FALSE(result.collapse_occurred());
    EXPECT_EQ(grid.available_count(), 24u);
}

TEST_F(CollapseSystemTest, CornerDestroyCollapsesNothing) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    CollapseResult result = system.destroy(at(0, 0));

    EXPECT_EQ(result.response, CollapseResponse::None);
    EXPECT_TRUE(result.fallen.empty());
    EXPECT_EQ(at(0, 1).state(), TileState::Active);
    EXPECT_EQ(at(1, 0).state(), TileState::Active);
    EXPECT_FALSE(system.find_land_mass_split(at(0, 0)).has_value());
}

TEST_F(CollapseSystemTest, PartialColumnCollapsesNothing) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    for (int y = 0; y < 4; ++y) {
        CollapseResult result = system.destroy(at(2, y));
        EXPECT_EQ(result.response, CollapseResponse::None) << "y=" << y;
        EXPECT_TRUE(result.fallen.empty()) << "y=" << y;
    }
    EXPECT_EQ(grid.available_count(), 21u);
}

// ============================================================================
// Land Mass Cut
// ============================================================================

TEST_F(CollapseSystemTest, FullColumnCutKeepsAvatarSide) {
    ASSERT_TRUE(grid.build(5, 5));
    avatars.avatar = Coordinate(3, 2);
    init();

    CollapseResult result = destroy_column(2);

    EXPECT_EQ(result.response, CollapseResponse::LandMassCut);
    EXPECT_EQ(result.fallen.size(), 10u);
    EXPECT_TRUE(all_fallen_in_columns(result, 0, 1));
    for (int x = 3; x < 5; ++x) {
        for (int y = 0; y < 5; ++y) {
            EXPECT_TRUE(at(x, y).is_available());
        }
    }
    EXPECT_EQ(effects.count(SoundCue::CrumbleBig), 1u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleSmall), 0u);
}

TEST_F(CollapseSystemTest, FullColumnCutFollowsAvatarToTheLeft) {
    ASSERT_TRUE(grid.build(5, 5));
    avatars.avatar = Coordinate(0, 4);
    init();

    CollapseResult result = destroy_column(2);

    EXPECT_EQ(result.response, CollapseResponse::LandMassCut);
    EXPECT_EQ(result.fallen.size(), 10u);
    EXPECT_TRUE(all_fallen_in_columns(result, 3, 4));
    EXPECT_TRUE(at(0, 4).is_available());
    EXPECT_TRUE(at(1, 0).is_available());
}

TEST_F(CollapseSystemTest, SmallerSideFallsRegardlessOfAvatar) {
    ASSERT_TRUE(grid.build(5, 5));
    avatars.avatar = Coordinate(0, 2);
    init();
    FakeOccupant player;
    at(0, 2).add_occupant(&player);

    CollapseResult result = destroy_column(1);

    EXPECT_EQ(result.response, CollapseResponse::LandMassCut);
    ASSERT_EQ(result.fallen.size(), 5u);
    EXPECT_TRUE(all_fallen_in_columns(result, 0, 0));
    EXPECT_EQ(player.deaths, 1);
    EXPECT_EQ(grid.available_count(), 15u);
    for (int x = 2; x < 5; ++x) {
        for (int y = 0; y < 5; ++y) {
            EXPECT_TRUE(at(x, y).is_available());
        }
    }
    EXPECT_EQ(effects.count(SoundCue::CrumbleSmall), 1u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleBig), 0u);
}

TEST_F(CollapseSystemTest, CollapsedTilesDropAndNotify) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    CollapseResult result = destroy_column(1);
    ASSERT_EQ(result.fallen.size(), 5u);

    // 5 destroys plus 5 falls
    EXPECT_EQ(effects.drops.size(), 10u);
    const auto fallen_changes = std::count_if(effects.changes.begin(), effects.changes.end(), [](const auto& change) {
        return change.new_state == TileState::Fallen && change.old_state == TileState::Active;
    });
    EXPECT_EQ(fallen_changes, 5);
    for (const auto& coord : result.fallen) {
        EXPECT_TRUE(at(coord.x, coord.y).acknowledge_at().has_value());
    }
}

TEST_F(CollapseSystemTest, UShapedCutDropsInnerPocket) {
    build(
        ".....\n"
        ".....\n"
        ".###.\n"
        ".#.#.\n"
        ".#...\n");
    init();

    CollapseResult result = system.destroy(at(3, 0));

    EXPECT_EQ(result.response, CollapseResponse::LandMassCut);
    ASSERT_EQ(result.fallen.size(), 2u);
    EXPECT_EQ(at(2, 0).state(), TileState::Fallen);
    EXPECT_EQ(at(2, 1).state(), TileState::Fallen);
    EXPECT_EQ(grid.available_count(), 16u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleSmall), 1u);
}

TEST_F(CollapseSystemTest, MirroredUShapeUsesWildProbe) {
    build(
        ".....\n"
        ".....\n"
        ".###.\n"
        ".#.#.\n"
        "...#.\n");
    init();

    // Probes on both axes land in the pocket, the fallback reaches outside
    grid::Tile& target = at(1, 0);
    CollapseResult result = system.destroy(target);

    EXPECT_EQ(result.response, CollapseResponse::LandMassCut);
    ASSERT_EQ(result.fallen.size(), 2u);
    EXPECT_EQ(at(2, 0).state(), TileState::Fallen);
    EXPECT_EQ(at(2, 1).state(), TileState::Fallen);
    EXPECT_EQ(grid.available_count(), 16u);
}

TEST_F(CollapseSystemTest, FindSplitAcrossVoidColumn) {
    build(
        "..#..\n"
        "..#..\n"
        "..#..\n"
        "..#..\n"
        "..#..\n");
    init();

    auto split = system.find_land_mass_split(at(2, 0));
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split->first.size(), 10u);
    EXPECT_EQ(split->second.size(), 10u);
    EXPECT_FALSE(split->used_wild_probe);
    EXPECT_FALSE(grid::same_region(split->first, split->second));
}

TEST_F(CollapseSystemTest, WildProbeReportedInSplit) {
    build(
        ".....\n"
        ".....\n"
        ".###.\n"
        ".#.#.\n"
        ".#.#.\n");
    init();

    // Pocket at x=2 is walled in on three sides
    auto split = system.find_land_mass_split(at(1, 0));
    ASSERT_TRUE(split.has_value());
    EXPECT_TRUE(split->used_wild_probe);
    EXPECT_EQ(std::min(split->first.size(), split->second.size()), 2u);
}

// ============================================================================
// Local Unsupported Response
// ============================================================================

TEST_F(CollapseSystemTest, EnclosedCenterFallsAlone) {
    build(
        "###\n"
        "#.#\n"
        "#.#\n");
    init();

    CollapseResult result = system.destroy(at(1, 0));

    EXPECT_EQ(result.response, CollapseResponse::LocalUnsupported);
    ASSERT_EQ(result.fallen.size(), 1u);
    EXPECT_EQ(result.fallen[0], Coordinate(1, 1));
    EXPECT_EQ(at(1, 1).state(), TileState::Fallen);
    EXPECT_EQ(at(1, 0).state(), TileState::Destroyed);

    // Only the break cue, a lone fall has no crumble
    EXPECT_EQ(effects.break_cues(), 1u);
    EXPECT_EQ(effects.crumble_cues(), 0u);
}

TEST_F(CollapseSystemTest, UnsupportedIslandFallsWithOneCue) {
    build(
        "#####\n"
        "#...#\n"
        "#...#\n"
        "#####\n"
        "#####\n");
    init();

    CollapseResult result = system.destroy(at(3, 2));

    EXPECT_EQ(result.response, CollapseResponse::LocalUnsupported);
    EXPECT_EQ(result.fallen.size(), 5u);
    EXPECT_EQ(grid.available_count(), 0u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleSmall), 1u);
    EXPECT_EQ(effects.crumble_cues(), 1u);

    // Each tile falls once even though two neighbors led into the island
    auto fallen = result.fallen;
    std::sort(fallen.begin(), fallen.end(),
              [](const Coordinate& a, const Coordinate& b) { return a.x != b.x ? a.x < b.x : a.y < b.y; });
    EXPECT_EQ(std::adjacent_find(fallen.begin(), fallen.end()), fallen.end());
}

TEST_F(CollapseSystemTest, LargeIslandUsesBigCue) {
    build(
        "#####\n"
        "#...#\n"
        "#...#\n"
        "#####\n"
        "#####\n");
    CollapseConfig config = seeded_config();
    config.big_collapse_threshold = 4;
    init(config);

    CollapseResult result = system.destroy(at(3, 2));

    EXPECT_EQ(result.fallen.size(), 5u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleBig), 1u);
    EXPECT_EQ(effects.count(SoundCue::CrumbleSmall), 0u);
}

TEST_F(CollapseSystemTest, RegionWithSupportedMemberStays) {
    build(
        "#####\n"
        "#...#\n"
        "#.#..\n"
        "#.###\n");
    init();

    // (1,1) loses every ray but its land mass reaches the right edge at (4,1)
    EXPECT_TRUE(system.support().is_supported(at(4, 1)));

    CollapseResult result = system.destroy(at(1, 0));

    EXPECT_FALSE(system.support().is_supported(at(1, 1)));
    EXPECT_EQ(result.response, CollapseResponse::None);
    EXPECT_TRUE(result.fallen.empty());
    EXPECT_EQ(grid.available_count(), 6u);
}

TEST_F(CollapseSystemTest, FallenTilesStayFallen) {
    build(
        "###\n"
        "#.#\n"
        "#.#\n");
    init();
    (void)system.destroy(at(1, 0));
    ASSERT_EQ(at(1, 1).state(), TileState::Fallen);

    CollapseResult result = system.destroy(at(1, 1));
    EXPECT_FALSE(result.destroyed);
    EXPECT_EQ(at(1, 1).state(), TileState::Fallen);

    (void)system.hit(at(1, 1));
    EXPECT_EQ(at(1, 1).state(), TileState::Fallen);
}

// ============================================================================
// Tie Break
// ============================================================================

TEST_F(CollapseSystemTest, TieBreakPrefersSmallerRegion) {
    ASSERT_TRUE(grid.build(4, 1));
    init();
    grid::TileRegion small = {&at(0, 0)};
    grid::TileRegion large = {&at(2, 0), &at(3, 0)};

    EXPECT_EQ(&system.choose_region_to_collapse(small, large), &small);
    EXPECT_EQ(&system.choose_region_to_collapse(large, small), &small);
}

TEST_F(CollapseSystemTest, TieBreakKeepsAvatarSide) {
    ASSERT_TRUE(grid.build(4, 1));
    init();
    grid::TileRegion left = {&at(0, 0)};
    grid::TileRegion right = {&at(3, 0)};

    // No avatar: the first region goes
    EXPECT_EQ(&system.choose_region_to_collapse(left, right), &left);

    avatars.avatar = Coordinate(0, 0);
    EXPECT_EQ(&system.choose_region_to_collapse(left, right), &right);

    avatars.avatar = Coordinate(3, 0);
    EXPECT_EQ(&system.choose_region_to_collapse(left, right), &left);
}

// ============================================================================
// Probe Geometry
// ============================================================================

TEST_F(CollapseSystemTest, ClassifyBoundary) {
    ASSERT_TRUE(grid.build(3, 3));
    init();

    BoundaryContact none = system.classify_boundary({&at(1, 1)});
    EXPECT_EQ(none.count(), 0);

    BoundaryContact corner = system.classify_boundary({&at(0, 0)});
    EXPECT_TRUE(corner.left);
    EXPECT_TRUE(corner.bottom);
    EXPECT_FALSE(corner.right);
    EXPECT_FALSE(corner.top);

    BoundaryContact opposite = system.classify_boundary({&at(2, 1), &at(1, 2)});
    EXPECT_TRUE(opposite.right);
    EXPECT_TRUE(opposite.top);
    EXPECT_EQ(opposite.count(), 2);
}

TEST_F(CollapseSystemTest, AxisProbesFindFirstAvailable) {
    build(
        "...\n"
        ".#.\n"
        "...\n");
    init();

    AxisProbes horizontal = system.find_axis_probes({&at(1, 1)}, {1, 0});
    ASSERT_NE(horizontal.positive, nullptr);
    ASSERT_NE(horizontal.negative, nullptr);
    EXPECT_EQ(horizontal.positive->coordinate(), Coordinate(2, 1));
    EXPECT_EQ(horizontal.negative->coordinate(), Coordinate(0, 1));

    AxisProbes vertical = system.find_axis_probes({&at(1, 1)}, {0, 1});
    ASSERT_NE(vertical.positive, nullptr);
    ASSERT_NE(vertical.negative, nullptr);
    EXPECT_EQ(vertical.positive->coordinate(), Coordinate(1, 2));
    EXPECT_EQ(vertical.negative->coordinate(), Coordinate(1, 0));
}

TEST_F(CollapseSystemTest, AxisProbesMissingAtEdge) {
    build(
        "#..\n"
        "#..\n");
    init();

    AxisProbes horizontal = system.find_axis_probes({&at(0, 0), &at(0, 1)}, {1, 0});
    ASSERT_NE(horizontal.positive, nullptr);
    EXPECT_EQ(horizontal.positive->coordinate(), Coordinate(1, 0));
    EXPECT_EQ(horizontal.negative, nullptr);
}

// ============================================================================
// Hit Handling
// ============================================================================

TEST_F(CollapseSystemTest, HitLandsOnHittableOccupant) {
    ASSERT_TRUE(grid.build(3, 3));
    clock.set(2.0);
    init();
    FakeOccupant enemy(true);
    at(1, 1).add_occupant(&enemy);

    CollapseResult result = system.hit(at(1, 1));

    EXPECT_TRUE(result.occupants_hit);
    EXPECT_FALSE(result.destroyed);
    EXPECT_EQ(enemy.hits, 1);
    EXPECT_EQ(enemy.deaths, 0);
    EXPECT_EQ(at(1, 1).state(), TileState::Active);
    EXPECT_TRUE(effects.calls.empty());

    ASSERT_TRUE(at(1, 1).acknowledge_at().has_value());
    EXPECT_DOUBLE_EQ(*at(1, 1).acknowledge_at(), 2.25);
    EXPECT_EQ(system.get_stats().occupant_hits, 1u);
}

TEST_F(CollapseSystemTest, HitSkipsOccupantThatCannotBeHit) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    FakeOccupant enemy(true);
    enemy.accepting_hits = false;
    at(1, 1).add_occupant(&enemy);

    CollapseResult result = system.hit(at(1, 1));

    EXPECT_TRUE(result.occupants_hit);
    EXPECT_EQ(enemy.hits, 0);
    EXPECT_EQ(at(1, 1).state(), TileState::Active);
    EXPECT_TRUE(at(1, 1).acknowledge_at().has_value());
}

TEST_F(CollapseSystemTest, HitOnEmptyTileDestroysIt) {
    ASSERT_TRUE(grid.build(3, 3));
    init();

    CollapseResult result = system.hit(at(1, 1));

    EXPECT_FALSE(result.occupants_hit);
    EXPECT_TRUE(result.destroyed);
    EXPECT_EQ(at(1, 1).state(), TileState::Destroyed);
}

TEST_F(CollapseSystemTest, HitPassesThroughKillableOnlyOccupant) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    FakeOccupant body(false);
    at(1, 1).add_occupant(&body);

    CollapseResult result = system.hit(at(1, 1));

    EXPECT_TRUE(result.destroyed);
    EXPECT_EQ(body.hits, 0);
    EXPECT_EQ(body.deaths, 1);
}

TEST_F(CollapseSystemTest, CanBeHitClearsPendingAcknowledgment) {
    ASSERT_TRUE(grid.build(3, 3));
    init();
    FakeOccupant enemy(true);
    at(1, 1).add_occupant(&enemy);

    (void)system.hit(at(1, 1));
    ASSERT_TRUE(at(1, 1).acknowledge_at().has_value());

    EXPECT_TRUE(at(1, 1).can_be_hit({0, 0}));
    EXPECT_FALSE(at(1, 1).acknowledge_at().has_value());
    EXPECT_FALSE(at(1, 1).hit_processed(100.0));
}

// ============================================================================
// Events and Statistics
// ============================================================================

TEST_F(CollapseSystemTest, CallbackFiresOnlyWhenTilesFall) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    std::vector<CollapseEvent> events;
    system.set_collapse_callback([&events](const CollapseEvent& event) { events.push_back(event); });

    clock.set(4.0);
    (void)destroy_column(1);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].trigger_position, Coordinate(1, 4));
    EXPECT_EQ(events[0].response, CollapseResponse::LandMassCut);
    EXPECT_EQ(events[0].fallen.size(), 5u);
    EXPECT_DOUBLE_EQ(events[0].timestamp, 4.0);
}

TEST_F(CollapseSystemTest, StatsTrackResponses) {
    ASSERT_TRUE(grid.build(5, 5));
    init();

    (void)destroy_column(2);

    auto stats = system.get_stats();
    EXPECT_EQ(stats.tiles_destroyed, 5u);
    EXPECT_EQ(stats.land_mass_cuts, 1u);
    EXPECT_EQ(stats.local_collapses, 0u);
    EXPECT_EQ(stats.tiles_fallen, 10u);
}

TEST_F(CollapseSystemTest, StatsCountLocalCollapses) {
    build(
        "###\n"
        "#.#\n"
        "#.#\n");
    init();

    (void)system.destroy(at(1, 0));

    auto stats = system.get_stats();
    EXPECT_EQ(stats.local_collapses, 1u);
    EXPECT_EQ(stats.land_mass_cuts, 0u);
    EXPECT_EQ(stats.tiles_fallen, 1u);
}

TEST_F(CollapseSystemTest, ResponseNames) {
    EXPECT_STREQ(collapse_response_to_string(CollapseResponse::None), "None");
    EXPECT_STREQ(collapse_response_to_string(CollapseResponse::LandMassCut), "LandMassCut");
    EXPECT_STREQ(collapse_response_to_string(CollapseResponse::LocalUnsupported), "LocalUnsupported");
}

}  // namespace
}  // namespace crumble::collapse

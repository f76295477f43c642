// Crumble Engine Core
// core.hpp - Forward declarations and common aliases

#pragma once

#include <cstddef>
#include <cstdint>

namespace crumble::core {

// Forward declarations
class Config;
class Logger;

// Time is tracked in seconds on the game clock
using Seconds = double;

}  // namespace crumble::core

namespace crumble::grid {

class Tile;
class Grid;
class IOccupant;
class LevelLayout;
class SupportAnalyzer;

}  // namespace crumble::grid

namespace crumble::collapse {

class CollapseSystem;
class IEffectsSink;
class IAvatarLocator;

}  // namespace crumble::collapse

#pragma once
#include <raylib.h>
#include <array>
#include <string>
#include <vector>
#include "constant.hpp"
#include "colorGradient.hpp"

struct GameConfig
{
    // Board
    int gridSize = DEFAULT_GRID_SIZE; // cells per side, 0..MAX_GRID_SIZE
    std::array<int, BODY_TYPE_COUNT> poolSizes = {DEFAULT_POOL_SIZE, DEFAULT_POOL_SIZE, DEFAULT_POOL_SIZE}; // indexed by body type - 1

    // Spawn loop; tick interval is spawnWaitTime * spawnSpeed
    float spawnWaitTime = DEFAULT_SPAWN_WAIT_TIME;
    float spawnSpeed = DEFAULT_SPAWN_SPEED;

    // Animation timings (seconds)
    float spawnAnimationTime = DEFAULT_SPAWN_ANIMATION_TIME;
    float plainDeathAnimationTime = DEFAULT_DEATH_ANIMATION_TIME;
    float coloredDeathAnimationTime = DEFAULT_DEATH_ANIMATION_TIME;
    float hitAnimationTime = HIT_ANIMATION_TIME;

    // Camera orbit (degrees per frame)
    float orbitSpeed = DEFAULT_ORBIT_SPEED;

    // Health fraction (0 = dead, 1 = full) to display color
    ColorGradient healthGradient = ColorGradient::HealthDefault();

    float spawnInterval() const { return this->spawnWaitTime * this->spawnSpeed; }
};

/**
 * @brief Named handle to one numeric config field, used for load/save.
 *
 * Exactly one of `floatPtr` / `intPtr` is set.
 */
struct ConfigParam
{
    std::string name;
    float *floatPtr = nullptr;
    int *intPtr = nullptr;
};

std::vector<ConfigParam> GetConfigParams(GameConfig &cfg);

/**
 * @brief Clamp every field into its legal range.
 */
void ClampConfig(GameConfig &cfg);

/**
 * @brief Read `key=value` lines from `path` into `cfg`.
 *
 * Unknown keys and unparsable values are skipped with a warning; fields not
 * present keep their current value. Returns false if the file cannot be
 * opened. The result is clamped.
 */
bool LoadConfig(const std::string &path, GameConfig &cfg);

bool SaveConfig(const std::string &path, const GameConfig &cfg);

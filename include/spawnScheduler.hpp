#pragma once
#include <optional>
#include <raylib.h>
#include "occupancyGrid.hpp"

class EnemyPool;
class Enemy;
struct GameConfig;

/**
 * @brief Result of a tick that put an enemy on the board.
 */
struct SpawnEvent
{
    GridCell cell;
    int enemyIndex;
};

struct SpawnStats
{
    int ticks = 0;
    int spawned = 0;
    int skippedNoCell = 0;
    int skippedNoEnemy = 0;
    int killed = 0;
};

/**
 * @brief Timed loop that places pooled enemies on free grid cells.
 *
 * Waits `spawnWaitTime * spawnSpeed` seconds, runs one `tick()`, then waits
 * again. At most one tick runs per `update()`. Running out of free cells or
 * inactive enemies makes the tick a no-op; the loop keeps going.
 */
class SpawnScheduler
{
private:
    OccupancyGrid &grid;
    EnemyPool &pool;
    const GameConfig &config;
    float timer = 0.0f;
    SpawnStats stats;

public:
    SpawnScheduler(OccupancyGrid &g, EnemyPool &p, const GameConfig &cfg) : grid(g), pool(p), config(cfg) {}

    std::optional<SpawnEvent> update(float deltaSeconds);

    /**
     * @brief One spawn attempt: claim a free cell, pick an inactive enemy,
     * activate it there. The cell is released again if no enemy is free.
     */
    std::optional<SpawnEvent> tick();

    /**
     * @brief World-space rest position for `enemy` standing on `cell`.
     *
     * The board is centered on the origin; the enemy's half size offsets it
     * inside the cell and lifts it so its base sits at y = 0.
     */
    Vector3 cellToWorld(const GridCell &cell, const Enemy &enemy) const;

    void recordKill() { this->stats.killed++; }
    const SpawnStats &getStats() const { return this->stats; }
    float getTimer() const { return this->timer; }
    void resetTimer() { this->timer = 0.0f; }
    void resetStats() { this->stats = SpawnStats{}; }
};

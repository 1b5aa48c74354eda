#pragma once
#include <memory>
#include "gameConfig.hpp"
#include "occupancyGrid.hpp"
#include "enemyPool.hpp"
#include "spawnScheduler.hpp"
#include "pickWorld.hpp"
#include "inputDispatcher.hpp"
#include "updateContext.hpp"

enum class GameState
{
    STOP,
    PLAY
};

/**
 * @brief Owns one round of the game: board, pool, spawner and picking.
 *
 * GameSession is constructed explicitly and handed to whoever needs it;
 * there is no global instance. `Update(UpdateContext&)` runs one frame:
 * input dispatch, spawn loop, enemy animations, returning dead enemies to
 * the pool (freeing their grid cell), then syncing the pick world.
 */
class GameSession
{
private:
    GameConfig config;
    GameState state = GameState::PLAY;
    OccupancyGrid grid;
    EnemyPool pool;
    SpawnScheduler scheduler;
    std::unique_ptr<PickWorld> pickWorld;
    std::unique_ptr<InputDispatcher> dispatcher;
    HitReport lastHit;

public:
    explicit GameSession(const GameConfig &cfg);
    GameSession(const GameConfig &cfg, const std::vector<PoolEntry> &poolTable);

    GameSession(const GameSession &) = delete;
    GameSession &operator=(const GameSession &) = delete;

    /**
     * @brief Advance the session by one frame.
     *
     * @param uc Frame context with the pointer snapshot and frame delta.
     */
    void Update(UpdateContext &uc);

    /**
     * @brief Draw board and enemies. Call inside BeginMode3D/EndMode3D.
     */
    void DrawScene() const;

    /**
     * @brief Clear the board and return every enemy to the pool.
     */
    void Restart();

    void setState(GameState newState);
    void togglePause() { this->setState(this->state == GameState::PLAY ? GameState::STOP : GameState::PLAY); }
    GameState getState() const { return this->state; }

    const GameConfig &getConfig() const { return this->config; }
    OccupancyGrid &getGrid() { return this->grid; }
    EnemyPool &getPool() { return this->pool; }
    SpawnScheduler &getScheduler() { return this->scheduler; }
    PickWorld &getPickWorld() { return *this->pickWorld; }
    const HitReport &getLastHit() const { return this->lastHit; }
    const SpawnStats &getStats() const { return this->scheduler.getStats(); }
};

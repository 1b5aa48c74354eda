#include "gameSession.hpp"
#include <raymath.h>

GameSession::GameSession(const GameConfig &cfg)
    : GameSession(cfg, EnemyPool::TableFromConfig(cfg))
{
}

GameSession::GameSession(const GameConfig &cfg, const std::vector<PoolEntry> &poolTable)
    : config(cfg),
      grid(cfg.gridSize),
      pool(poolTable, config),
      scheduler(grid, pool, config)
{
    this->pickWorld = std::make_unique<PickWorld>(this->pool);
    this->dispatcher = std::make_unique<InputDispatcher>(*this->pickWorld);
    TraceLog(LOG_INFO, "Game session started: %dx%d grid, %d enemies, spawn every %.2fs",
             this->grid.getSize(), this->grid.getSize(), this->pool.size(), this->config.spawnInterval());
}

void GameSession::setState(GameState newState)
{
    if (this->state == newState)
        return;
    this->state = newState;
    TraceLog(LOG_INFO, "Game state -> %s", newState == GameState::PLAY ? "PLAY" : "STOP");
}

void GameSession::Update(UpdateContext &uc)
{
    this->lastHit = this->dispatcher->dispatch(uc.pointerInput);

    if (this->state == GameState::PLAY)
        this->scheduler.update(uc.deltaSeconds);

    for (const auto &enemy : this->pool.getEnemies())
    {
        if (enemy->update(uc.deltaSeconds))
        {
            // Back in the pool: its cell is free for the next spawn
            this->grid.markFree(enemy->getCell());
            this->scheduler.recordKill();
            TraceLog(LOG_DEBUG, "Enemy %d returned to pool, cell (%d, %d) freed", enemy->getIndex(), enemy->getCell().x, enemy->getCell().z);
        }
    }

    this->pickWorld->sync();
}

void GameSession::Restart()
{
    this->pool.reset();
    this->grid.clear();
    this->scheduler.resetTimer();
    this->scheduler.resetStats();
    this->pickWorld->sync();
    this->lastHit = HitReport{};
    TraceLog(LOG_INFO, "Game session restarted");
}

void GameSession::DrawScene() const
{
    float size = (float)this->grid.getSize();
    Color boardColor = BOARD_COLOR;
    Color lineColor = BOARD_LINE_COLOR;
    DrawPlane({0.0f, 0.0f, 0.0f}, {size, size}, boardColor);

    float half = size * 0.5f;
    for (int i = 0; i <= this->grid.getSize(); i++)
    {
        float offset = (float)i - half;
        DrawLine3D({offset, 0.01f, -half}, {offset, 0.01f, half}, lineColor);
        DrawLine3D({-half, 0.01f, offset}, {half, 0.01f, offset}, lineColor);
    }

    for (const auto &enemy : this->pool.getEnemies())
        enemy->Draw();
}

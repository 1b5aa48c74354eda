#include "spawnScheduler.hpp"
#include "enemyPool.hpp"
#include "gameConfig.hpp"

std::optional<SpawnEvent> SpawnScheduler::update(float deltaSeconds)
{
    this->timer += deltaSeconds;
    if (this->timer < this->config.spawnInterval())
        return std::nullopt;

    // Wait restarts after each attempt; missed intervals are not caught up
    this->timer = 0.0f;
    return this->tick();
}

std::optional<SpawnEvent> SpawnScheduler::tick()
{
    this->stats.ticks++;

    auto spot = this->grid.findRandomFreeCell();
    if (!spot)
    {
        this->stats.skippedNoCell++;
        return std::nullopt;
    }
    this->grid.markOccupied(*spot);
    TraceLog(LOG_DEBUG, "Free spot selected = (%d, %d)", spot->x, spot->z);

    auto enemyIndex = this->pool.findRandomInactiveEntity();
    if (!enemyIndex)
    {
        this->grid.markFree(*spot);
        this->stats.skippedNoEnemy++;
        return std::nullopt;
    }

    Enemy &enemy = this->pool.at(*enemyIndex);
    enemy.activate(*spot, this->cellToWorld(*spot, enemy));
    this->stats.spawned++;
    TraceLog(LOG_DEBUG, "Enemy %d (%s, %s) is spawning", *enemyIndex, BodyTypeName(enemy.getBodyType()), VariantName(enemy.getVariant()));

    return SpawnEvent{*spot, *enemyIndex};
}

Vector3 SpawnScheduler::cellToWorld(const GridCell &cell, const Enemy &enemy) const
{
    const Vector3 &half = enemy.getHalfSize();
    float origin = this->grid.getSize() * 0.5f;
    return {cell.x - origin + half.x, half.y, cell.z - origin + half.z};
}

#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "enemy.hpp"

struct GameConfig;

/**
 * @brief One row of the pool table: how many enemies of a body type.
 */
struct PoolEntry
{
    EnemyBodyType type;
    int count;
};

/**
 * @brief Fixed set of enemies created once and reused across spawns.
 *
 * Each enemy's behavior variant is a 50/50 coin flip made at construction.
 * Indices follow construction order and never change.
 */
class EnemyPool
{
private:
    std::vector<std::unique_ptr<Enemy>> enemies;
    std::vector<int> inactiveScratch;

public:
    EnemyPool(const std::vector<PoolEntry> &table, const GameConfig &cfg);

    /**
     * @brief Pool table built from `cfg.poolSizes` (Small, Medium, Large).
     */
    static std::vector<PoolEntry> TableFromConfig(const GameConfig &cfg);

    /**
     * @brief Pick an inactive enemy uniformly at random.
     *
     * @return its index, or std::nullopt when every enemy is on the board.
     */
    std::optional<int> findRandomInactiveEntity();

    Enemy &at(int index) { return *this->enemies.at(index); }
    const Enemy &at(int index) const { return *this->enemies.at(index); }
    int size() const { return (int)this->enemies.size(); }
    int activeCount() const;
    int countVariant(EnemyVariant variant) const;

    /**
     * @brief Return every enemy to the pool immediately.
     */
    void reset();

    const std::vector<std::unique_ptr<Enemy>> &getEnemies() const { return this->enemies; }
};

#include "enemyPool.hpp"
#include "gameConfig.hpp"
#include "randomUtil.hpp"

EnemyPool::EnemyPool(const std::vector<PoolEntry> &table, const GameConfig &cfg)
{
    // Loop through body types, then through the pool size of each
    for (const auto &entry : table)
    {
        if (!IsValidBodyType(entry.type))
        {
            TraceLog(LOG_WARNING, "Skipping pool entry with invalid body type %d", (int)entry.type);
            continue;
        }
        for (int j = 0; j < entry.count; j++)
        {
            // 50% chance of the enemy having either behavior
            EnemyVariant variant = RandomCoinFlip() ? EnemyVariant::Plain : EnemyVariant::Colored;
            int index = (int)this->enemies.size();
            this->enemies.push_back(std::make_unique<Enemy>(index, entry.type, variant, cfg));
        }
    }
    this->inactiveScratch.reserve(this->enemies.size());
    TraceLog(LOG_INFO, "Enemy pool created: %d enemies (%d plain, %d colored)",
             this->size(), this->countVariant(EnemyVariant::Plain), this->countVariant(EnemyVariant::Colored));
}

std::vector<PoolEntry> EnemyPool::TableFromConfig(const GameConfig &cfg)
{
    std::vector<PoolEntry> table;
    for (int i = 0; i < BODY_TYPE_COUNT; i++)
        table.push_back({(EnemyBodyType)(i + 1), cfg.poolSizes[i]});
    return table;
}

std::optional<int> EnemyPool::findRandomInactiveEntity()
{
    // Stash the indices of all enemies not on the board
    this->inactiveScratch.clear();
    for (int i = 0; i < this->size(); i++)
    {
        if (!this->enemies[i]->isActive())
            this->inactiveScratch.push_back(i);
    }

    if (this->inactiveScratch.empty())
        return std::nullopt;

    return this->inactiveScratch[RandomIndex((int)this->inactiveScratch.size())];
}

int EnemyPool::activeCount() const
{
    int count = 0;
    for (const auto &e : this->enemies)
    {
        if (e->isActive())
            count++;
    }
    return count;
}

int EnemyPool::countVariant(EnemyVariant variant) const
{
    int count = 0;
    for (const auto &e : this->enemies)
    {
        if (e->getVariant() == variant)
            count++;
    }
    return count;
}

void EnemyPool::reset()
{
    for (auto &e : this->enemies)
        e->deactivate();
}

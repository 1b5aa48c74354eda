#pragma once
#include <memory>
#include <vector>
#include <raylib.h>
#include <btBulletCollisionCommon.h>

class Enemy;
class EnemyPool;

/**
 * @brief Bullet collision world used to resolve pointer rays to enemies.
 *
 * Holds a static floor plane at y = 0 and one collision object per pooled
 * enemy (box, sphere or cylinder by body type). An enemy's object is in the
 * world only while its collider is enabled; `sync()` mirrors that flag and
 * the enemy's transform and scale every frame.
 */
class PickWorld
{
private:
    struct EnemyCollider
    {
        Enemy *enemy = nullptr;
        std::unique_ptr<btCollisionShape> shape;
        std::unique_ptr<btCollisionObject> object;
        bool inWorld = false;
    };

    std::unique_ptr<btDefaultCollisionConfiguration> bulletConfig;
    std::unique_ptr<btCollisionDispatcher> bulletDispatcher;
    std::unique_ptr<btBroadphaseInterface> bulletBroadphase;
    std::unique_ptr<btCollisionWorld> bulletWorld;

    std::unique_ptr<btCollisionShape> floorShape;
    std::unique_ptr<btCollisionObject> floorObject;
    std::vector<EnemyCollider> colliders;

    static btCollisionShape *CreateShapeForEnemy(const Enemy &enemy);
    void syncTransform(EnemyCollider &collider);

public:
    explicit PickWorld(EnemyPool &pool);
    ~PickWorld();

    PickWorld(const PickWorld &) = delete;
    PickWorld &operator=(const PickWorld &) = delete;

    void sync();

    /**
     * @brief Closest enemy hit by `ray` within `maxDistance`.
     *
     * @return the enemy, or nullptr if the ray hits nothing or only the
     * floor.
     */
    Enemy *pick(const Ray &ray, float maxDistance) const;

    int collidersInWorld() const;
};

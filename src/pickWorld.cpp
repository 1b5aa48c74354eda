#include "pickWorld.hpp"
#include <raymath.h>
#include <cmath>
#include "enemyPool.hpp"

namespace
{
    constexpr float minimumScale = 0.01f;

    btVector3 ToBtVector(const Vector3 &v)
    {
        return btVector3(v.x, v.y, v.z);
    }
}

PickWorld::PickWorld(EnemyPool &pool)
{
    this->bulletConfig = std::make_unique<btDefaultCollisionConfiguration>();
    this->bulletDispatcher = std::make_unique<btCollisionDispatcher>(this->bulletConfig.get());
    this->bulletBroadphase = std::make_unique<btDbvtBroadphase>();
    this->bulletWorld = std::make_unique<btCollisionWorld>(this->bulletDispatcher.get(), this->bulletBroadphase.get(), this->bulletConfig.get());

    // The floor catches rays that miss every enemy; it carries no user pointer
    this->floorShape = std::make_unique<btStaticPlaneShape>(btVector3(0.0f, 1.0f, 0.0f), 0.0f);
    this->floorObject = std::make_unique<btCollisionObject>();
    this->floorObject->setCollisionShape(this->floorShape.get());
    this->floorObject->setUserPointer(nullptr);
    this->bulletWorld->addCollisionObject(this->floorObject.get());

    this->colliders.resize(pool.size());
    for (int i = 0; i < pool.size(); i++)
    {
        EnemyCollider &collider = this->colliders[i];
        collider.enemy = &pool.at(i);
        collider.shape.reset(PickWorld::CreateShapeForEnemy(*collider.enemy));
        collider.object = std::make_unique<btCollisionObject>();
        collider.object->setCollisionShape(collider.shape.get());
        collider.object->setUserPointer(collider.enemy);
    }
    this->sync();
}

PickWorld::~PickWorld()
{
    for (auto &collider : this->colliders)
    {
        if (collider.inWorld)
            this->bulletWorld->removeCollisionObject(collider.object.get());
    }
    this->bulletWorld->removeCollisionObject(this->floorObject.get());
}

btCollisionShape *PickWorld::CreateShapeForEnemy(const Enemy &enemy)
{
    const Vector3 &half = enemy.getHalfSize();
    switch (enemy.getBodyType())
    {
    case EnemyBodyType::Medium:
        return new btSphereShape(half.x);
    case EnemyBodyType::Large:
        return new btCylinderShape(ToBtVector(half));
    case EnemyBodyType::Small:
    default:
        return new btBoxShape(ToBtVector(half));
    }
}

void PickWorld::syncTransform(EnemyCollider &collider)
{
    const Vector3 &scale = collider.enemy->getScale();
    collider.shape->setLocalScaling(btVector3(fmaxf(scale.x, minimumScale),
                                              fmaxf(scale.y, minimumScale),
                                              fmaxf(scale.z, minimumScale)));

    btTransform transform;
    transform.setIdentity();
    transform.setOrigin(ToBtVector(collider.enemy->getPosition()));
    collider.object->setWorldTransform(transform);
    this->bulletWorld->updateSingleAabb(collider.object.get());
}

void PickWorld::sync()
{
    for (auto &collider : this->colliders)
    {
        bool wanted = collider.enemy->isColliderEnabled();
        if (wanted && !collider.inWorld)
        {
            this->bulletWorld->addCollisionObject(collider.object.get());
            collider.inWorld = true;
        }
        else if (!wanted && collider.inWorld)
        {
            this->bulletWorld->removeCollisionObject(collider.object.get());
            collider.inWorld = false;
        }

        if (collider.inWorld)
            this->syncTransform(collider);
    }
}

Enemy *PickWorld::pick(const Ray &ray, float maxDistance) const
{
    Vector3 direction = Vector3Normalize(ray.direction);
    if (Vector3LengthSqr(direction) < 0.0001f)
        return nullptr;

    btVector3 from = ToBtVector(ray.position);
    btVector3 to = ToBtVector(Vector3Add(ray.position, Vector3Scale(direction, maxDistance)));
    btCollisionWorld::ClosestRayResultCallback callback(from, to);
    this->bulletWorld->rayTest(from, to, callback);
    if (!callback.hasHit() || !callback.m_collisionObject)
        return nullptr;

    return static_cast<Enemy *>(callback.m_collisionObject->getUserPointer());
}

int PickWorld::collidersInWorld() const
{
    int count = 0;
    for (const auto &collider : this->colliders)
    {
        if (collider.inWorld)
            count++;
    }
    return count;
}

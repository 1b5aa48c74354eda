#pragma once
#include <raylib.h>
#include "constant.hpp"
#include "occupancyGrid.hpp"
#include "tween.hpp"

struct GameConfig;

/**
 * @brief Size category of an enemy. The numeric value scales max health.
 */
enum class EnemyBodyType
{
    Small = 1,  // cube
    Medium = 2, // sphere
    Large = 3,  // cylinder
};

/**
 * @brief Behavior chosen once when the pool is built.
 *
 * Plain enemies only lose health; Colored enemies also recolor from the
 * health gradient on every hit and on respawn.
 */
enum class EnemyVariant
{
    Plain,
    Colored,
};

enum class EnemyState
{
    Inactive, // in the pool, not on the board
    Active,   // on the board, can be hit
    Dying,    // shrink animation running, collider off
};

bool IsValidBodyType(EnemyBodyType type);
const char *BodyTypeName(EnemyBodyType type);
const char *VariantName(EnemyVariant variant);

/**
 * @brief Half extents of the rendered shape for a body type.
 */
Vector3 BodyHalfSize(EnemyBodyType type);

/**
 * @brief Pooled whack-a-mole enemy.
 *
 * Lifecycle is driven entirely by its owner: `activate()` on spawn,
 * `update(dt)` every frame and `applyLightHit()` / `applyHeavyHit()` from
 * input. Health drops below zero -> Dying; when the shrink animation
 * finishes the enemy goes Inactive and `update()` returns true once so the
 * owner can release `getCell()`.
 */
class Enemy
{
private:
    int index;
    EnemyBodyType bodyType;
    EnemyVariant variant;
    const GameConfig *config;

    EnemyState state = EnemyState::Inactive;
    int health = 0;
    bool colliderEnabled = false;
    GridCell cell;

    Vector3 position = {0.0f, 0.0f, 0.0f};
    Vector3 halfSize;
    Vector3 scale = {1.0f, 1.0f, 1.0f};
    Color color = PLAIN_ENEMY_COLOR;

    // Rise from below the board on spawn
    Tween riseAnimation;
    float riseStartY = 0.0f;
    float riseEndY = 0.0f;

    Tween lightHitAnimation;
    Tween heavyHitAnimation;

    Tween deathAnimation;
    Vector3 deathStartScale = {1.0f, 1.0f, 1.0f};

    void onDeath();
    void postHitAnimation(bool lightHit);
    void pauseHitAnimations();
    void changeColor();
    void changeColor(float healthFraction);
    float deathDuration() const;

public:
    Enemy(int poolIndex, EnemyBodyType type, EnemyVariant behavior, const GameConfig &cfg);

    /**
     * @brief Respawn at `cell`, rising to `restPosition`.
     *
     * Resets health to full, scale to neutral and re-enables the collider.
     * The enemy starts `2 * halfSize.y` below `restPosition` and eases up
     * over the configured spawn time.
     */
    void activate(const GridCell &spawnCell, Vector3 restPosition);

    /**
     * @brief Always-landing hit. Ignored unless Active.
     *
     * @return true if the hit was applied.
     */
    bool applyLightHit(int damage = LIGHT_HIT_DAMAGE);

    /**
     * @brief Hit that lands only when a uniform draw in [0,1] exceeds
     * `missChance`. Ignored unless Active.
     *
     * @return true if the hit landed.
     */
    bool applyHeavyHit(int damage, float missChance);

    /**
     * @brief Advance animations by `deltaSeconds`.
     *
     * @return true on the frame the death animation finishes and the enemy
     * returns to the pool.
     */
    bool update(float deltaSeconds);

    /**
     * @brief Return to the pool immediately, skipping any animation.
     */
    void deactivate();

    void Draw() const;

    int getIndex() const { return this->index; }
    EnemyBodyType getBodyType() const { return this->bodyType; }
    EnemyVariant getVariant() const { return this->variant; }
    EnemyState getState() const { return this->state; }
    bool isActive() const { return this->state != EnemyState::Inactive; }
    bool isDamageable() const { return this->state == EnemyState::Active; }
    bool isColliderEnabled() const { return this->colliderEnabled; }
    int getHealth() const { return this->health; }
    int getMaxHealth() const { return (int)this->bodyType * HEALTH_PER_BODY_SIZE; }
    const GridCell &getCell() const { return this->cell; }
    const Vector3 &getPosition() const { return this->position; }
    const Vector3 &getHalfSize() const { return this->halfSize; }
    const Vector3 &getScale() const { return this->scale; }
    Color getColor() const { return this->color; }
    bool isLightHitPlaying() const { return this->lightHitAnimation.isPlaying(); }
    bool isHeavyHitPlaying() const { return this->heavyHitAnimation.isPlaying(); }
};

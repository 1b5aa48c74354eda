#include "enemy.hpp"
#include <raymath.h>
#include <cmath>
#include "gameConfig.hpp"
#include "randomUtil.hpp"

bool IsValidBodyType(EnemyBodyType type)
{
    int value = (int)type;
    return value >= (int)EnemyBodyType::Small && value <= (int)EnemyBodyType::Large;
}

const char *BodyTypeName(EnemyBodyType type)
{
    switch (type)
    {
    case EnemyBodyType::Small:
        return "small";
    case EnemyBodyType::Medium:
        return "medium";
    case EnemyBodyType::Large:
        return "large";
    }
    return "unknown";
}

const char *VariantName(EnemyVariant variant)
{
    return variant == EnemyVariant::Colored ? "colored" : "plain";
}

Vector3 BodyHalfSize(EnemyBodyType type)
{
    // Unit cube, unit-diameter sphere, cylinder of radius 0.5 and height 2
    if (type == EnemyBodyType::Large)
        return {0.5f, 1.0f, 0.5f};
    return {0.5f, 0.5f, 0.5f};
}

Enemy::Enemy(int poolIndex, EnemyBodyType type, EnemyVariant behavior, const GameConfig &cfg)
    : index(poolIndex), bodyType(type), variant(behavior), config(&cfg)
{
    this->halfSize = BodyHalfSize(type);
    this->riseAnimation = Tween(cfg.spawnAnimationTime, Ease::OutQuad);
    this->lightHitAnimation = Tween(cfg.hitAnimationTime, Ease::OutCirc);
    this->heavyHitAnimation = Tween(cfg.hitAnimationTime, Ease::OutCirc);
    this->deathAnimation = Tween(this->deathDuration(), Ease::InBounce);
    this->health = this->getMaxHealth();
    if (this->variant == EnemyVariant::Colored)
        this->changeColor();
}

float Enemy::deathDuration() const
{
    return this->variant == EnemyVariant::Colored ? this->config->coloredDeathAnimationTime
                                                  : this->config->plainDeathAnimationTime;
}

void Enemy::activate(const GridCell &spawnCell, Vector3 restPosition)
{
    this->cell = spawnCell;
    this->state = EnemyState::Active;
    this->colliderEnabled = true;
    this->scale = Vector3One();
    this->health = this->getMaxHealth();

    this->lightHitAnimation.stop();
    this->heavyHitAnimation.stop();
    this->deathAnimation.stop();

    // Set color at respawn
    if (this->variant == EnemyVariant::Colored)
        this->changeColor();

    this->riseEndY = restPosition.y;
    this->riseStartY = restPosition.y - 2.0f * this->halfSize.y;
    this->position = {restPosition.x, this->riseStartY, restPosition.z};
    this->riseAnimation.restart();
}

bool Enemy::applyLightHit(int damage)
{
    if (!this->isDamageable())
        return false;

    this->health -= damage;
    if (this->variant == EnemyVariant::Colored)
        this->changeColor();
    this->postHitAnimation(true);
    TraceLog(LOG_DEBUG, "Enemy %s number %d got light hit. Health left = %d", BodyTypeName(this->bodyType), this->index, this->health);
    // Zero health still counts as alive
    if (this->health < 0)
        this->onDeath();
    return true;
}

bool Enemy::applyHeavyHit(int damage, float missChance)
{
    if (!this->isDamageable())
        return false;

    if (!(RandomUnit() > missChance) || damage <= 0)
    {
        TraceLog(LOG_DEBUG, "Enemy %s number %d dodged heavy hit (miss chance %.2f)", BodyTypeName(this->bodyType), this->index, missChance);
        return false;
    }

    this->health -= damage;
    if (this->variant == EnemyVariant::Colored)
        this->changeColor();
    this->postHitAnimation(false);
    TraceLog(LOG_DEBUG, "Enemy %s number %d got heavy hit. Health left = %d", BodyTypeName(this->bodyType), this->index, this->health);
    // Zero health still counts as alive
    if (this->health < 0)
        this->onDeath();
    return true;
}

void Enemy::postHitAnimation(bool lightHit)
{
    this->pauseHitAnimations();
    if (lightHit)
        this->lightHitAnimation.restart();
    else
        this->heavyHitAnimation.restart();
}

void Enemy::pauseHitAnimations()
{
    this->lightHitAnimation.pause();
    this->heavyHitAnimation.pause();
}

void Enemy::changeColor()
{
    this->changeColor((float)this->health / (float)this->getMaxHealth());
}

void Enemy::changeColor(float healthFraction)
{
    TraceLog(LOG_DEBUG, "Enemy %d changing color (health fraction %.2f)", this->index, healthFraction);
    this->color = this->config->healthGradient.Evaluate(healthFraction);
}

void Enemy::onDeath()
{
    if (this->state != EnemyState::Active)
        return;

    if (this->variant == EnemyVariant::Colored)
        this->changeColor(0.0f);

    this->state = EnemyState::Dying;
    this->colliderEnabled = false;
    this->pauseHitAnimations();
    this->deathStartScale = this->scale;
    this->deathAnimation.restart();
    TraceLog(LOG_DEBUG, "Enemy %s number %d dying at cell (%d, %d)", BodyTypeName(this->bodyType), this->index, this->cell.x, this->cell.z);
}

bool Enemy::update(float deltaSeconds)
{
    if (this->state == EnemyState::Inactive)
        return false;

    if (this->riseAnimation.isPlaying())
    {
        this->riseAnimation.update(deltaSeconds);
        this->position.y = Lerp(this->riseStartY, this->riseEndY, this->riseAnimation.value());
    }

    if (this->state == EnemyState::Dying)
    {
        bool finished = this->deathAnimation.update(deltaSeconds);
        this->scale = Vector3Lerp(this->deathStartScale, Vector3Zero(), this->deathAnimation.value());
        if (finished)
        {
            this->deactivate();
            return true;
        }
        return false;
    }

    Vector3 lightPunch = LIGHT_PUNCH_SCALE;
    Vector3 heavyPunch = HEAVY_PUNCH_SCALE;
    if (this->lightHitAnimation.isPlaying())
    {
        if (this->lightHitAnimation.update(deltaSeconds))
            this->scale = Vector3One();
        else
            this->scale = PunchScale(lightPunch, this->lightHitAnimation.value());
    }
    else if (this->heavyHitAnimation.isPlaying())
    {
        if (this->heavyHitAnimation.update(deltaSeconds))
            this->scale = Vector3One();
        else
            this->scale = PunchScale(heavyPunch, this->heavyHitAnimation.value());
    }
    return false;
}

void Enemy::deactivate()
{
    this->state = EnemyState::Inactive;
    this->colliderEnabled = false;
    this->riseAnimation.stop();
    this->lightHitAnimation.stop();
    this->heavyHitAnimation.stop();
    this->deathAnimation.stop();
}

void Enemy::Draw() const
{
    if (this->state == EnemyState::Inactive)
        return;

    Vector3 size = Vector3Multiply(Vector3Scale(this->halfSize, 2.0f), this->scale);
    switch (this->bodyType)
    {
    case EnemyBodyType::Small:
        DrawCubeV(this->position, size, this->color);
        DrawCubeWiresV(this->position, size, DARKGRAY);
        break;
    case EnemyBodyType::Medium:
    {
        float radius = this->halfSize.x * fmaxf(this->scale.x, fmaxf(this->scale.y, this->scale.z));
        DrawSphere(this->position, radius, this->color);
        break;
    }
    case EnemyBodyType::Large:
    {
        Vector3 base = {this->position.x, this->position.y - size.y * 0.5f, this->position.z};
        float radius = this->halfSize.x * fmaxf(this->scale.x, this->scale.z);
        DrawCylinder(base, radius, radius, size.y, 16, this->color);
        DrawCylinderWires(base, radius, radius, size.y, 16, DARKGRAY);
        break;
    }
    }
}

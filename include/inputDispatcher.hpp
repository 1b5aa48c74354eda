#pragma once
#include "updateContext.hpp"

class Enemy;
class PickWorld;

enum class HitKind
{
    None,
    Light,
    Heavy,
};

/**
 * @brief What a click did this frame.
 *
 * `target` is null when the ray hit nothing damageable; `landed` is false
 * for a heavy hit that missed.
 */
struct HitReport
{
    HitKind kind = HitKind::None;
    Enemy *target = nullptr;
    bool landed = false;
    int damage = 0;
    float missChance = 0.0f;
};

/**
 * @brief Turns pointer clicks into light / heavy hits on picked enemies.
 *
 * Primary click: light hit for LIGHT_HIT_DAMAGE. Secondary click: heavy hit
 * for HEAVY_HIT_DAMAGE with a freshly drawn miss chance. Primary wins when
 * both are pressed in the same frame.
 */
class InputDispatcher
{
private:
    PickWorld &pickWorld;

public:
    explicit InputDispatcher(PickWorld &world) : pickWorld(world) {}

    HitReport dispatch(const PointerInput &input);
};

#include "inputDispatcher.hpp"
#include "constant.hpp"
#include "enemy.hpp"
#include "pickWorld.hpp"
#include "randomUtil.hpp"

HitReport InputDispatcher::dispatch(const PointerInput &input)
{
    HitReport report;
    if (input.lightPressed)
        report.kind = HitKind::Light;
    else if (input.heavyPressed)
        report.kind = HitKind::Heavy;
    else
        return report;

    Enemy *enemy = this->pickWorld.pick(input.ray, PICK_DISTANCE);
    if (!enemy || !enemy->isDamageable())
        return report;

    report.target = enemy;
    if (report.kind == HitKind::Light)
    {
        TraceLog(LOG_DEBUG, "Light Hit");
        report.damage = LIGHT_HIT_DAMAGE;
        report.landed = enemy->applyLightHit(report.damage);
    }
    else
    {
        TraceLog(LOG_DEBUG, "Heavy Hit");
        report.damage = HEAVY_HIT_DAMAGE;
        report.missChance = RandomUnit();
        report.landed = enemy->applyHeavyHit(report.damage, report.missChance);
    }
    return report;
}

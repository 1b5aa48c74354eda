#include <doctest/doctest.h>
#include "gameSession.hpp"
#include "testHelpers.hpp"

namespace
{
    void Step(GameSession &session, float dt, PointerInput input = PointerInput())
    {
        UpdateContext uc(&session, input, dt);
        session.Update(uc);
    }

    PointerInput LightClick(float x, float z) { return PointerInput(true, false, DownwardRay(x, z)); }
    PointerInput HeavyClick(float x, float z) { return PointerInput(false, true, DownwardRay(x, z)); }
}

TEST_CASE("clicking a spawned enemy damages it until it returns to the pool")
{
    GameSession session(TestConfig(1), {{EnemyBodyType::Small, 1}});
    Enemy &enemy = session.getPool().at(0);

    // Spawn tick and rise in one frame
    Step(session, 1.0f);
    REQUIRE(enemy.getState() == EnemyState::Active);
    CHECK(enemy.getPosition().y == doctest::Approx(0.5f));
    CHECK(session.getPickWorld().collidersInWorld() == 1);
    CHECK(session.getPickWorld().pick(DownwardRay(0.0f, 0.0f), PICK_DISTANCE) == &enemy);

    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    CHECK(session.getLastHit().kind == HitKind::Light);
    CHECK(session.getLastHit().target == &enemy);
    CHECK(session.getLastHit().landed);
    CHECK(session.getLastHit().damage == LIGHT_HIT_DAMAGE);
    CHECK(enemy.getHealth() == 2);

    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    CHECK(enemy.getHealth() == 0);
    CHECK(enemy.getState() == EnemyState::Active);

    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    CHECK(enemy.getState() == EnemyState::Dying);
    CHECK(session.getPickWorld().collidersInWorld() == 0);
    CHECK(session.getGrid().isOccupied(0, 0));

    // Clicks on a dying enemy find nothing to hit
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    CHECK(session.getLastHit().target == nullptr);
    CHECK(enemy.getHealth() == -1);

    Step(session, 0.5f);
    CHECK(enemy.getState() == EnemyState::Inactive);
    CHECK_FALSE(session.getGrid().isOccupied(0, 0));
    CHECK(session.getStats().killed == 1);

    // The freed cell is reused by the next tick
    Step(session, 0.5f);
    CHECK(enemy.getState() == EnemyState::Active);
    CHECK(session.getGrid().isOccupied(0, 0));
    CHECK(enemy.getHealth() == 3);
}

TEST_CASE("clicks that miss every enemy do nothing")
{
    GameSession session(TestConfig(3), {{EnemyBodyType::Small, 1}});
    Step(session, 1.0f);
    Enemy &enemy = session.getPool().at(0);
    REQUIRE(enemy.isActive());

    SUBCASE("ray into the floor")
    {
        // Cell opposite the occupied one on the same row
        Vector3 pos = enemy.getPosition();
        float x = pos.x > 0.0f ? -1.0f : 1.0f;
        Step(session, 0.0f, LightClick(x, pos.z));
        CHECK(session.getLastHit().kind == HitKind::Light);
        CHECK(session.getLastHit().target == nullptr);
        CHECK_FALSE(session.getLastHit().landed);
        CHECK(enemy.getHealth() == 3);
    }

    SUBCASE("ray pointing away from the board")
    {
        PointerInput up(true, false, Ray{{0.0f, 10.0f, 0.0f}, {0.0f, 1.0f, 0.0f}});
        Step(session, 0.0f, up);
        CHECK(session.getLastHit().target == nullptr);
        CHECK(enemy.getHealth() == 3);
    }

    SUBCASE("no button pressed")
    {
        Step(session, 0.0f, PointerInput(false, false, DownwardRay(enemy.getPosition().x, enemy.getPosition().z)));
        CHECK(session.getLastHit().kind == HitKind::None);
        CHECK(enemy.getHealth() == 3);
    }
}

TEST_CASE("heavy click reports its roll")
{
    GameSession session(TestConfig(1), {{EnemyBodyType::Large, 1}});
    Step(session, 1.0f);
    Enemy &enemy = session.getPool().at(0);
    REQUIRE(enemy.isDamageable());

    int expectedHealth = enemy.getMaxHealth();
    for (int i = 0; i < 4; i++)
    {
        Step(session, 0.0f, HeavyClick(0.0f, 0.0f));
        const HitReport &hit = session.getLastHit();
        CHECK(hit.kind == HitKind::Heavy);
        CHECK(hit.target == &enemy);
        CHECK(hit.damage == HEAVY_HIT_DAMAGE);
        CHECK(hit.missChance >= 0.0f);
        CHECK(hit.missChance <= 1.0f);
        if (hit.landed)
        {
            expectedHealth -= HEAVY_HIT_DAMAGE;
            CHECK(enemy.isHeavyHitPlaying());
        }
        CHECK(enemy.getHealth() == expectedHealth);
    }
}

TEST_CASE("light click wins when both buttons are pressed")
{
    GameSession session(TestConfig(1), {{EnemyBodyType::Medium, 1}});
    Step(session, 1.0f);
    Enemy &enemy = session.getPool().at(0);

    Step(session, 0.0f, PointerInput(true, true, DownwardRay(0.0f, 0.0f)));
    CHECK(session.getLastHit().kind == HitKind::Light);
    CHECK(enemy.getHealth() == 5);
    CHECK(enemy.isLightHitPlaying());
}

TEST_CASE("stopped session does not spawn")
{
    GameSession session(TestConfig(3));
    session.setState(GameState::STOP);
    for (int i = 0; i < 5; i++)
        Step(session, 1.0f);
    CHECK(session.getPool().activeCount() == 0);
    CHECK(session.getStats().ticks == 0);

    session.togglePause();
    CHECK(session.getState() == GameState::PLAY);
    Step(session, 1.0f);
    CHECK(session.getPool().activeCount() == 1);
}

TEST_CASE("enemies keep animating while stopped")
{
    GameSession session(TestConfig(1), {{EnemyBodyType::Small, 1}});
    Step(session, 1.0f);
    Enemy &enemy = session.getPool().at(0);
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    Step(session, 0.0f, LightClick(0.0f, 0.0f));
    REQUIRE(enemy.getState() == EnemyState::Dying);

    session.setState(GameState::STOP);
    Step(session, 0.5f);
    CHECK(enemy.getState() == EnemyState::Inactive);
    CHECK(session.getGrid().freeCount() == 1);
}

TEST_CASE("restart clears the board")
{
    GameSession session(TestConfig(3));
    for (int i = 0; i < 3; i++)
        Step(session, 1.0f);
    REQUIRE(session.getPool().activeCount() == 3);
    REQUIRE(session.getPickWorld().collidersInWorld() == 3);
    REQUIRE(session.getStats().spawned == 3);

    session.Restart();
    CHECK(session.getStats().ticks == 0);
    CHECK(session.getStats().spawned == 0);
    CHECK(session.getStats().killed == 0);
    CHECK(session.getPool().activeCount() == 0);
    CHECK(session.getGrid().freeCount() == 9);
    CHECK(session.getPickWorld().collidersInWorld() == 0);
    CHECK(session.getScheduler().getTimer() == doctest::Approx(0.0f));
    CHECK(session.getLastHit().kind == HitKind::None);
}

TEST_CASE("session builds its pool from the config")
{
    GameConfig cfg = TestConfig(4);
    cfg.poolSizes = {2, 3, 1};
    GameSession session(cfg);
    CHECK(session.getPool().size() == 6);
    CHECK(session.getGrid().getSize() == 4);
    CHECK(session.getState() == GameState::PLAY);
}

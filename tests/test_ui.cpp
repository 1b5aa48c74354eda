#include <doctest/doctest.h>
#include "gameSession.hpp"
#include "uiManager.hpp"
#include "testHelpers.hpp"

TEST_CASE("pool bar shows the share of enemies on the board")
{
    GameSession session(TestConfig(3), {{EnemyBodyType::Small, 4}});
    UIPoolBar bar(&session);

    bar.update();
    CHECK(bar.getDisplayedPercent() == doctest::Approx(0.0f));

    session.getScheduler().tick();
    bar.update();
    CHECK(bar.getDisplayedPercent() == doctest::Approx(0.25f));

    for (int i = 0; i < 5; i++)
        session.getScheduler().tick();
    bar.update();
    CHECK(bar.getDisplayedPercent() == doctest::Approx(1.0f));
}

TEST_CASE("pool bar drops back as enemies return to the pool")
{
    GameSession session(TestConfig(3), {{EnemyBodyType::Small, 2}});
    UIPoolBar bar(&session);
    session.getScheduler().tick();
    session.getScheduler().tick();
    bar.update();
    REQUIRE(bar.getDisplayedPercent() == doctest::Approx(1.0f));

    session.Restart();
    bar.update();
    CHECK(bar.getDisplayedPercent() == doctest::Approx(0.0f));
}

TEST_CASE("pool bar handles an empty pool")
{
    GameSession session(TestConfig(3), {});
    UIPoolBar bar(&session);
    bar.update();
    CHECK(bar.getDisplayedPercent() == doctest::Approx(0.0f));

    UIPoolBar detached(nullptr);
    detached.update();
    CHECK(detached.getDisplayedPercent() == doctest::Approx(0.0f));
}

TEST_CASE("UIManager owns and updates its elements")
{
    GameSession session(TestConfig(3));
    UIManager manager;
    UIPoolBar *bar = new UIPoolBar(&session);
    manager.addElement(bar);
    manager.addElement(new UIStatsPanel(&session, {0.0f, 0.0f}));
    manager.addElement(nullptr);
    CHECK(manager.elementCount() == 2);

    session.getScheduler().tick();
    manager.update();
    CHECK(bar->getDisplayedPercent() == doctest::Approx(1.0f / 3.0f));

    manager.cleanup();
    CHECK(manager.elementCount() == 0);
}

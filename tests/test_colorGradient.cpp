#include <doctest/doctest.h>
#include "colorGradient.hpp"
#include "testHelpers.hpp"

TEST_CASE("empty gradient evaluates to white")
{
    ColorGradient gradient;
    CHECK(gradient.empty());
    CHECK(SameColor(gradient.Evaluate(0.3f), WHITE));
}

TEST_CASE("Evaluate blends linearly between stops")
{
    ColorGradient gradient{{0.0f, {0, 0, 0, 255}}, {1.0f, {200, 100, 50, 255}}};

    Color mid = gradient.Evaluate(0.5f);
    CHECK(mid.r == 100);
    CHECK(mid.g == 50);
    CHECK(mid.b == 25);
    CHECK(mid.a == 255);

    CHECK(SameColor(gradient.Evaluate(0.0f), {0, 0, 0, 255}));
    CHECK(SameColor(gradient.Evaluate(1.0f), {200, 100, 50, 255}));
}

TEST_CASE("Evaluate clamps outside the stop range")
{
    ColorGradient gradient{{0.25f, RED}, {0.75f, BLUE}};
    CHECK(SameColor(gradient.Evaluate(-4.0f), RED));
    CHECK(SameColor(gradient.Evaluate(0.1f), RED));
    CHECK(SameColor(gradient.Evaluate(0.9f), BLUE));
    CHECK(SameColor(gradient.Evaluate(7.0f), BLUE));
}

TEST_CASE("stops are kept sorted regardless of insertion order")
{
    ColorGradient gradient;
    gradient.addStop(1.0f, GREEN);
    gradient.addStop(0.0f, RED);
    gradient.addStop(0.5f, YELLOW);
    gradient.addStop(3.0f, BLUE);

    const auto &stops = gradient.getStops();
    REQUIRE(stops.size() == 4);
    CHECK(stops[0].time == doctest::Approx(0.0f));
    CHECK(stops[1].time == doctest::Approx(0.5f));
    CHECK(stops[2].time == doctest::Approx(1.0f));
    CHECK(stops[3].time == doctest::Approx(1.0f));
    CHECK(SameColor(gradient.Evaluate(0.5f), YELLOW));
}

TEST_CASE("default health gradient runs red to yellow to green")
{
    ColorGradient gradient = ColorGradient::HealthDefault();
    CHECK(SameColor(gradient.Evaluate(0.0f), {230, 41, 55, 255}));
    CHECK(SameColor(gradient.Evaluate(0.5f), {253, 249, 0, 255}));
    CHECK(SameColor(gradient.Evaluate(1.0f), {0, 228, 48, 255}));
}

TEST_CASE("gradient text format")
{
    ColorGradient gradient{{0.0f, {10, 20, 30, 255}}, {0.5f, {1, 2, 3, 4}}};
    CHECK(gradient.toString() == "0:10,20,30,255;0.5:1,2,3,4");

    ColorGradient parsed;
    REQUIRE(parsed.fromString(" 1:0,0,255,255 ; 0:255,0,0,255 "));
    REQUIRE(parsed.getStops().size() == 2);
    CHECK(SameColor(parsed.getStops()[0].color, {255, 0, 0, 255}));
    CHECK(SameColor(parsed.Evaluate(1.0f), {0, 0, 255, 255}));

    SUBCASE("malformed text leaves the gradient untouched")
    {
        CHECK_FALSE(parsed.fromString("0:1,2,3"));
        CHECK_FALSE(parsed.fromString("0:1,2,3,300"));
        CHECK_FALSE(parsed.fromString("abc"));
        CHECK_FALSE(parsed.fromString(""));
        CHECK(parsed.getStops().size() == 2);
    }
}

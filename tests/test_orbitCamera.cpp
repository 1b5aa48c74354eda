#include <doctest/doctest.h>
#include "orbitCamera.hpp"
#include "testHelpers.hpp"

TEST_CASE("camera starts pulled back and looks at the pivot")
{
    OrbitCamera camera({0.0f, 6.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, 1.0f);
    CHECK(camera.getOrbitPosition().z == doctest::Approx(-CAMERA_PULLBACK));
    CHECK(camera.getOrbitPosition().y == doctest::Approx(6.0f));
    CHECK(camera.getCamera().target.x == doctest::Approx(0.0f));
    CHECK(camera.getCamera().fovy == doctest::Approx(60.0f));
}

TEST_CASE("orbit turns a fixed angle per update around the vertical axis")
{
    OrbitCamera camera({0.0f, 4.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, 1.0f);
    float startDistance = Vector3Distance(camera.getOrbitPosition(), camera.getPivot());

    for (int i = 0; i < 90; i++)
        camera.update(1.0f / 60.0f);

    Vector3 pos = camera.getOrbitPosition();
    CHECK(Vector3Distance(pos, camera.getPivot()) == doctest::Approx(startDistance));
    CHECK(pos.y == doctest::Approx(4.0f));
    CHECK(fabsf(pos.x) == doctest::Approx(CAMERA_PULLBACK).epsilon(0.001));
    CHECK(pos.z == doctest::Approx(0.0f).epsilon(0.001));
}

TEST_CASE("zero speed keeps the camera still")
{
    OrbitCamera camera({1.0f, 3.0f, 2.0f}, {0.0f, 0.0f, 0.0f}, 0.0f);
    Vector3 start = camera.getOrbitPosition();
    camera.update(1.0f);
    CHECK(Vector3Distance(start, camera.getOrbitPosition()) == doctest::Approx(0.0f));
}

TEST_CASE("shake offsets the view but not the orbit")
{
    OrbitCamera camera({0.0f, 5.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, 0.0f);
    Vector3 orbit = camera.getOrbitPosition();

    camera.addShake(0.5f, 1.0f);
    camera.update(0.1f);
    CHECK(Vector3Distance(camera.getOrbitPosition(), orbit) == doctest::Approx(0.0f));
    CHECK(Vector3Distance(camera.getCamera().position, orbit) <= 0.5f * 1.8f);

    camera.update(2.0f);
    CHECK(Vector3Distance(camera.getCamera().position, orbit) == doctest::Approx(0.0f));

    camera.addShake(0.5f, 1.0f);
    camera.resetShake();
    camera.update(0.1f);
    CHECK(Vector3Distance(camera.getCamera().position, orbit) == doctest::Approx(0.0f));
}

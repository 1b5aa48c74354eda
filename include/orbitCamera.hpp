#pragma once
#include <raylib.h>
#include "constant.hpp"

/**
 * @brief Camera circling a pivot point around the vertical axis.
 *
 * The camera starts CAMERA_PULLBACK units behind `startPosition` along -Z
 * and turns `moveSpeed` degrees about the pivot on every `update()` call,
 * always looking at the pivot. A short shake can be layered on top; it never
 * disturbs the orbit itself.
 */
class OrbitCamera
{
private:
    Camera camera;
    Vector3 orbitPosition;
    Vector3 pivot;
    float moveSpeed;
    float shakeTimer = 0.0f;
    float shakeDuration = 0.0f;
    float shakeMagnitude = 0.0f;

public:
    OrbitCamera(Vector3 startPosition, Vector3 pivotPoint, float moveSpeedDegrees = DEFAULT_ORBIT_SPEED);

    const Camera &getCamera() const { return this->camera; }
    const Vector3 &getOrbitPosition() const { return this->orbitPosition; }
    const Vector3 &getPivot() const { return this->pivot; }
    void setMoveSpeed(float degreesPerFrame) { this->moveSpeed = degreesPerFrame; }

    /**
     * @brief Rotate one step around the pivot and advance the shake timer.
     */
    void update(float deltaSeconds);

    /**
     * @brief Apply a short camera shake.
     */
    void addShake(float magnitude, float durationSeconds);
    void resetShake();

    /**
     * @brief Pick ray through a screen point. Needs an open window.
     */
    Ray getPickRay(Vector2 screenPoint) const;
};

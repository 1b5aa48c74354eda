#include "orbitCamera.hpp"
#include <raymath.h>
#include <cmath>

OrbitCamera::OrbitCamera(Vector3 startPosition, Vector3 pivotPoint, float moveSpeedDegrees)
    : pivot(pivotPoint), moveSpeed(moveSpeedDegrees)
{
    this->orbitPosition = Vector3Subtract(startPosition, {0.0f, 0.0f, CAMERA_PULLBACK});

    this->camera = {0};
    this->camera.fovy = 60.0f;
    this->camera.projection = CAMERA_PERSPECTIVE;
    this->camera.up = {0.0f, 1.0f, 0.0f};
    this->camera.position = this->orbitPosition;
    this->camera.target = this->pivot;
}

void OrbitCamera::update(float deltaSeconds)
{
    const Vector3 up = {0.0f, 1.0f, 0.0f};
    Vector3 offset = Vector3Subtract(this->orbitPosition, this->pivot);
    offset = Vector3RotateByAxisAngle(offset, up, this->moveSpeed * DEG2RAD);
    this->orbitPosition = Vector3Add(this->pivot, offset);

    this->camera.position = this->orbitPosition;
    this->camera.target = this->pivot;

    if (this->shakeTimer > 0.0f)
    {
        this->shakeTimer = fmaxf(0.0f, this->shakeTimer - deltaSeconds);
        float normalized = (this->shakeDuration > 0.0f) ? (this->shakeTimer / this->shakeDuration) : 0.0f;
        float strength = this->shakeMagnitude * normalized * normalized; // ease-out
        float shakeX = ((float)GetRandomValue(-1000, 1000) / 1000.0f) * strength;
        float shakeY = ((float)GetRandomValue(-1000, 1000) / 1000.0f) * strength * 0.7f;
        float shakeZ = ((float)GetRandomValue(-1000, 1000) / 1000.0f) * strength;
        Vector3 shakeOffset = {shakeX, shakeY, shakeZ};
        this->camera.position = Vector3Add(this->camera.position, shakeOffset);
        this->camera.target = Vector3Add(this->camera.target, shakeOffset);
        if (this->shakeTimer <= 0.0f)
            this->shakeMagnitude = 0.0f;
    }
}

void OrbitCamera::addShake(float magnitude, float durationSeconds)
{
    if (durationSeconds <= 0.0f || magnitude <= 0.0f)
        return;
    this->shakeDuration = durationSeconds;
    this->shakeTimer = durationSeconds;
    this->shakeMagnitude = fmaxf(this->shakeMagnitude, magnitude);
}

void OrbitCamera::resetShake()
{
    this->shakeTimer = 0.0f;
    this->shakeDuration = 0.0f;
    this->shakeMagnitude = 0.0f;
}

Ray OrbitCamera::getPickRay(Vector2 screenPoint) const
{
    return GetMouseRay(screenPoint, this->camera);
}

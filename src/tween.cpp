#include "tween.hpp"
#include <raymath.h>
#include <cmath>

namespace
{
    float OutBounce(float t)
    {
        const float n1 = 7.5625f;
        const float d1 = 2.75f;
        if (t < 1.0f / d1)
            return n1 * t * t;
        if (t < 2.0f / d1)
        {
            t -= 1.5f / d1;
            return n1 * t * t + 0.75f;
        }
        if (t < 2.5f / d1)
        {
            t -= 2.25f / d1;
            return n1 * t * t + 0.9375f;
        }
        t -= 2.625f / d1;
        return n1 * t * t + 0.984375f;
    }
}

float ApplyEase(Ease ease, float t)
{
    t = Clamp(t, 0.0f, 1.0f);
    switch (ease)
    {
    case Ease::OutQuad:
        return 1.0f - (1.0f - t) * (1.0f - t);
    case Ease::OutCirc:
        return sqrtf(1.0f - (t - 1.0f) * (t - 1.0f));
    case Ease::InBounce:
        return 1.0f - OutBounce(1.0f - t);
    case Ease::Linear:
    default:
        return t;
    }
}

bool Tween::update(float deltaSeconds)
{
    if (!this->playing)
        return false;

    this->elapsed += deltaSeconds;
    if (this->elapsed >= this->duration)
    {
        this->elapsed = this->duration;
        this->playing = false;
        this->finished = true;
        return true;
    }
    return false;
}

float Tween::progress() const
{
    if (this->duration <= 0.0f)
        return this->finished ? 1.0f : 0.0f;
    return Clamp(this->elapsed / this->duration, 0.0f, 1.0f);
}

Vector3 PunchScale(Vector3 punch, float t)
{
    float swing = sinf(Clamp(t, 0.0f, 1.0f) * PI);
    return Vector3Add(Vector3One(), Vector3Scale(punch, swing));
}

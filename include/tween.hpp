#pragma once
#include <raylib.h>

/**
 * @brief Easing curves used by enemy animations.
 */
enum class Ease
{
    Linear,
    OutQuad,
    OutCirc,
    InBounce,
};

float ApplyEase(Ease ease, float t);

/**
 * @brief Timed transition advanced by an explicit frame delta.
 *
 * A Tween only tracks normalized progress; owners interpolate their own
 * values from `value()`. `update()` returns true on the frame the tween
 * completes so the owner can run its completion step directly.
 *
 * A paused tween keeps its progress; `restart()` rewinds and plays.
 */
class Tween
{
private:
    float duration = 0.0f;
    float elapsed = 0.0f;
    Ease ease = Ease::Linear;
    bool playing = false;
    bool finished = false;

public:
    Tween() {}
    Tween(float durationSeconds, Ease easing) : duration(durationSeconds > 0.0f ? durationSeconds : 0.0f), ease(easing) {}

    void restart()
    {
        this->elapsed = 0.0f;
        this->playing = true;
        this->finished = false;
    }
    void pause() { this->playing = false; }
    void stop()
    {
        this->elapsed = 0.0f;
        this->playing = false;
        this->finished = false;
    }
    void setDuration(float durationSeconds) { this->duration = durationSeconds > 0.0f ? durationSeconds : 0.0f; }

    bool update(float deltaSeconds);

    bool isPlaying() const { return this->playing; }
    bool isFinished() const { return this->finished; }
    float getDuration() const { return this->duration; }
    float getElapsed() const { return this->elapsed; }
    float progress() const;
    float value() const { return ApplyEase(this->ease, this->progress()); }
};

/**
 * @brief Scale offset of a punch animation at eased progress `t`.
 *
 * Swings out to `1 + punch` at mid-point and back to neutral (1,1,1) at t=1.
 */
Vector3 PunchScale(Vector3 punch, float t);

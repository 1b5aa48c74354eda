#pragma once
#include <raylib.h>
#include <initializer_list>
#include <string>
#include <vector>

struct GradientStop
{
    float time;
    Color color;
};

/**
 * @brief Ordered color stops over [0, 1] with linear blending between them.
 *
 * Used to map an enemy's remaining health fraction to its display color.
 * Times outside [0, 1] are clamped, before the first stop evaluates to the
 * first color and past the last stop to the last color. An empty gradient
 * evaluates to WHITE.
 */
class ColorGradient
{
private:
    std::vector<GradientStop> stops; // kept sorted by time

public:
    ColorGradient() {}
    ColorGradient(std::initializer_list<GradientStop> initial);

    void addStop(float time, Color color);
    void clear() { this->stops.clear(); }
    const std::vector<GradientStop> &getStops() const { return this->stops; }
    bool empty() const { return this->stops.empty(); }

    Color Evaluate(float t) const;

    /**
     * @brief Serialize as `t:r,g,b,a;t:r,g,b,a...`.
     */
    std::string toString() const;

    /**
     * @brief Parse the `toString()` format. Leaves the gradient untouched and
     * returns false if any stop is malformed.
     */
    bool fromString(const std::string &text);

    static ColorGradient HealthDefault();
};

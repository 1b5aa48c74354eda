#include "colorGradient.hpp"
#include <raymath.h>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace
{
    unsigned char LerpChannel(unsigned char a, unsigned char b, float t)
    {
        float v = Lerp((float)a, (float)b, t);
        return (unsigned char)Clamp(roundf(v), 0.0f, 255.0f);
    }

    bool ParseStop(const std::string &token, GradientStop &out)
    {
        float time = 0.0f;
        int r = 0, g = 0, b = 0, a = 0;
        char trailing = 0;
        if (sscanf(token.c_str(), " %f : %d , %d , %d , %d %c", &time, &r, &g, &b, &a, &trailing) != 5)
            return false;
        if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255 || a < 0 || a > 255)
            return false;
        out.time = Clamp(time, 0.0f, 1.0f);
        out.color = {(unsigned char)r, (unsigned char)g, (unsigned char)b, (unsigned char)a};
        return true;
    }
}

ColorGradient::ColorGradient(std::initializer_list<GradientStop> initial)
{
    for (const auto &stop : initial)
        this->addStop(stop.time, stop.color);
}

void ColorGradient::addStop(float time, Color color)
{
    GradientStop stop{Clamp(time, 0.0f, 1.0f), color};
    auto it = std::upper_bound(this->stops.begin(), this->stops.end(), stop.time,
                               [](float t, const GradientStop &s) { return t < s.time; });
    this->stops.insert(it, stop);
}

Color ColorGradient::Evaluate(float t) const
{
    if (this->stops.empty())
        return WHITE;

    t = Clamp(t, 0.0f, 1.0f);
    if (t <= this->stops.front().time)
        return this->stops.front().color;
    if (t >= this->stops.back().time)
        return this->stops.back().color;

    for (size_t i = 1; i < this->stops.size(); ++i)
    {
        const GradientStop &hi = this->stops[i];
        if (t > hi.time)
            continue;
        const GradientStop &lo = this->stops[i - 1];
        float span = hi.time - lo.time;
        float u = (span > 0.0f) ? (t - lo.time) / span : 1.0f;
        return {LerpChannel(lo.color.r, hi.color.r, u),
                LerpChannel(lo.color.g, hi.color.g, u),
                LerpChannel(lo.color.b, hi.color.b, u),
                LerpChannel(lo.color.a, hi.color.a, u)};
    }
    return this->stops.back().color;
}

std::string ColorGradient::toString() const
{
    std::ostringstream out;
    for (size_t i = 0; i < this->stops.size(); ++i)
    {
        const GradientStop &s = this->stops[i];
        if (i > 0)
            out << ';';
        out << s.time << ':' << (int)s.color.r << ',' << (int)s.color.g << ',' << (int)s.color.b << ',' << (int)s.color.a;
    }
    return out.str();
}

bool ColorGradient::fromString(const std::string &text)
{
    std::vector<GradientStop> parsed;
    std::stringstream in(text);
    std::string token;
    while (std::getline(in, token, ';'))
    {
        if (token.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        GradientStop stop{};
        if (!ParseStop(token, stop))
            return false;
        parsed.push_back(stop);
    }
    if (parsed.empty())
        return false;

    this->stops.clear();
    for (const auto &stop : parsed)
        this->addStop(stop.time, stop.color);
    return true;
}

ColorGradient ColorGradient::HealthDefault()
{
    // 0 = dead, 1 = full health
    return ColorGradient{{0.0f, {230, 41, 55, 255}},
                         {0.5f, {253, 249, 0, 255}},
                         {1.0f, {0, 228, 48, 255}}};
}

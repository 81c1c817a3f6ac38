#pragma once

#include <cstdint>
#include <cmath>
#include <algorithm>

namespace rs
{
namespace gfx
{

struct Point
{
    float x = 0.0f;
    float y = 0.0f;

    Point() = default;
    Point (float x_, float y_) : x (x_), y (y_) {}

    Point operator+ (const Point& other) const { return { x + other.x, y + other.y }; }
    Point operator- (const Point& other) const { return { x - other.x, y - other.y }; }
    Point operator* (float s) const { return { x * s, y * s }; }

    float dot (const Point& other) const { return x * other.x + y * other.y; }
    float length() const { return std::sqrt (x * x + y * y); }
    float distanceTo (const Point& other) const { return (*this - other).length(); }

    Point normalised() const
    {
        float len = length();
        if (len <= 0.0f)
            return {};
        return { x / len, y / len };
    }

    bool operator== (const Point& other) const { return x == other.x && y == other.y; }
    bool operator!= (const Point& other) const { return !(*this == other); }
};

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect() = default;
    Rect (float x_, float y_, float w, float h) : x (x_), y (y_), width (w), height (h) {}

    float right() const { return x + width; }
    float bottom() const { return y + height; }

    // Inclusive on all edges
    bool containsInclusive (Point p) const
    {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    bool operator== (const Rect& other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!= (const Rect& other) const { return !(*this == other); }
};

struct Color
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    Color() = default;
    Color (uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r (r_), g (g_), b (b_), a (a_) {}

    static Color fromARGB (uint32_t argb)
    {
        return { static_cast<uint8_t> ((argb >> 16) & 0xFF),
                 static_cast<uint8_t> ((argb >> 8) & 0xFF),
                 static_cast<uint8_t> (argb & 0xFF),
                 static_cast<uint8_t> ((argb >> 24) & 0xFF) };
    }

    Color multipliedAlpha (float factor) const
    {
        float scaled = std::clamp (static_cast<float> (a) * factor, 0.0f, 255.0f);
        return { r, g, b, static_cast<uint8_t> (std::lround (scaled)) };
    }

    bool operator== (const Color& other) const
    {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!= (const Color& other) const { return !(*this == other); }
};

} // namespace gfx
} // namespace rs

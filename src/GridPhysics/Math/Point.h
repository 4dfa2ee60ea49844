#pragma once

namespace GridPhysics {

struct Point
{
    float x = 0.0f;
    float y = 0.0f;

    Point() = default;
    Point(float x, float y) : x(x), y(y)
    {
    }

    Point operator+(const Point &other) const
    {
        return {x + other.x, y + other.y};
    }
    Point operator-(const Point &other) const
    {
        return {x - other.x, y - other.y};
    }

    float MagnitudeSq() const
    {
        return x * x + y * y;
    }

    static float DistanceSq(const Point &a, const Point &b)
    {
        return (a - b).MagnitudeSq();
    }
};

} // namespace GridPhysics

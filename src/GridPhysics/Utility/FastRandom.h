#pragma once
#include "GridPhysics/Math/Point.h"
#include <cstdint>

namespace GridPhysics {
namespace Utility {

/**
 * @brief Xorshift128+ generator for reproducible body placement
 * @note Same seed -> same sequence on every platform
 */
class FastRandom
{
public:
    explicit FastRandom(uint64_t seed)
    {
        _state[0] = seed;
        _state[1] = seed ^ 0x123456789ABCDEFULL;

        // Warm up
        for (int i = 0; i < 10; ++i)
        {
            Next();
        }
    }

    uint64_t Next()
    {
        uint64_t s1 = _state[0];
        const uint64_t s0 = _state[1];
        _state[0] = s0;
        s1 ^= s1 << 23;
        _state[1] = s1 ^ s0 ^ (s1 >> 18) ^ (s0 >> 5);
        return _state[1] + s0;
    }

    /**
     * @brief Random float [0.0, 1.0)
     */
    float NextFloat()
    {
        return static_cast<float>(Next() >> 40) / 16777216.0f;
    }

    /**
     * @brief Random float [min, max)
     */
    float NextFloat(float min, float max)
    {
        return min + NextFloat() * (max - min);
    }

    /**
     * @brief Random point inside the square [min, max) x [min, max)
     */
    Point NextPoint(float min, float max)
    {
        float x = NextFloat(min, max);
        float y = NextFloat(min, max);
        return {x, y};
    }

private:
    uint64_t _state[2];
};

} // namespace Utility
} // namespace GridPhysics

#pragma once
#include "GridPhysics/Collision/Shape.h"
#include <cstddef>
#include <functional>
#include <unordered_set>

namespace GridPhysics {

/**
 * @brief One directional contact: `self` found `other`
 *
 * (A, B, ...) and its mirror (B, A, ...) are different values.
 */
struct Overlap
{
    EntityId selfEntityId = 0;
    EntityId otherEntityId = 0;
    ShapeIndex selfShapeIndex = 0;
    ShapeIndex otherShapeIndex = 0;

    bool operator==(const Overlap &other) const
    {
        return selfEntityId == other.selfEntityId && otherEntityId == other.otherEntityId &&
               selfShapeIndex == other.selfShapeIndex && otherShapeIndex == other.otherShapeIndex;
    }

    bool operator!=(const Overlap &other) const
    {
        return !(*this == other);
    }
};

struct OverlapHash
{
    size_t operator()(const Overlap &o) const noexcept
    {
        std::hash<uint64_t> hasher;
        size_t seed = hasher(o.selfEntityId);
        seed ^= hasher(o.otherEntityId) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= hasher(o.selfShapeIndex) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= hasher(o.otherShapeIndex) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

using OverlapSet = std::unordered_set<Overlap, OverlapHash>;
using EntitySet = std::unordered_set<EntityId>;

} // namespace GridPhysics

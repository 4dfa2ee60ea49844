#pragma once
#include "GridPhysics/Math/Point.h"
#include <cstdint>

namespace GridPhysics {

using EntityId = uint64_t;
using ShapeIndex = uint32_t;

// Axis-aligned bounding box in world units
struct Bounds
{
    float minX = 0.0f;
    float maxX = 0.0f;
    float minY = 0.0f;
    float maxY = 0.0f;
};

/**
 * @brief One circle attached to one entity
 *
 * shapeIndex tells apart the circles of a multi-circle entity.
 * radius >= 0 is assumed, not checked.
 */
struct Shape
{
    EntityId entityId = 0;
    ShapeIndex shapeIndex = 0;
    Point pos;
    float radius = 0.0f;
    bool isStatic = false;

    Shape() = default;
    Shape(EntityId entityId, ShapeIndex shapeIndex, Point pos, float radius, bool isStatic)
        : entityId(entityId), shapeIndex(shapeIndex), pos(pos), radius(radius), isStatic(isStatic)
    {
    }

    /**
     * @brief Does this shape touch `other`, seen from this shape's side?
     *
     * Static shapes never initiate contact, and shapes of the same entity never collide.
     * Tangent circles count as touching.
     */
    bool Collided(const Shape &other) const;

    Bounds GetBounds() const;
};

} // namespace GridPhysics

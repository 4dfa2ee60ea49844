#include "GridPhysics/Collision/Shape.h"

namespace GridPhysics {

bool Shape::Collided(const Shape &other) const
{
    if (isStatic)
        return false;

    if (entityId == other.entityId)
        return false;

    float radiusSum = radius + other.radius;
    return Point::DistanceSq(pos, other.pos) <= radiusSum * radiusSum;
}

Bounds Shape::GetBounds() const
{
    return {pos.x - radius, pos.x + radius, pos.y - radius, pos.y + radius};
}

} // namespace GridPhysics

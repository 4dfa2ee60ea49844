#include "GridPhysics/Collision/Shape.h"
#include <gtest/gtest.h>

using namespace GridPhysics;

TEST(ShapeTest, OverlappingDynamicShapesCollideBothWays)
{
    Shape a(1, 0, Point(0.0f, 0.0f), 1.0f, false);
    Shape b(2, 0, Point(1.5f, 0.0f), 1.0f, false);

    EXPECT_TRUE(a.Collided(b));
    EXPECT_TRUE(b.Collided(a));
}

TEST(ShapeTest, SeparatedShapesDoNotCollide)
{
    Shape a(1, 0, Point(0.0f, 0.0f), 1.0f, false);
    Shape b(2, 0, Point(2.5f, 0.0f), 1.0f, false);

    EXPECT_FALSE(a.Collided(b));
    EXPECT_FALSE(b.Collided(a));
}

TEST(ShapeTest, TangentShapesCollide)
{
    // distance 2 == 1 + 1
    Shape a(1, 0, Point(5.0f, 6.5f), 1.0f, false);
    Shape b(2, 0, Point(5.0f, 8.5f), 1.0f, false);

    EXPECT_TRUE(a.Collided(b));

    // 3-4-5 triangle, radii 2 + 3
    Shape c(3, 0, Point(0.0f, 0.0f), 2.0f, false);
    Shape d(4, 0, Point(3.0f, 4.0f), 3.0f, false);
    EXPECT_TRUE(c.Collided(d));
}

TEST(ShapeTest, StaticShapeNeverInitiates)
{
    Shape wall(1, 0, Point(0.0f, 0.0f), 5.0f, true);
    Shape mover(2, 0, Point(0.0f, 0.0f), 1.0f, false);
    Shape otherWall(3, 0, Point(0.0f, 0.0f), 5.0f, true);

    EXPECT_FALSE(wall.Collided(mover));
    EXPECT_FALSE(wall.Collided(otherWall));

    // The dynamic side still sees the wall
    EXPECT_TRUE(mover.Collided(wall));
}

TEST(ShapeTest, SameEntityNeverCollides)
{
    Shape head(7, 0, Point(0.0f, 0.0f), 1.0f, false);
    Shape tail(7, 1, Point(0.5f, 0.0f), 1.0f, false);

    EXPECT_FALSE(head.Collided(tail));
    EXPECT_FALSE(tail.Collided(head));
    EXPECT_FALSE(head.Collided(head));
}

TEST(ShapeTest, ZeroRadiusPointsCollideOnlyWhenCoincident)
{
    Shape a(1, 0, Point(3.0f, 3.0f), 0.0f, false);
    Shape b(2, 0, Point(3.0f, 3.0f), 0.0f, false);
    Shape c(3, 0, Point(3.0f, 3.1f), 0.0f, false);

    EXPECT_TRUE(a.Collided(b));
    EXPECT_FALSE(a.Collided(c));
}

TEST(ShapeTest, Bounds)
{
    Shape s(1, 0, Point(5.0f, 8.0f), 2.0f, false);
    Bounds b = s.GetBounds();

    EXPECT_FLOAT_EQ(b.minX, 3.0f);
    EXPECT_FLOAT_EQ(b.maxX, 7.0f);
    EXPECT_FLOAT_EQ(b.minY, 6.0f);
    EXPECT_FLOAT_EQ(b.maxY, 10.0f);
}

TEST(PointTest, DistanceSq)
{
    Point a(1.0f, 2.0f);
    Point b(4.0f, 6.0f);

    EXPECT_FLOAT_EQ(Point::DistanceSq(a, b), 25.0f);
    EXPECT_FLOAT_EQ((b - a).MagnitudeSq(), 25.0f);

    Point sum = a + b;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.y, 8.0f);
}

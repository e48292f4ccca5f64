#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "boxigon/core/errors.hpp"
#include "boxigon/math/shape.hpp"

using Boxigon::InvalidGeometryError;
using Boxigon::Shape;
using Boxigon::ShapeSpec;

TEST(ShapeTest, CircleProperties) {
    Shape circle = Shape::circle(2.0, Vector(1.0, 0.0));

    EXPECT_TRUE(circle.isCircle());
    EXPECT_DOUBLE_EQ(circle.area(), M_PI * 4.0);
    EXPECT_DOUBLE_EQ(circle.centroid().x, 1.0);
    EXPECT_DOUBLE_EQ(circle.unitInertia(), 2.0);   // r^2 / 2
    EXPECT_DOUBLE_EQ(circle.boundingRadius(), 3.0);
    EXPECT_DOUBLE_EQ(circle.centroidRadius(), 2.0);
}

TEST(ShapeTest, BoxProperties) {
    Shape box = Shape::create(ShapeSpec::box(1.0, 0.5));

    ASSERT_EQ(box.vertices().size(), 4u);
    EXPECT_NEAR(box.area(), 2.0, 1e-12);
    EXPECT_NEAR(box.centroid().x, 0.0, 1e-12);
    EXPECT_NEAR(box.centroid().y, 0.0, 1e-12);
    // (w^2 + h^2) / 12 with w = 2, h = 1
    EXPECT_NEAR(box.unitInertia(), 5.0 / 12.0, 1e-12);

    // Outward unit normals
    for (std::size_t i = 0; i < box.normals().size(); ++i) {
        EXPECT_NEAR(box.normals()[i].length(), 1.0, 1e-12);
        Vector const mid = (box.vertices()[i] + box.vertices()[(i + 1) % 4]) * 0.5;
        EXPECT_GT(box.normals()[i].dotProduct(mid), 0.0);
    }
}

TEST(ShapeTest, OffsetBoxCentroid) {
    Shape box = Shape::create(ShapeSpec::box(0.5, 0.5, Vector(3.0, -1.0)));
    EXPECT_NEAR(box.centroid().x, 3.0, 1e-12);
    EXPECT_NEAR(box.centroid().y, -1.0, 1e-12);
    EXPECT_NEAR(box.unitInertia(), 1.0 / 6.0, 1e-12);
}

TEST(ShapeTest, ClockwiseLoopIsReversed) {
    Shape square = Shape::polygon({Vector(0, 0), Vector(0, 1), Vector(1, 1), Vector(1, 0)});
    EXPECT_GT(Shape::signedArea(square.vertices()), 0.0);
    EXPECT_NEAR(square.area(), 1.0, 1e-12);
}

TEST(ShapeTest, DuplicateAndCollinearVerticesAreRemoved) {
    Shape square = Shape::polygon({
        Vector(0, 0), Vector(0.5, 0), Vector(1, 0), Vector(1, 0),
        Vector(1, 1), Vector(0, 1), Vector(0, 0)
    });
    EXPECT_EQ(square.vertices().size(), 4u);
    EXPECT_NEAR(square.area(), 1.0, 1e-12);
}

TEST(ShapeTest, RejectsMalformedGeometry) {
    EXPECT_THROW(Shape::circle(0.0), InvalidGeometryError);
    EXPECT_THROW(Shape::circle(-1.0), InvalidGeometryError);
    EXPECT_THROW(Shape::circle(std::nan("")), InvalidGeometryError);
    EXPECT_THROW(Shape::circle(1.0, Vector(HUGE_VAL, 0.0)), InvalidGeometryError);

    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(1, 0)}), InvalidGeometryError);
    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(1, 0), Vector(1, 0)}), InvalidGeometryError);
    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(1, 0), Vector(2, 0)}), InvalidGeometryError);
    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(1, 0), Vector(0, std::nan(""))}), InvalidGeometryError);

    // Arrow head: concave at (0.5, 0.3)
    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(0.5, 0.3), Vector(1, 0), Vector(0.5, 1)}),
                 InvalidGeometryError);

    // Self-intersecting bow tie
    EXPECT_THROW(Shape::polygon({Vector(0, 0), Vector(1, 1), Vector(1, 0), Vector(0, 1)}),
                 InvalidGeometryError);
}

TEST(ShapeTest, RegularPolygon) {
    Shape hexagon = Shape::create(ShapeSpec::regularPolygon(6, 1.0));
    EXPECT_EQ(hexagon.vertices().size(), 6u);
    EXPECT_NEAR(hexagon.area(), 1.5 * std::sqrt(3.0), 1e-12);
    EXPECT_NEAR(hexagon.boundingRadius(), 1.0, 1e-12);
}

TEST(ShapeTest, RotatedBoxAABB) {
    Shape box = Shape::create(ShapeSpec::box(0.5, 0.5));
    AABB const aabb = box.computeAABB(Transform(Vector(2.0, 0.0), M_PI / 4));
    double const h = std::sqrt(0.5);
    EXPECT_NEAR(aabb.lower.x, 2.0 - h, 1e-12);
    EXPECT_NEAR(aabb.upper.x, 2.0 + h, 1e-12);
    EXPECT_NEAR(aabb.lower.y, -h, 1e-12);
    EXPECT_NEAR(aabb.upper.y, h, 1e-12);
}

TEST(ShapeTest, ContainsPoint) {
    Shape box = Shape::create(ShapeSpec::box(1.0, 1.0));
    Transform xf(Vector(5.0, 0.0), 0.0);
    EXPECT_TRUE(box.containsPoint(xf, Vector(5.5, 0.5)));
    EXPECT_FALSE(box.containsPoint(xf, Vector(6.5, 0.0)));

    Shape circle = Shape::circle(1.0);
    EXPECT_TRUE(circle.containsPoint(xf, Vector(5.0, 0.9)));
    EXPECT_FALSE(circle.containsPoint(xf, Vector(5.8, 0.8)));
}

TEST(ShapeTest, Raycast) {
    Shape box = Shape::create(ShapeSpec::box(1.0, 1.0));
    Transform xf(Vector(5.0, 0.0), 0.0);

    auto hit = box.raycast(xf, Vector(0.0, 0.0), Vector(1.0, 0.0), 10.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->distance, 4.0, 1e-12);
    EXPECT_NEAR(hit->normal.x, -1.0, 1e-12);
    EXPECT_NEAR(hit->normal.y, 0.0, 1e-12);

    // Too short
    EXPECT_FALSE(box.raycast(xf, Vector(0.0, 0.0), Vector(1.0, 0.0), 3.0).has_value());
    // Pointing away
    EXPECT_FALSE(box.raycast(xf, Vector(0.0, 0.0), Vector(-1.0, 0.0), 10.0).has_value());
    // Starting inside
    EXPECT_FALSE(box.raycast(xf, Vector(5.0, 0.0), Vector(1.0, 0.0), 10.0).has_value());

    Shape circle = Shape::circle(1.0);
    auto circleHit = circle.raycast(xf, Vector(5.0, 5.0), Vector(0.0, -1.0), 10.0);
    ASSERT_TRUE(circleHit.has_value());
    EXPECT_NEAR(circleHit->distance, 4.0, 1e-12);
    EXPECT_NEAR(circleHit->normal.y, 1.0, 1e-12);
}

TEST(ShapeTest, SpecRebuildsIdenticalShape) {
    Shape original = Shape::polygon({Vector(0, 0), Vector(0, 2), Vector(3, 1)});
    Shape rebuilt = Shape::create(original.spec());

    ASSERT_EQ(rebuilt.vertices().size(), original.vertices().size());
    for (std::size_t i = 0; i < original.vertices().size(); ++i) {
        EXPECT_EQ(rebuilt.vertices()[i], original.vertices()[i]);
    }
    EXPECT_EQ(rebuilt.area(), original.area());
    EXPECT_EQ(rebuilt.unitInertia(), original.unitInertia());
}

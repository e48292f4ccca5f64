#include <gtest/gtest.h>
#include "boxigon/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);  // Parameterized constructor
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);
    double scalar = 2.0;

    Vector mult_result = v * scalar;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);

    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    // Normalize
    EXPECT_DOUBLE_EQ(v.normalized().length(), 1.0);

    // Zero vector normalizes to a fixed axis instead of NaN
    Vector zero;
    Vector fallback = zero.normalized();
    EXPECT_DOUBLE_EQ(fallback.x, 1.0);
    EXPECT_DOUBLE_EQ(fallback.y, 0.0);

    // Cross product
    Vector v5(1.0, 0.0);
    Vector v6(0.0, 1.0);
    EXPECT_DOUBLE_EQ(v5.cross(v6), 1.0);
    EXPECT_DOUBLE_EQ(v6.cross(v5), -1.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, ScalarCrossProducts) {
    Vector r(2.0, 0.0);

    // w x r is the tangential velocity of a point at r
    Vector v = crossSV(3.0, r);
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 6.0);

    Vector u = crossVS(r, 3.0);
    EXPECT_DOUBLE_EQ(u.x, 0.0);
    EXPECT_DOUBLE_EQ(u.y, -6.0);
}

TEST(VectorMathTest, FiniteCheck) {
    EXPECT_TRUE(Vector(1.0, -2.0).isFinite());
    EXPECT_FALSE(Vector(std::nan(""), 0.0).isFinite());
    EXPECT_FALSE(Vector(0.0, HUGE_VAL).isFinite());
}

TEST(TransformTest, RoundTrip) {
    Transform xf(Vector(1.0, 2.0), M_PI / 2);

    Vector world = xf.apply(Vector(1.0, 0.0));
    EXPECT_NEAR(world.x, 1.0, EPSILON);
    EXPECT_NEAR(world.y, 3.0, EPSILON);

    Vector local = xf.applyInverse(world);
    EXPECT_NEAR(local.x, 1.0, EPSILON);
    EXPECT_NEAR(local.y, 0.0, EPSILON);

    Vector dir = xf.invRotate(xf.rotate(Vector(0.3, -0.7)));
    EXPECT_NEAR(dir.x, 0.3, EPSILON);
    EXPECT_NEAR(dir.y, -0.7, EPSILON);
}

TEST(TransformTest, IdentityByDefault) {
    Transform xf;
    Vector p(5.0, -3.0);
    EXPECT_EQ(xf.apply(p), p);
}

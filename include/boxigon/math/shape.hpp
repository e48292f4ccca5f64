/**
 * @file shape.hpp
 * @brief Immutable collision shapes (circle and convex polygon) with mass properties
 *
 * Shapes are defined in body-local coordinates, relative to the body origin.
 * A Shape can only be obtained through the validating factories, so every
 * Shape instance is guaranteed to be well formed:
 * - circles have a finite, strictly positive radius
 * - polygons are convex, wound counter-clockwise, have at least 3 vertices,
 *   no duplicate or collinear vertices and a non-negligible area
 */

#pragma once

#include <optional>
#include <vector>

#include "boxigon/math/aabb.hpp"
#include "boxigon/math/vector_math.hpp"

namespace Boxigon {

enum class ShapeKind {
    Circle,
    Polygon
};

/**
 * @brief Unvalidated description of a shape, as supplied by callers
 */
struct ShapeSpec {
    ShapeKind kind = ShapeKind::Circle;
    double radius = 0.0;           ///< Circle radius
    Vector center;                 ///< Circle center in body space
    std::vector<Vector> vertices;  ///< Polygon loop in body space, either winding

    static ShapeSpec circle(double radius, const Vector& center = Vector());
    static ShapeSpec polygon(std::vector<Vector> vertices);

    /**
     * @brief Rectangle of half extents (hx, hy) centered at @p center, rotated by @p angle
     */
    static ShapeSpec box(double hx, double hy, const Vector& center = Vector(), double angle = 0.0);

    /** @brief Regular polygon with @p sides vertices on a circle of @p radius */
    static ShapeSpec regularPolygon(int sides, double radius, const Vector& center = Vector());
};

/**
 * @brief Result of a ray cast against a single shape
 */
struct ShapeRayHit {
    double distance;  ///< Distance along the (unit) ray direction
    Vector normal;    ///< World-space surface normal at the hit point
};

/**
 * @class Shape
 * @brief Validated circle or convex polygon with derived geometric properties
 */
class Shape {
public:
    /**
     * @brief Validates @p spec and builds a shape
     * @throws InvalidGeometryError if the description is malformed or degenerate
     */
    static Shape create(const ShapeSpec& spec);

    static Shape circle(double radius, const Vector& center = Vector());
    static Shape polygon(const std::vector<Vector>& vertices);

    /**
     * @brief Signed area of a vertex loop (positive for counter-clockwise)
     */
    static double signedArea(const std::vector<Vector>& vertices);

    ShapeKind kind() const { return shapeKind; }
    bool isCircle() const { return shapeKind == ShapeKind::Circle; }

    double radius() const { return circleRadius; }
    const Vector& center() const { return circleCenter; }

    const std::vector<Vector>& vertices() const { return verts; }
    const std::vector<Vector>& normals() const { return edgeNormals; }

    double area() const { return shapeArea; }
    const Vector& centroid() const { return shapeCentroid; }

    /**
     * @brief Rotational inertia about the centroid per unit mass
     *
     * Multiply by the shape mass to get its true inertia.
     */
    double unitInertia() const { return inertiaPerMass; }

    /** @brief Radius of the smallest origin-centered circle enclosing the shape */
    double boundingRadius() const { return originRadius; }

    /** @brief Radius of the smallest centroid-centered circle enclosing the shape */
    double centroidRadius() const { return centerRadius; }

    AABB computeAABB(const Transform& xf) const;

    bool containsPoint(const Transform& xf, const Vector& p) const;

    /**
     * @brief Casts a ray against the shape
     *
     * @param xf Body transform
     * @param origin World-space ray origin
     * @param direction Unit direction
     * @param maxDistance Maximum distance along the ray
     * @return The entry hit, if any. Rays starting inside the shape do not hit.
     */
    std::optional<ShapeRayHit> raycast(const Transform& xf,
                                       const Vector& origin,
                                       const Vector& direction,
                                       double maxDistance) const;

    /** @brief Description that rebuilds an identical shape */
    ShapeSpec spec() const;

private:
    Shape() = default;
    void computeProperties();

    ShapeKind shapeKind = ShapeKind::Circle;
    double circleRadius = 0.0;
    Vector circleCenter;
    std::vector<Vector> verts;
    std::vector<Vector> edgeNormals;

    double shapeArea = 0.0;
    Vector shapeCentroid;
    double inertiaPerMass = 0.0;
    double originRadius = 0.0;
    double centerRadius = 0.0;
};

} // namespace Boxigon

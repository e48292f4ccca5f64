/**
 * @file shape.cpp
 * @brief Shape validation, mass properties and per-shape queries
 */

#include "boxigon/math/shape.hpp"
#include "boxigon/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace Boxigon {

namespace {

constexpr double WeldTolerance = 1e-6;        ///< Vertices closer than this are merged
constexpr double CollinearTolerance = 1e-9;   ///< Relative |cross| below which a vertex is collinear
constexpr double ConvexTolerance = 1e-9;
constexpr double MinPolygonArea = 1e-8;

void requireFinite(const Vector& v, const char* what) {
    if (!v.isFinite()) {
        throw InvalidGeometryError(std::string(what) + " has non-finite coordinates");
    }
}

/**
 * @brief Drops consecutive duplicates, including the wrap-around pair
 */
std::vector<Vector> weldVertices(const std::vector<Vector>& input) {
    std::vector<Vector> out;
    out.reserve(input.size());
    for (const auto& v : input) {
        if (out.empty() || distanceSquared(out.back(), v) > WeldTolerance * WeldTolerance) {
            out.push_back(v);
        }
    }
    while (out.size() > 1 && distanceSquared(out.front(), out.back()) <= WeldTolerance * WeldTolerance) {
        out.pop_back();
    }
    return out;
}

/**
 * @brief Removes vertices lying on the segment between their neighbours
 *
 * A vertex where the loop doubles back on itself is not collinear in this
 * sense; it is left in place and rejected by the convexity check.
 */
void removeCollinear(std::vector<Vector>& pts) {
    bool removed = true;
    while (removed && pts.size() >= 3) {
        removed = false;
        std::size_t const n = pts.size();
        for (std::size_t i = 0; i < n; ++i) {
            const Vector& prev = pts[(i + n - 1) % n];
            const Vector& cur = pts[i];
            const Vector& next = pts[(i + 1) % n];
            Vector const e1 = cur - prev;
            Vector const e2 = next - cur;
            double const scale = e1.length() * e2.length();
            if (std::fabs(e1.cross(e2)) <= CollinearTolerance * scale && e1.dotProduct(e2) > 0.0) {
                pts.erase(pts.begin() + static_cast<std::ptrdiff_t>(i));
                removed = true;
                break;
            }
        }
    }
}

bool isConvex(const std::vector<Vector>& pts) {
    std::size_t const n = pts.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Vector& a = pts[i];
        Vector const edge = pts[(i + 1) % n] - a;
        double const len = edge.length();
        for (std::size_t j = 0; j < n; ++j) {
            if (j == i || j == (i + 1) % n) {
                continue;
            }
            // Every other vertex must lie strictly left of the edge
            if (edge.cross(pts[j] - a) <= ConvexTolerance * len) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

// ShapeSpec

ShapeSpec ShapeSpec::circle(double radius, const Vector& center) {
    ShapeSpec spec;
    spec.kind = ShapeKind::Circle;
    spec.radius = radius;
    spec.center = center;
    return spec;
}

ShapeSpec ShapeSpec::polygon(std::vector<Vector> vertices) {
    ShapeSpec spec;
    spec.kind = ShapeKind::Polygon;
    spec.vertices = std::move(vertices);
    return spec;
}

ShapeSpec ShapeSpec::box(double hx, double hy, const Vector& center, double angle) {
    Transform const xf(center, angle);
    return polygon({
        xf.apply(Vector(-hx, -hy)),
        xf.apply(Vector( hx, -hy)),
        xf.apply(Vector( hx,  hy)),
        xf.apply(Vector(-hx,  hy))
    });
}

ShapeSpec ShapeSpec::regularPolygon(int sides, double radius, const Vector& center) {
    std::vector<Vector> pts;
    pts.reserve(static_cast<std::size_t>(std::max(sides, 0)));
    for (int i = 0; i < sides; ++i) {
        double const a = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(sides);
        pts.emplace_back(center.x + radius * std::cos(a), center.y + radius * std::sin(a));
    }
    return polygon(std::move(pts));
}

// Shape

Shape Shape::create(const ShapeSpec& spec) {
    if (spec.kind == ShapeKind::Circle) {
        return circle(spec.radius, spec.center);
    }
    return polygon(spec.vertices);
}

Shape Shape::circle(double radius, const Vector& center) {
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw InvalidGeometryError("circle radius must be finite and positive");
    }
    requireFinite(center, "circle center");

    Shape shape;
    shape.shapeKind = ShapeKind::Circle;
    shape.circleRadius = radius;
    shape.circleCenter = center;
    shape.computeProperties();
    return shape;
}

Shape Shape::polygon(const std::vector<Vector>& vertices) {
    if (vertices.size() < 3) {
        throw InvalidGeometryError("polygon needs at least 3 vertices, got " + std::to_string(vertices.size()));
    }
    for (const auto& v : vertices) {
        requireFinite(v, "polygon vertex");
    }

    std::vector<Vector> pts = weldVertices(vertices);
    if (pts.size() < 3) {
        throw InvalidGeometryError("polygon has fewer than 3 distinct vertices");
    }

    // Forgiving about winding: clockwise loops are reversed
    if (signedArea(pts) < 0.0) {
        std::reverse(pts.begin(), pts.end());
    }

    removeCollinear(pts);
    if (pts.size() < 3) {
        throw InvalidGeometryError("polygon is degenerate (all vertices collinear)");
    }
    if (signedArea(pts) < MinPolygonArea) {
        throw InvalidGeometryError("polygon area is zero or too small");
    }
    if (!isConvex(pts)) {
        throw InvalidGeometryError("polygon is not convex");
    }

    Shape shape;
    shape.shapeKind = ShapeKind::Polygon;
    shape.verts = std::move(pts);
    shape.computeProperties();
    return shape;
}

double Shape::signedArea(const std::vector<Vector>& vertices) {
    double twiceArea = 0.0;
    std::size_t const n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        twiceArea += vertices[i].cross(vertices[(i + 1) % n]);
    }
    return 0.5 * twiceArea;
}

void Shape::computeProperties() {
    if (shapeKind == ShapeKind::Circle) {
        shapeArea = M_PI * circleRadius * circleRadius;
        shapeCentroid = circleCenter;
        inertiaPerMass = 0.5 * circleRadius * circleRadius;
        originRadius = circleCenter.length() + circleRadius;
        centerRadius = circleRadius;
        return;
    }

    std::size_t const n = verts.size();
    edgeNormals.clear();
    edgeNormals.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        Vector const edge = verts[(i + 1) % n] - verts[i];
        edgeNormals.push_back(Vector(edge.y, -edge.x).normalized());
    }

    // Triangle fan around the vertex average keeps the sums well conditioned
    Vector ref;
    for (const auto& v : verts) {
        ref += v;
    }
    ref = ref / static_cast<double>(n);

    double area = 0.0;
    Vector center;
    double inertia = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        Vector const e1 = verts[i] - ref;
        Vector const e2 = verts[(i + 1) % n] - ref;
        double const d = e1.cross(e2);
        double const triArea = 0.5 * d;
        area += triArea;
        center += (e1 + e2) * (triArea / 3.0);

        double const intx2 = e1.x * e1.x + e2.x * e1.x + e2.x * e2.x;
        double const inty2 = e1.y * e1.y + e2.y * e1.y + e2.y * e2.y;
        inertia += (0.25 / 3.0 * d) * (intx2 + inty2);
    }

    center = center / area;
    shapeArea = area;
    shapeCentroid = ref + center;
    // Shift from the reference point to the centroid, then normalise by area
    inertiaPerMass = (inertia - area * center.lengthSquared()) / area;

    originRadius = 0.0;
    centerRadius = 0.0;
    for (const auto& v : verts) {
        originRadius = std::max(originRadius, v.length());
        centerRadius = std::max(centerRadius, (v - shapeCentroid).length());
    }
}

AABB Shape::computeAABB(const Transform& xf) const {
    if (shapeKind == ShapeKind::Circle) {
        Vector const c = xf.apply(circleCenter);
        return {Vector(c.x - circleRadius, c.y - circleRadius),
                Vector(c.x + circleRadius, c.y + circleRadius)};
    }

    Vector const first = xf.apply(verts.front());
    AABB box(first, first);
    for (std::size_t i = 1; i < verts.size(); ++i) {
        Vector const w = xf.apply(verts[i]);
        box.merge(AABB(w, w));
    }
    return box;
}

bool Shape::containsPoint(const Transform& xf, const Vector& p) const {
    if (shapeKind == ShapeKind::Circle) {
        return distanceSquared(xf.apply(circleCenter), p) <= circleRadius * circleRadius;
    }
    Vector const local = xf.applyInverse(p);
    for (std::size_t i = 0; i < verts.size(); ++i) {
        if (edgeNormals[i].dotProduct(local - verts[i]) > 0.0) {
            return false;
        }
    }
    return true;
}

std::optional<ShapeRayHit> Shape::raycast(const Transform& xf,
                                          const Vector& origin,
                                          const Vector& direction,
                                          double maxDistance) const
{
    if (shapeKind == ShapeKind::Circle) {
        Vector const s = origin - xf.apply(circleCenter);
        double const b = s.lengthSquared() - circleRadius * circleRadius;
        if (b <= 0.0) {
            return std::nullopt;
        }
        double const c = s.dotProduct(direction);
        double const sigma = c * c - b;
        if (sigma < 0.0 || c > 0.0) {
            return std::nullopt;
        }
        double const t = -c - std::sqrt(sigma);
        if (t < 0.0 || t > maxDistance) {
            return std::nullopt;
        }
        return ShapeRayHit{t, (s + direction * t).normalized()};
    }

    // Clip the ray against every edge half-plane in local space
    Vector const p = xf.applyInverse(origin);
    Vector const d = xf.invRotate(direction);

    double lower = 0.0;
    double upper = maxDistance;
    int index = -1;
    for (std::size_t i = 0; i < verts.size(); ++i) {
        double const numerator = edgeNormals[i].dotProduct(verts[i] - p);
        double const denominator = edgeNormals[i].dotProduct(d);
        if (denominator == 0.0) {
            if (numerator < 0.0) {
                return std::nullopt;
            }
        } else if (denominator < 0.0 && numerator < lower * denominator) {
            lower = numerator / denominator;
            index = static_cast<int>(i);
        } else if (denominator > 0.0 && numerator < upper * denominator) {
            upper = numerator / denominator;
        }
        if (upper < lower) {
            return std::nullopt;
        }
    }

    if (index < 0) {
        return std::nullopt;
    }
    return ShapeRayHit{lower, xf.rotate(edgeNormals[static_cast<std::size_t>(index)])};
}

ShapeSpec Shape::spec() const {
    if (shapeKind == ShapeKind::Circle) {
        return ShapeSpec::circle(circleRadius, circleCenter);
    }
    return ShapeSpec::polygon(verts);
}

} // namespace Boxigon

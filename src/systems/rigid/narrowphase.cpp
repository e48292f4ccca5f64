/**
 * @file narrowphase.cpp
 * @brief Implementation of SAT/clipping based contact generation
 *
 * Polygon contacts follow the classic reference face / incident edge scheme:
 * the axis of least penetration chooses a reference face, the most
 * anti-parallel edge of the other polygon is the incident edge, and that edge
 * is clipped against the side planes of the reference face.
 */

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <vector>

#include "boxigon/systems/rigid/narrowphase.hpp"
#include "boxigon/core/profile.hpp"

namespace RigidBodyCollision {

using Boxigon::Shape;

namespace {

/**
 * @brief Builds a contact point from the two surface points
 */
ContactPoint makePoint(const Vector& pA,
                       const Vector& pB,
                       const Vector& normal,
                       double separation,
                       const ContactId& id,
                       const Transform& xfA,
                       const Transform& xfB)
{
    ContactPoint cp;
    cp.position = (pA + pB) * 0.5;
    cp.normal = normal;
    cp.separation = separation;
    cp.localAnchorA = xfA.applyInverse(pA);
    cp.localAnchorB = xfB.applyInverse(pB);
    cp.localNormal = xfA.invRotate(normal);
    cp.id = id;
    return cp;
}

/**
 * @brief Mirrors a point computed with the shapes swapped
 */
ContactPoint flipPoint(const ContactPoint& in, const Transform& xfA, const Transform& xfB) {
    ContactId id;
    id.shapeA = in.id.shapeB;
    id.featureA = in.id.featureB;
    id.shapeB = in.id.shapeA;
    id.featureB = in.id.featureA;

    // in's anchors are expressed in the swapped frames
    Vector const pA = xfA.apply(in.localAnchorB);
    Vector const pB = xfB.apply(in.localAnchorA);
    return makePoint(pA, pB, -in.normal, in.separation, id, xfA, xfB);
}

std::vector<ContactPoint> collideCircles(const Components::AttachedShape& a,
                                         const Transform& xfA,
                                         const Components::AttachedShape& b,
                                         const Transform& xfB,
                                         double margin)
{
    Vector const cA = xfA.apply(a.shape.center());
    Vector const cB = xfB.apply(b.shape.center());
    double const rA = a.shape.radius();
    double const rB = b.shape.radius();

    Vector const d = cB - cA;
    double const dist = d.length();
    double const separation = dist - (rA + rB);
    if (separation > margin) {
        return {};
    }

    // Coincident centers: fall back to a fixed axis
    Vector const n = dist > EPSILON ? d / dist : Vector(0.0, 1.0);
    Vector const pA = cA + n * rA;
    Vector const pB = cB - n * rB;
    return {makePoint(pA, pB, n, separation, ContactId{a.id, 0, b.id, 0}, xfA, xfB)};
}

/**
 * @brief Polygon (A) against circle (B); normal points from the polygon
 */
std::vector<ContactPoint> collidePolygonCircle(const Components::AttachedShape& poly,
                                               const Transform& xfA,
                                               const Components::AttachedShape& circle,
                                               const Transform& xfB,
                                               double margin)
{
    const Shape& polygon = poly.shape;
    const auto& verts = polygon.vertices();
    const auto& norms = polygon.normals();
    std::size_t const count = verts.size();
    double const radius = circle.shape.radius();

    // Circle center in polygon space
    Vector const c = xfA.applyInverse(xfB.apply(circle.shape.center()));

    std::size_t normalIndex = 0;
    double separation = -std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < count; ++i) {
        double const s = norms[i].dotProduct(c - verts[i]);
        if (s > radius + margin) {
            return {};
        }
        if (s > separation) {
            separation = s;
            normalIndex = i;
        }
    }

    std::size_t const i1 = normalIndex;
    std::size_t const i2 = (i1 + 1) % count;
    const Vector& v1 = verts[i1];
    const Vector& v2 = verts[i2];

    Vector localNormal;
    Vector surface;
    std::uint32_t feature = 0;

    if (separation < EPSILON) {
        // Center inside the polygon: push out through the nearest face
        localNormal = norms[i1];
        surface = c - localNormal * separation;
        feature = Feature::Face | static_cast<std::uint32_t>(i1);
    } else {
        double const u1 = (c - v1).dotProduct(v2 - v1);
        double const u2 = (c - v2).dotProduct(v1 - v2);
        if (u1 <= 0.0) {
            if ((c - v1).length() - radius > margin) {
                return {};
            }
            localNormal = (c - v1).normalized();
            surface = v1;
            feature = Feature::Vertex | static_cast<std::uint32_t>(i1);
        } else if (u2 <= 0.0) {
            if ((c - v2).length() - radius > margin) {
                return {};
            }
            localNormal = (c - v2).normalized();
            surface = v2;
            feature = Feature::Vertex | static_cast<std::uint32_t>(i2);
        } else {
            localNormal = norms[i1];
            surface = c - localNormal * separation;
            feature = Feature::Face | static_cast<std::uint32_t>(i1);
        }
    }

    double const sep = localNormal.dotProduct(c - surface) - radius;
    Vector const n = xfA.rotate(localNormal);
    Vector const pA = xfA.apply(surface);
    Vector const pB = xfA.apply(c - localNormal * radius);
    return {makePoint(pA, pB, n, sep, ContactId{poly.id, feature, circle.id, 0}, xfA, xfB)};
}

/**
 * @brief Largest separation of poly2's vertices along poly1's face normals
 */
double findMaxSeparation(std::size_t& edgeIndex,
                         const Shape& poly1, const Transform& xf1,
                         const Shape& poly2, const Transform& xf2)
{
    const auto& v1s = poly1.vertices();
    const auto& n1s = poly1.normals();
    const auto& v2s = poly2.vertices();

    double maxSeparation = -std::numeric_limits<double>::max();
    edgeIndex = 0;
    for (std::size_t i = 0; i < v1s.size(); ++i) {
        Vector const n = xf1.rotate(n1s[i]);
        Vector const v1 = xf1.apply(v1s[i]);

        double si = std::numeric_limits<double>::max();
        for (const auto& v : v2s) {
            si = std::min(si, n.dotProduct(xf2.apply(v) - v1));
        }

        if (si > maxSeparation) {
            maxSeparation = si;
            edgeIndex = i;
        }
    }
    return maxSeparation;
}

struct ClipVertex {
    Vector v;
    std::uint32_t feature;
};

/**
 * @brief Keeps the part of segment @p in with dot(normal, p) <= offset
 *
 * @return Number of output vertices (0, 1 or 2)
 */
int clipSegmentToLine(ClipVertex out[2], const ClipVertex in[2],
                      const Vector& normal, double offset, std::uint32_t clipFeature)
{
    int count = 0;
    double const d0 = normal.dotProduct(in[0].v) - offset;
    double const d1 = normal.dotProduct(in[1].v) - offset;

    if (d0 <= 0.0) {
        out[count++] = in[0];
    }
    if (d1 <= 0.0) {
        out[count++] = in[1];
    }

    // Points on opposite sides: add the intersection
    if (d0 * d1 < 0.0) {
        double const t = d0 / (d0 - d1);
        out[count].v = in[0].v + (in[1].v - in[0].v) * t;
        out[count].feature = clipFeature;
        ++count;
    }
    return count;
}

std::vector<ContactPoint> collidePolygons(const Components::AttachedShape& a,
                                          const Transform& xfA,
                                          const Components::AttachedShape& b,
                                          const Transform& xfB,
                                          const NarrowphaseConfig& config)
{
    double const margin = config.contactMargin;

    std::size_t edgeA = 0;
    double const separationA = findMaxSeparation(edgeA, a.shape, xfA, b.shape, xfB);
    if (separationA > margin) {
        return {};
    }

    std::size_t edgeB = 0;
    double const separationB = findMaxSeparation(edgeB, b.shape, xfB, a.shape, xfA);
    if (separationB > margin) {
        return {};
    }

    // Prefer A's face unless B's is clearly better
    double const tieTolerance = 0.1 * config.linearSlop;
    bool const flip = separationB > separationA + tieTolerance;

    const Shape& ref = flip ? b.shape : a.shape;
    const Shape& inc = flip ? a.shape : b.shape;
    const Transform& xfRef = flip ? xfB : xfA;
    const Transform& xfInc = flip ? xfA : xfB;
    std::size_t const refEdge = flip ? edgeB : edgeA;

    const auto& refVerts = ref.vertices();
    const auto& incVerts = inc.vertices();
    const auto& incNorms = inc.normals();

    Vector const refNormal = xfRef.rotate(ref.normals()[refEdge]);

    // Incident edge: the one most anti-parallel to the reference normal
    std::size_t incEdge = 0;
    double minDot = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < incVerts.size(); ++i) {
        double const d = refNormal.dotProduct(xfInc.rotate(incNorms[i]));
        if (d < minDot) {
            minDot = d;
            incEdge = i;
        }
    }
    std::size_t const incNext = (incEdge + 1) % incVerts.size();

    ClipVertex incident[2];
    incident[0] = {xfInc.apply(incVerts[incEdge]), Feature::Vertex | static_cast<std::uint32_t>(incEdge)};
    incident[1] = {xfInc.apply(incVerts[incNext]), Feature::Vertex | static_cast<std::uint32_t>(incNext)};

    std::size_t const refNext = (refEdge + 1) % refVerts.size();
    Vector const v1 = xfRef.apply(refVerts[refEdge]);
    Vector const v2 = xfRef.apply(refVerts[refNext]);
    Vector const tangent = (v2 - v1).normalized();

    double const frontOffset = refNormal.dotProduct(v1);
    double const sideOffset1 = -tangent.dotProduct(v1);
    double const sideOffset2 = tangent.dotProduct(v2);

    ClipVertex clip1[2];
    ClipVertex clip2[2];
    if (clipSegmentToLine(clip1, incident, -tangent, sideOffset1,
                          Feature::Clip | static_cast<std::uint32_t>(refEdge)) < 2) {
        return {};
    }
    if (clipSegmentToLine(clip2, clip1, tangent, sideOffset2,
                          Feature::Clip | static_cast<std::uint32_t>(refNext)) < 2) {
        return {};
    }

    std::uint32_t const refFeature = Feature::Face | static_cast<std::uint32_t>(refEdge);
    std::vector<ContactPoint> points;
    for (const auto& cv : clip2) {
        double const separation = refNormal.dotProduct(cv.v) - frontOffset;
        if (separation > margin) {
            continue;
        }
        Vector const onRef = cv.v - refNormal * separation;
        if (!flip) {
            points.push_back(makePoint(onRef, cv.v, refNormal, separation,
                                       ContactId{a.id, refFeature, b.id, cv.feature}, xfA, xfB));
        } else {
            points.push_back(makePoint(cv.v, onRef, -refNormal, separation,
                                       ContactId{a.id, cv.feature, b.id, refFeature}, xfA, xfB));
        }
    }
    return points;
}

/**
 * @brief Keeps the deepest point and the point farthest from it
 */
void reducePoints(std::vector<ContactPoint>& points) {
    if (points.size() <= 2) {
        return;
    }
    std::size_t deepest = 0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (points[i].separation < points[deepest].separation) {
            deepest = i;
        }
    }
    std::size_t farthest = deepest == 0 ? 1 : 0;
    double best = -1.0;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i == deepest) {
            continue;
        }
        double const d = distanceSquared(points[i].position, points[deepest].position);
        if (d > best) {
            best = d;
            farthest = i;
        }
    }
    std::vector<ContactPoint> kept;
    kept.push_back(points[std::min(deepest, farthest)]);
    kept.push_back(points[std::max(deepest, farthest)]);
    points.swap(kept);
}

/**
 * @brief Inputs of one pair, gathered on the calling thread
 */
struct PairInput {
    const Components::ShapeList* shapesA;
    const Components::ShapeList* shapesB;
    Transform xfA;
    Transform xfB;
    double friction;
    double restitution;
};

void detectPair(const CandidatePair& pair, const PairInput& in,
                const NarrowphaseConfig& config, Manifold& out)
{
    out.pair = pair.ids;
    out.eA = pair.eA;
    out.eB = pair.eB;
    out.friction = in.friction;
    out.restitution = in.restitution;
    out.points.clear();

    for (const auto& sa : in.shapesA->shapes) {
        Vector const ca = in.xfA.apply(sa.shape.centroid());
        for (const auto& sb : in.shapesB->shapes) {
            // Bounding circle pre-cull
            Vector const cb = in.xfB.apply(sb.shape.centroid());
            double const reach = sa.shape.centroidRadius() + sb.shape.centroidRadius() + config.contactMargin;
            if (distanceSquared(ca, cb) > reach * reach) {
                continue;
            }
            auto pts = collideShapes(sa, in.xfA, sb, in.xfB, config);
            out.points.insert(out.points.end(), pts.begin(), pts.end());
        }
    }
    reducePoints(out.points);
}

} // namespace

std::vector<ContactPoint> collideShapes(const Components::AttachedShape& a,
                                        const Transform& xfA,
                                        const Components::AttachedShape& b,
                                        const Transform& xfB,
                                        const NarrowphaseConfig& config)
{
    bool const circleA = a.shape.isCircle();
    bool const circleB = b.shape.isCircle();

    if (circleA && circleB) {
        return collideCircles(a, xfA, b, xfB, config.contactMargin);
    }
    if (!circleA && circleB) {
        return collidePolygonCircle(a, xfA, b, xfB, config.contactMargin);
    }
    if (circleA && !circleB) {
        auto swapped = collidePolygonCircle(b, xfB, a, xfA, config.contactMargin);
        for (auto& cp : swapped) {
            cp = flipPoint(cp, xfA, xfB);
        }
        return swapped;
    }
    return collidePolygons(a, xfA, b, xfB, config);
}

double shapeSeparation(const Components::AttachedShape& a,
                       const Transform& xfA,
                       const Components::AttachedShape& b,
                       const Transform& xfB,
                       double limit)
{
    bool const circleA = a.shape.isCircle();
    bool const circleB = b.shape.isCircle();

    if (circleA && circleB) {
        Vector const cA = xfA.apply(a.shape.center());
        Vector const cB = xfB.apply(b.shape.center());
        return (cB - cA).length() - a.shape.radius() - b.shape.radius();
    }
    if (circleA != circleB) {
        const auto& poly = circleA ? b : a;
        const auto& circle = circleA ? a : b;
        const Transform& xfPoly = circleA ? xfB : xfA;
        const Transform& xfCircle = circleA ? xfA : xfB;
        auto pts = collidePolygonCircle(poly, xfPoly, circle, xfCircle, limit);
        if (pts.empty()) {
            return std::numeric_limits<double>::infinity();
        }
        return pts.front().separation;
    }

    std::size_t edge = 0;
    double const sepA = findMaxSeparation(edge, a.shape, xfA, b.shape, xfB);
    double const sepB = findMaxSeparation(edge, b.shape, xfB, a.shape, xfA);
    return std::max(sepA, sepB);
}

std::vector<Manifold> Narrowphase::detect(const entt::registry& registry,
                                          const std::vector<CandidatePair>& pairs,
                                          const NarrowphaseConfig& config)
{
    BOXIGON_PROFILE_SCOPE("Narrowphase");

    std::vector<PairInput> inputs;
    inputs.reserve(pairs.size());
    for (const auto& pair : pairs) {
        const auto& posA = registry.get<Components::Position>(pair.eA);
        const auto& posB = registry.get<Components::Position>(pair.eB);
        const auto& angA = registry.get<Components::AngularPosition>(pair.eA);
        const auto& angB = registry.get<Components::AngularPosition>(pair.eB);
        const auto& matA = registry.get<Components::Material>(pair.eA);
        const auto& matB = registry.get<Components::Material>(pair.eB);

        PairInput in;
        in.shapesA = &registry.get<Components::ShapeList>(pair.eA);
        in.shapesB = &registry.get<Components::ShapeList>(pair.eB);
        in.xfA = Components::makeTransform(posA, angA);
        in.xfB = Components::makeTransform(posB, angB);
        in.friction = std::sqrt(matA.friction * matB.friction);
        in.restitution = std::max(matA.restitution, matB.restitution);
        inputs.push_back(in);
    }

    std::vector<Manifold> slots(pairs.size());

    std::size_t const threads = static_cast<std::size_t>(std::max(config.threads, 1));
    std::size_t const minPerTask = std::max<std::size_t>(config.minPairsPerTask, 1);
    if (threads > 1 && pairs.size() >= 2 * minPerTask) {
        std::size_t const tasks = std::min(threads, pairs.size() / minPerTask);
        std::size_t const chunk = (pairs.size() + tasks - 1) / tasks;

        // Each task owns a disjoint range of output slots
        std::vector<std::future<void>> futures;
        futures.reserve(tasks);
        for (std::size_t t = 0; t < tasks; ++t) {
            std::size_t const begin = t * chunk;
            std::size_t const end = std::min(begin + chunk, pairs.size());
            if (begin >= end) {
                break;
            }
            futures.push_back(std::async(std::launch::async, [&, begin, end]() {
                for (std::size_t i = begin; i < end; ++i) {
                    detectPair(pairs[i], inputs[i], config, slots[i]);
                }
            }));
        }
        for (auto& f : futures) {
            f.get();
        }
    } else {
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            detectPair(pairs[i], inputs[i], config, slots[i]);
        }
    }

    std::vector<Manifold> manifolds;
    manifolds.reserve(slots.size());
    for (auto& m : slots) {
        if (!m.points.empty()) {
            manifolds.push_back(std::move(m));
        }
    }
    return manifolds;
}

} // namespace RigidBodyCollision

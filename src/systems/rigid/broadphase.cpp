/**
 * @file broadphase.cpp
 * @brief Implementation of the uniform-grid broad-phase
 */

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

#include "boxigon/systems/rigid/broadphase.hpp"
#include "boxigon/components/basic.hpp"
#include "boxigon/core/profile.hpp"

namespace RigidBodyCollision
{

std::int64_t Broadphase::cellCoord(double v) const {
    // Far-away coordinates share the outermost cells; 2^52 keeps the cast and
    // the differences of two coordinates inside int64
    constexpr double limit = 4503599627370496.0;
    double const cell = std::floor(v / cellSize);
    return static_cast<std::int64_t>(std::max(-limit, std::min(limit, cell)));
}

void Broadphase::rebuild(const entt::registry& registry,
                         const SystemConfig& sysConfig,
                         const BroadphaseConfig& bpConfig)
{
    BOXIGON_PROFILE_SCOPE("Broadphase");

    cellSize = bpConfig.cellSize > 0.0 ? bpConfig.cellSize : 1.0;
    proxyList.clear();
    grid.clear();
    oversized.clear();
    pairs.clear();

    auto view = registry.view<
        const Components::BodyInfo,
        const Components::Position,
        const Components::AngularPosition,
        const Components::Velocity,
        const Components::AngularVelocity,
        const Components::ShapeList
    >();
    for (auto [entity, info, pos, angle, vel, omega, shapes] : view.each()) {
        if (shapes.shapes.empty()) {
            continue;
        }

        Transform const xf = Components::makeTransform(pos, angle);
        AABB box = shapes.shapes.front().shape.computeAABB(xf);
        double reach = 0.0;
        for (const auto& attached : shapes.shapes) {
            box.merge(attached.shape.computeAABB(xf));
            reach = std::max(reach, attached.shape.boundingRadius());
        }

        // Grow by the distance this body can sweep during the coming step
        double margin = bpConfig.aabbMargin;
        if (info.kind != Boxigon::BodyKind::Static) {
            margin += vel.length() * sysConfig.timeStep;
            margin += std::fabs(omega.omega) * sysConfig.timeStep * reach;
        }

        BroadphaseProxy proxy;
        proxy.id = info.id;
        proxy.entity = entity;
        proxy.kind = info.kind;
        proxy.box = box;
        proxy.fatBox = box.fattened(margin);
        proxyList.push_back(proxy);
    }

    std::sort(proxyList.begin(), proxyList.end(),
              [](const BroadphaseProxy& l, const BroadphaseProxy& r) { return l.id < r.id; });

    for (std::size_t i = 0; i < proxyList.size(); ++i) {
        if (i == 0) {
            bounds = proxyList[i].fatBox;
        } else {
            bounds.merge(proxyList[i].fatBox);
        }
        insertProxy(i, bpConfig.maxCellsPerBody);
    }

    collectPairs();
}

void Broadphase::insertProxy(std::size_t index, int maxCellsPerBody) {
    const AABB& fat = proxyList[index].fatBox;
    std::int64_t const x0 = cellCoord(fat.lower.x);
    std::int64_t const y0 = cellCoord(fat.lower.y);
    std::int64_t const x1 = cellCoord(fat.upper.x);
    std::int64_t const y1 = cellCoord(fat.upper.y);

    double const cells = (static_cast<double>(x1 - x0) + 1.0) * (static_cast<double>(y1 - y0) + 1.0);
    if (cells > static_cast<double>(std::max(maxCellsPerBody, 1))) {
        oversized.push_back(index);
        return;
    }

    for (std::int64_t x = x0; x <= x1; ++x) {
        for (std::int64_t y = y0; y <= y1; ++y) {
            grid[CellKey{x, y}].push_back(index);
        }
    }
}

void Broadphase::addPair(std::size_t i, std::size_t j) {
    if (i == j) {
        return;
    }
    if (i > j) {
        std::swap(i, j);
    }
    const BroadphaseProxy& a = proxyList[i];
    const BroadphaseProxy& b = proxyList[j];
    if (a.kind == Boxigon::BodyKind::Static && b.kind == Boxigon::BodyKind::Static) {
        return;
    }
    if (!a.fatBox.overlaps(b.fatBox)) {
        return;
    }
    pairs.push_back(CandidatePair{BodyPair{a.id, b.id}, a.entity, b.entity});
}

void Broadphase::collectPairs() {
    // Walk proxies in id order and look up only their own cells so the
    // hash map is never iterated
    for (std::size_t i = 0; i < proxyList.size(); ++i) {
        const AABB& fat = proxyList[i].fatBox;
        if (std::find(oversized.begin(), oversized.end(), i) == oversized.end()) {
            std::int64_t const x0 = cellCoord(fat.lower.x);
            std::int64_t const y0 = cellCoord(fat.lower.y);
            std::int64_t const x1 = cellCoord(fat.upper.x);
            std::int64_t const y1 = cellCoord(fat.upper.y);
            for (std::int64_t x = x0; x <= x1; ++x) {
                for (std::int64_t y = y0; y <= y1; ++y) {
                    auto it = grid.find(CellKey{x, y});
                    if (it == grid.end()) {
                        continue;
                    }
                    for (std::size_t const j : it->second) {
                        if (j > i) {
                            addPair(i, j);
                        }
                    }
                }
            }
        }
    }

    // Oversized proxies are tested against everyone
    for (std::size_t const big : oversized) {
        for (std::size_t j = 0; j < proxyList.size(); ++j) {
            addPair(big, j);
        }
    }

    std::sort(pairs.begin(), pairs.end(),
              [](const CandidatePair& l, const CandidatePair& r) { return l.ids < r.ids; });
    pairs.erase(std::unique(pairs.begin(), pairs.end(),
                            [](const CandidatePair& l, const CandidatePair& r) { return l.ids == r.ids; }),
                pairs.end());
}

std::vector<std::size_t> Broadphase::queryAABB(const AABB& box) const {
    std::vector<std::size_t> found;
    if (proxyList.empty() || !box.overlaps(bounds)) {
        return found;
    }

    std::int64_t const x0 = cellCoord(std::max(box.lower.x, bounds.lower.x));
    std::int64_t const y0 = cellCoord(std::max(box.lower.y, bounds.lower.y));
    std::int64_t const x1 = cellCoord(std::min(box.upper.x, bounds.upper.x));
    std::int64_t const y1 = cellCoord(std::min(box.upper.y, bounds.upper.y));

    // A box spanning more cells than there are proxies is cheaper to scan
    double const cells = (static_cast<double>(x1 - x0) + 1.0) * (static_cast<double>(y1 - y0) + 1.0);
    if (cells > static_cast<double>(proxyList.size())) {
        for (std::size_t idx = 0; idx < proxyList.size(); ++idx) {
            if (proxyList[idx].box.overlaps(box)) {
                found.push_back(idx);
            }
        }
        return found;
    }

    for (std::int64_t x = x0; x <= x1; ++x) {
        for (std::int64_t y = y0; y <= y1; ++y) {
            auto it = grid.find(CellKey{x, y});
            if (it == grid.end()) {
                continue;
            }
            for (std::size_t const idx : it->second) {
                if (proxyList[idx].box.overlaps(box)) {
                    found.push_back(idx);
                }
            }
        }
    }
    for (std::size_t const idx : oversized) {
        if (proxyList[idx].box.overlaps(box)) {
            found.push_back(idx);
        }
    }

    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

std::vector<std::size_t> Broadphase::queryRay(const Vector& origin,
                                              const Vector& direction,
                                              double maxDistance) const
{
    std::vector<std::size_t> found(oversized.begin(), oversized.end());
    if (proxyList.empty()) {
        return found;
    }

    // Clip the segment to the populated region so the walk stays bounded
    double tMin = 0.0;
    double tMax = maxDistance;
    const double o[2] = {origin.x, origin.y};
    const double d[2] = {direction.x, direction.y};
    const double lo[2] = {bounds.lower.x, bounds.lower.y};
    const double hi[2] = {bounds.upper.x, bounds.upper.y};
    for (int axis = 0; axis < 2; ++axis) {
        if (std::fabs(d[axis]) < EPSILON) {
            if (o[axis] < lo[axis] || o[axis] > hi[axis]) {
                tMax = -1.0;
            }
            continue;
        }
        double t1 = (lo[axis] - o[axis]) / d[axis];
        double t2 = (hi[axis] - o[axis]) / d[axis];
        if (t1 > t2) {
            std::swap(t1, t2);
        }
        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
    }

    if (tMax >= tMin) {
        Vector const start = origin + direction * tMin;
        std::int64_t cx = cellCoord(start.x);
        std::int64_t cy = cellCoord(start.y);
        std::int64_t const endX = cellCoord((origin + direction * tMax).x);
        std::int64_t const endY = cellCoord((origin + direction * tMax).y);

        // Amanatides-Woo grid traversal
        int const stepX = direction.x > 0.0 ? 1 : (direction.x < 0.0 ? -1 : 0);
        int const stepY = direction.y > 0.0 ? 1 : (direction.y < 0.0 ? -1 : 0);
        double const inf = std::numeric_limits<double>::infinity();
        double tDeltaX = stepX != 0 ? cellSize / std::fabs(direction.x) : inf;
        double tDeltaY = stepY != 0 ? cellSize / std::fabs(direction.y) : inf;
        double tNextX = inf;
        double tNextY = inf;
        if (stepX != 0) {
            double const boundary = static_cast<double>(cx + (stepX > 0 ? 1 : 0)) * cellSize;
            tNextX = tMin + (boundary - start.x) / direction.x;
        }
        if (stepY != 0) {
            double const boundary = static_cast<double>(cy + (stepY > 0 ? 1 : 0)) * cellSize;
            tNextY = tMin + (boundary - start.y) / direction.y;
        }

        std::int64_t const maxSteps =
            std::llabs(endX - cx) + std::llabs(endY - cy) + 2;
        if (maxSteps > static_cast<std::int64_t>(proxyList.size())) {
            // Walking the cells would cost more than testing every proxy
            found.clear();
            for (std::size_t idx = 0; idx < proxyList.size(); ++idx) {
                found.push_back(idx);
            }
            return found;
        }
        for (std::int64_t s = 0; s <= maxSteps; ++s) {
            auto it = grid.find(CellKey{cx, cy});
            if (it != grid.end()) {
                found.insert(found.end(), it->second.begin(), it->second.end());
            }
            if (cx == endX && cy == endY) {
                break;
            }
            if (tNextX < tNextY) {
                cx += stepX;
                tNextX += tDeltaX;
            } else {
                cy += stepY;
                tNextY += tDeltaY;
            }
        }
    }

    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

} // namespace RigidBodyCollision

/**
 * @file broadphase.hpp
 * @brief Broad-phase collision detection using a uniform spatial hash grid
 *
 * Every body with shapes is inserted into the grid cells covered by its
 * fattened AABB (union of its shapes, grown by a fixed margin plus the
 * distance it can travel in the coming step). Two bodies become a candidate
 * pair when their fat boxes overlap. Bodies covering too many cells go on an
 * oversized list that is tested against everyone instead.
 *
 * The same grid accelerates the point, box and ray queries of the World.
 */

#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "boxigon/core/system_config.hpp"
#include "boxigon/math/aabb.hpp"
#include "boxigon/systems/rigid/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @struct BroadphaseConfig
 * @brief Configuration parameters specific to the broadphase
 */
struct BroadphaseConfig {
    // Edge length of a grid cell (m)
    double cellSize = 2.0;

    // Fixed fattening added around every body AABB (m)
    double aabbMargin = 0.1;

    // Bodies covering more cells than this are kept on the oversized list
    int maxCellsPerBody = 64;
};

/**
 * @brief A body as seen by the broadphase
 */
struct BroadphaseProxy {
    BodyId id;
    entt::entity entity;
    Boxigon::BodyKind kind;
    AABB box;     ///< Tight AABB of all shapes
    AABB fatBox;  ///< Box used for pairing and cell insertion
};

/**
 * @class Broadphase
 * @brief Grid of body proxies, rebuilt from the registry every step
 */
class Broadphase {
public:
    /**
     * @brief Rebuilds proxies, grid cells and candidate pairs from the registry
     *
     * @param registry ECS registry containing body components
     * @param sysConfig Shared configuration (time step used for the velocity margin)
     * @param bpConfig Broadphase specific configuration
     */
    void rebuild(const entt::registry& registry,
                 const SystemConfig& sysConfig,
                 const BroadphaseConfig& bpConfig);

    /**
     * @brief Pairs whose fat boxes overlap, sorted by (a, b), unique,
     *        never static-static
     */
    const std::vector<CandidatePair>& candidatePairs() const { return pairs; }

    /** @brief Proxies in body id order */
    const std::vector<BroadphaseProxy>& proxies() const { return proxyList; }

    /**
     * @brief Indices into proxies() of bodies whose tight AABB overlaps @p box
     */
    std::vector<std::size_t> queryAABB(const AABB& box) const;

    /**
     * @brief Indices into proxies() of bodies whose cells the ray segment
     *        crosses, sorted and unique
     *
     * A segment crossing more cells than there are proxies returns every proxy.
     *
     * @param origin Ray origin
     * @param direction Unit direction
     * @param maxDistance Segment length
     */
    std::vector<std::size_t> queryRay(const Vector& origin,
                                      const Vector& direction,
                                      double maxDistance) const;

private:
    struct CellKey {
        std::int64_t x;
        std::int64_t y;
        bool operator==(const CellKey& o) const { return x == o.x && y == o.y; }
    };

    struct CellKeyHash {
        std::size_t operator()(const CellKey& k) const {
            return std::hash<std::int64_t>()(k.x * 73856093LL) ^ std::hash<std::int64_t>()(k.y * 19349663LL);
        }
    };

    std::int64_t cellCoord(double v) const;
    void insertProxy(std::size_t index, int maxCellsPerBody);
    void collectPairs();
    void addPair(std::size_t i, std::size_t j);

    double cellSize = 2.0;
    std::vector<BroadphaseProxy> proxyList;
    std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> grid;
    std::vector<std::size_t> oversized;
    std::vector<CandidatePair> pairs;
    AABB bounds;
};

} // namespace RigidBodyCollision

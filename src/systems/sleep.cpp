#include "boxigon/systems/sleep.hpp"
#include "boxigon/components/basic.hpp"
#include "boxigon/core/debug.hpp"
#include "boxigon/core/profile.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>

namespace Systems {

namespace {

// Union-find with path halving; the smaller index becomes the root
struct DisjointSet {
    std::vector<std::size_t> parent;

    explicit DisjointSet(std::size_t n) : parent(n) {
        std::iota(parent.begin(), parent.end(), std::size_t{0});
    }

    std::size_t find(std::size_t i) {
        while (parent[i] != i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) {
            return;
        }
        if (b < a) {
            std::swap(a, b);
        }
        parent[b] = a;
    }
};

} // namespace

void SleepSystem::update(entt::registry& registry) {
    BOXIGON_PROFILE_SCOPE("SleepSystem");

    slept.clear();
    islands = 0;

    double const dt = sysConfig.timeStep;
    double const linTolSq = specificConfig.linearSleepTolerance * specificConfig.linearSleepTolerance;
    double const angTol = specificConfig.angularSleepTolerance;

    // Awake dynamic bodies in id order
    std::vector<std::pair<Boxigon::BodyId, entt::entity>> bodies;
    auto view = registry.view<Components::BodyInfo,
                              Components::Velocity,
                              Components::AngularVelocity,
                              Components::Sleep>();
    for (auto [entity, info, vel, angVel, sleep] : view.each()) {
        if (info.kind == Boxigon::BodyKind::Kinematic) {
            sleep.sleepTime = 0.0;
            continue;
        }
        if (info.kind != Boxigon::BodyKind::Dynamic || sleep.asleep) {
            continue;
        }

        if (!specificConfig.allowSleep ||
            vel.lengthSquared() > linTolSq ||
            std::fabs(angVel.omega) > angTol) {
            sleep.sleepTime = 0.0;
        } else {
            sleep.sleepTime += dt;
        }
        bodies.emplace_back(info.id, entity);
    }
    std::sort(bodies.begin(), bodies.end());

    std::unordered_map<entt::entity, std::size_t> index;
    index.reserve(bodies.size());
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        index.emplace(bodies[i].second, i);
    }

    DisjointSet sets(bodies.size());
    std::vector<bool> pinned(bodies.size(), false);

    auto isMovingKinematic = [&registry](entt::entity e) {
        if (registry.get<Components::BodyInfo>(e).kind != Boxigon::BodyKind::Kinematic) {
            return false;
        }
        return registry.get<Components::Velocity>(e).lengthSquared() > 0.0 ||
               registry.get<Components::AngularVelocity>(e).omega != 0.0;
    };

    for (const auto& [eA, eB] : connections) {
        auto itA = index.find(eA);
        auto itB = index.find(eB);
        if (itA != index.end() && itB != index.end()) {
            sets.unite(itA->second, itB->second);
        } else if (itA != index.end() && eB != entt::null && registry.valid(eB) && isMovingKinematic(eB)) {
            pinned[itA->second] = true;
        } else if (itB != index.end() && eA != entt::null && registry.valid(eA) && isMovingKinematic(eA)) {
            pinned[itB->second] = true;
        }
    }
    connections.clear();

    // Per island: smallest rest time and whether anything keeps it awake
    std::vector<double> minSleepTime(bodies.size(), std::numeric_limits<double>::infinity());
    std::vector<bool> islandPinned(bodies.size(), false);
    std::vector<std::uint64_t> islandIndex(bodies.size(), 0);

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        std::size_t const root = sets.find(i);
        if (root == i) {
            islandIndex[root] = nextIsland++;
            ++islands;
        }
        const auto& sleep = registry.get<Components::Sleep>(bodies[i].second);
        minSleepTime[root] = std::min(minSleepTime[root], sleep.sleepTime);
        islandPinned[root] = islandPinned[root] || pinned[i];
    }

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        std::size_t const root = sets.find(i);
        entt::entity const e = bodies[i].second;
        registry.get<Components::IslandRef>(e).index = islandIndex[root];

        if (!specificConfig.allowSleep || islandPinned[root] ||
            minSleepTime[root] < specificConfig.timeToSleep) {
            continue;
        }

        auto& sleep = registry.get<Components::Sleep>(e);
        sleep.asleep = true;
        registry.get<Components::Velocity>(e) = Vector();
        registry.get<Components::AngularVelocity>(e).omega = 0.0;
        slept.push_back(bodies[i].first);
    }

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_VERBOSE,
        "[SleepSystem] " << bodies.size() << " awake bodies, " << islands
        << " islands, " << slept.size() << " fell asleep\n");
}

} // namespace Systems

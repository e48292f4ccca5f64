/**
 * @file contact_manager.cpp
 * @brief Implementation of the manifold store
 */

#include "boxigon/systems/rigid/contact_manager.hpp"
#include "boxigon/core/debug.hpp"
#include "boxigon/core/profile.hpp"

#include <utility>

namespace RigidBodyCollision {

/**
 * @brief Copies the accumulated impulses of matching points from @p previous
 */
static void carryImpulses(Manifold& current, const Manifold& previous)
{
    for (auto& point : current.points) {
        for (const auto& old : previous.points) {
            if (old.id == point.id) {
                point.normalImpulse = old.normalImpulse;
                point.tangentImpulse = old.tangentImpulse;
                break;
            }
        }
    }
}

ContactTransitions ContactManager::update(std::vector<Manifold> fresh, const std::set<BodyPair>& frozen)
{
    BOXIGON_PROFILE_SCOPE("ContactManager");

    ManifoldMap next;

    for (auto& manifold : fresh) {
        auto old = manifolds.find(manifold.pair);
        if (old != manifolds.end()) {
            carryImpulses(manifold, old->second);
        }
        BodyPair const key = manifold.pair;
        next[key] = std::move(manifold);
    }

    for (const auto& pair : frozen) {
        auto old = manifolds.find(pair);
        if (old != manifolds.end() && next.find(pair) == next.end()) {
            next.emplace(pair, old->second);
        }
    }

    ContactTransitions transitions;
    for (const auto& [pair, manifold] : next) {
        if (manifolds.find(pair) == manifolds.end()) {
            transitions.began.push_back(pair);
        }
    }
    for (const auto& [pair, manifold] : manifolds) {
        if (next.find(pair) == next.end()) {
            transitions.ended.push_back(pair);
        }
    }

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_VERBOSE,
        "[ContactManager] " << next.size() << " manifolds, "
        << transitions.began.size() << " began, "
        << transitions.ended.size() << " ended\n");

    manifolds.swap(next);
    return transitions;
}

std::vector<BodyPair> ContactManager::removeBody(BodyId id)
{
    std::vector<BodyPair> removed;
    for (auto it = manifolds.begin(); it != manifolds.end(); ) {
        if (it->first.a == id || it->first.b == id) {
            removed.push_back(it->first);
            it = manifolds.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

void ContactManager::restore(const Manifold& manifold)
{
    manifolds[manifold.pair] = manifold;
}

std::size_t ContactManager::pointCount() const
{
    std::size_t count = 0;
    for (const auto& [pair, manifold] : manifolds) {
        count += manifold.points.size();
    }
    return count;
}

} // namespace RigidBodyCollision

/**
 * @file contact_manager.hpp
 * @brief Manifold store: contact persistence and warm-starting between steps
 *
 * The ContactManager owns one manifold per body pair. Each step it receives
 * freshly detected manifolds, carries accumulated impulses over to points
 * whose ContactId matches a point of the previous step, drops pairs that are
 * no longer touching and reports which pairs began or ended touching.
 */

#ifndef BOXIGON_CONTACT_MANAGER_HPP
#define BOXIGON_CONTACT_MANAGER_HPP

#include <map>
#include <set>
#include <vector>

#include "boxigon/systems/rigid/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Pair transitions produced by one update
 */
struct ContactTransitions {
    std::vector<BodyPair> began;  ///< Sorted
    std::vector<BodyPair> ended;  ///< Sorted
};

class ContactManager {
public:
    using ManifoldMap = std::map<BodyPair, Manifold>;

    /**
     * @brief Replaces the stored manifolds with a freshly detected set
     *
     * @param fresh Manifolds detected this step (at least one point each)
     * @param frozen Pairs whose stored manifold is kept unchanged because
     *        neither body moved (sleeping or static piles)
     * @return Pairs that started and stopped touching
     */
    ContactTransitions update(std::vector<Manifold> fresh, const std::set<BodyPair>& frozen);

    /**
     * @brief Removes every manifold involving @p id
     * @return The removed pairs, sorted
     */
    std::vector<BodyPair> removeBody(BodyId id);

    /** @brief Inserts or replaces a manifold as is (scene restore) */
    void restore(const Manifold& manifold);

    void clear() { manifolds.clear(); }

    ManifoldMap& getManifolds() { return manifolds; }
    const ManifoldMap& getManifolds() const { return manifolds; }

    /** @brief Total number of stored contact points */
    std::size_t pointCount() const;

private:
    ManifoldMap manifolds;
};

} // namespace RigidBodyCollision
#endif

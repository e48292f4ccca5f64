/**
 * @file solver_body.hpp
 * @brief Compact per-step body state shared by the contact, joint and position solvers
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "boxigon/core/types.hpp"
#include "boxigon/math/vector_math.hpp"

namespace RigidBodyCollision {

/**
 * @brief Body state as seen by the solvers
 *
 * Bodies that must not move (static, kinematic, sleeping, the world anchor)
 * have zero inverse mass and inertia and are never written back.
 */
struct SolverBody {
    Boxigon::BodyId id = Boxigon::NullBody;
    entt::entity entity = entt::null;
    Vector v;              ///< Linear velocity of the center of mass
    double w = 0.0;        ///< Angular velocity
    Vector center;         ///< World center of mass
    double angle = 0.0;
    Vector localCenter;    ///< Center of mass in body space
    double invMass = 0.0;
    double invI = 0.0;
    bool movable = false;  ///< Awake dynamic: results are written back
    bool moved = false;    ///< Pose changed by the position solver

    /** @brief Transform of the body origin for the current pose */
    Transform transform() const {
        Transform xf;
        xf.c = std::cos(angle);
        xf.s = std::sin(angle);
        xf.p = center - xf.rotate(localCenter);
        return xf;
    }
};

/**
 * @class SolverBodySet
 * @brief Bodies referenced by this step's constraints, indexed once
 */
class SolverBodySet {
public:
    SolverBodySet();

    void clear();

    /**
     * @brief Adds a body (once) and returns its index
     * @param movable Whether the solvers may change its velocity and pose
     */
    std::size_t add(const entt::registry& registry, entt::entity entity, bool movable);

    /** @brief Index of @p entity, or Ground for entt::null and unknown entities */
    std::size_t indexOf(entt::entity entity) const;

    /** @brief Index of the immovable body standing in for the world */
    static constexpr std::size_t Ground = 0;

    SolverBody& operator[](std::size_t index) { return bodies[index]; }
    const SolverBody& operator[](std::size_t index) const { return bodies[index]; }
    std::size_t size() const { return bodies.size(); }

    /** @brief Writes the velocities of movable bodies back to the registry */
    void writeVelocities(entt::registry& registry) const;

    /** @brief Refreshes poses from the registry (after integration) */
    void readPoses(const entt::registry& registry);

    /** @brief Writes poses changed by the position solver back to the registry */
    void writePoses(entt::registry& registry) const;

private:
    std::vector<SolverBody> bodies;
    std::unordered_map<entt::entity, std::size_t> lookup;
};

/**
 * @brief Applies an impulse @p P at offsets rA / rB to bodies a and b (a receives -P)
 */
inline void applyImpulse(SolverBody& a, SolverBody& b,
                         const Vector& rA, const Vector& rB, const Vector& P)
{
    a.v -= P * a.invMass;
    a.w -= a.invI * rA.cross(P);
    b.v += P * b.invMass;
    b.w += b.invI * rB.cross(P);
}

} // namespace RigidBodyCollision

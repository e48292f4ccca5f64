/**
 * @file sleep.hpp
 * @brief Island building and sleep management
 *
 * This system handles:
 * - Rest timers of awake dynamic bodies
 * - Union-find islands over the contact and joint graph
 * - Putting whole islands to sleep once every member has rested long enough
 *
 * Static and kinematic bodies never join an island. An island touching a
 * kinematic body that moves is kept awake.
 *
 * Required components:
 * - BodyInfo, Velocity, AngularVelocity, Sleep, IslandRef
 */

#ifndef BOXIGON_SLEEP_SYSTEM_HPP
#define BOXIGON_SLEEP_SYSTEM_HPP

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include <entt/entt.hpp>
#include "boxigon/core/types.hpp"
#include "boxigon/systems/i_system.hpp"

namespace Systems {

/**
 * @struct SleepConfig
 * @brief Configuration parameters specific to the sleep system
 */
struct SleepConfig {
    // Master switch
    bool allowSleep = true;

    // Linear speed below which a body is resting (m/s)
    double linearSleepTolerance = 0.01;

    // Angular speed below which a body is resting (rad/s)
    double angularSleepTolerance = 2.0 / 180.0 * M_PI;

    // Seconds every island member must rest before the island sleeps
    double timeToSleep = 0.5;
};

/**
 * @class SleepSystem
 * @brief Builds islands and puts resting islands to sleep
 */
class SleepSystem : public ConfigurableSystem<SleepConfig> {
public:
    using Connection = std::pair<entt::entity, entt::entity>;

    SleepSystem() = default;
    ~SleepSystem() override = default;

    /**
     * @brief Edges of this step's constraint graph (touching manifolds and joints)
     */
    void setConnections(std::vector<Connection> edges) { connections = std::move(edges); }

    /**
     * @brief Updates rest timers, rebuilds islands and sleeps resting islands
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry& registry) override;

    /** @brief Bodies put to sleep by the last update, sorted by id */
    const std::vector<Boxigon::BodyId>& sleptBodies() const { return slept; }

    /** @brief Number of islands built by the last update */
    std::size_t islandCount() const { return islands; }

    /** @brief Next island index to hand out (persisted with scenes) */
    std::uint64_t nextIslandIndex() const { return nextIsland; }
    void setNextIslandIndex(std::uint64_t index) { nextIsland = index; }

private:
    std::vector<Connection> connections;
    std::vector<Boxigon::BodyId> slept;
    std::size_t islands = 0;
    std::uint64_t nextIsland = 1;
};

} // namespace Systems

#endif

/**
 * @file i_system.hpp
 * @brief Interface for the ECS systems driven by the World step
 */

#pragma once

#include <entt/entt.hpp>
#include "boxigon/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system receives the shared SystemConfig (time step, gravity) and
 * operates on the registry in update().
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Base for systems with their own configuration struct
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems

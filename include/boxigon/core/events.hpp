/**
 * @file events.hpp
 * @brief Transition events reported by World::step
 *
 * Events are collected during a step and delivered at its end, in phase
 * order (woke, began, ended, broken, slept) and sorted by id within a phase.
 * Subscribers connect through World::onEvent<T>(); the same events are also
 * kept as a flat log in World::events() until the next step.
 */

#pragma once

#include "boxigon/core/types.hpp"

namespace Boxigon {

struct BodyWoke {
    BodyId body;
};

struct CollisionBegan {
    BodyId a;  ///< Lower id
    BodyId b;
};

struct CollisionEnded {
    BodyId a;  ///< Lower id
    BodyId b;
};

struct JointBroken {
    JointId joint;
    BodyId a;
    BodyId b;  ///< NullBody for world-anchored joints
};

struct BodySlept {
    BodyId body;
};

enum class EventType {
    BodyWoke,
    CollisionBegan,
    CollisionEnded,
    JointBroken,
    BodySlept
};

const char* toString(EventType type);

/**
 * @brief Flat record of any event (body ids unused by a type stay NullBody)
 */
struct WorldEvent {
    EventType type = EventType::BodyWoke;
    BodyId bodyA = NullBody;
    BodyId bodyB = NullBody;
    JointId joint = 0;
};

} // namespace Boxigon

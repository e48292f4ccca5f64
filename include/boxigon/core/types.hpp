/**
 * @file types.hpp
 * @brief Identifier and enumeration types shared by the public API and the systems
 */

#pragma once

#include <cstdint>

namespace Boxigon {

/// Stable body handle. Never reused within one World; 0 is never issued.
using BodyId = std::uint32_t;

/// Stable handle of a shape attached to a body. Never reused within one World.
using ShapeId = std::uint32_t;

/// Stable joint handle. Never reused within one World.
using JointId = std::uint32_t;

constexpr BodyId NullBody = 0;

/**
 * @brief How a body participates in the simulation
 */
enum class BodyKind {
    Static,     ///< Never moves, infinite mass
    Kinematic,  ///< Moves with its prescribed velocity, infinite mass
    Dynamic     ///< Driven by forces and contacts
};

const char* toString(BodyKind kind);

} // namespace Boxigon

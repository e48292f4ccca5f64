#pragma once

#include "boxigon/math/vector_math.hpp"

/**
 * @struct SystemConfig
 * @brief Per-step parameters shared by every system.
 *
 * The World refreshes this before each step.
 */
struct SystemConfig {
    double timeStep = 1.0 / 60.0;   ///< Seconds advanced by the current step
    Vector gravity{0.0, -9.8};      ///< World gravity (m/s^2)
};

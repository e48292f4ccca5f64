/**
 * @file aabb.hpp
 * @brief Axis-aligned bounding box used by the broad-phase and the queries
 */

#pragma once

#include <algorithm>

#include "boxigon/math/vector_math.hpp"

struct AABB {
    Vector lower;  ///< Minimum corner
    Vector upper;  ///< Maximum corner

    AABB() = default;
    AABB(const Vector& lo, const Vector& hi) : lower(lo), upper(hi) {}

    bool overlaps(const AABB& other) const {
        return !(other.lower.x > upper.x || other.upper.x < lower.x ||
                 other.lower.y > upper.y || other.upper.y < lower.y);
    }

    /** @brief Grows the box to also enclose @p other */
    void merge(const AABB& other) {
        lower.x = std::min(lower.x, other.lower.x);
        lower.y = std::min(lower.y, other.lower.y);
        upper.x = std::max(upper.x, other.upper.x);
        upper.y = std::max(upper.y, other.upper.y);
    }

    /** @brief Copy expanded by @p margin on every side */
    AABB fattened(double margin) const {
        return {Vector(lower.x - margin, lower.y - margin),
                Vector(upper.x + margin, upper.y + margin)};
    }
};
